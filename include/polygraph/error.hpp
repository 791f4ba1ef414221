#pragma once

#include "polygraph/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace polygraph {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    OutOfRange,
    NotImplemented,

    // Graph errors
    NodeNotFound,
    RelationNotFound,
    AttributeNotFound,
    MorphNotFound,
    MissingEndpoint,
    MissingSource,
    InvalidName,
    ExpressionInvalid,

    // Cryptography errors
    CryptoInitFailed,
    CryptoSignatureFailed,
    CryptoVerificationFailed,
    InvalidPublicKey,
    InvalidSecretKey,

    // Network errors
    NetworkConnectionFailed,
    NetworkTimeout,
    NetworkDisconnected,
    NetworkInvalidMessage,
    NetworkPeerNotFound,
    NetworkHandshakeFailed,

    // Storage errors
    StorageNotFound,
    StorageReadFailed,
    StorageWriteFailed,
    StorageCorrupted,
    StorageReadOnly,

    // Serialization errors
    SerializationFailed,
    DeserializationFailed,
    InvalidFormat
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling (similar to Rust's Result<T, E>)
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    // Check if result contains a value
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Convert to optional
    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Custom exception classes
class PolygraphException : public std::runtime_error {
public:
    PolygraphException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class GraphException : public PolygraphException {
public:
    GraphException(ErrorCode code, const std::string& message)
        : PolygraphException(code, "Graph error: " + message) {}
};

// Referenced node (or relation, attribute, morph) does not exist
class NotFoundError : public GraphException {
public:
    explicit NotFoundError(const std::string& message, ErrorCode code = ErrorCode::NodeNotFound)
        : GraphException(code, message) {}
};

// Relation creation references one or both nonexistent nodes
class MissingEndpointError : public GraphException {
public:
    explicit MissingEndpointError(const std::string& message)
        : GraphException(ErrorCode::MissingEndpoint, message) {}
};

// Attribute creation references a nonexistent source node
class MissingSourceError : public GraphException {
public:
    explicit MissingSourceError(const std::string& message)
        : GraphException(ErrorCode::MissingSource, message) {}
};

class InvalidNameError : public GraphException {
public:
    explicit InvalidNameError(const std::string& message)
        : GraphException(ErrorCode::InvalidName, message) {}
};

class ExpressionError : public GraphException {
public:
    explicit ExpressionError(const std::string& message)
        : GraphException(ErrorCode::ExpressionInvalid, message) {}
};

class CryptoException : public PolygraphException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : PolygraphException(code, "Crypto error: " + message) {}
};

class NetworkException : public PolygraphException {
public:
    NetworkException(ErrorCode code, const std::string& message)
        : PolygraphException(code, "Network error: " + message) {}

    explicit NetworkException(const Error& error)
        : PolygraphException(error.code(), "Network error: " + error.to_string()) {}
};

class StorageException : public PolygraphException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : PolygraphException(code, "Storage error: " + message) {}
};

// Utility macros for error handling
#define POLYGRAPH_TRY(expr) \
    do { \
        auto __result = (expr); \
        if (__result.is_err()) { \
            return decltype(__result)::Err(__result.error()); \
        } \
    } while (0)

} // namespace polygraph
