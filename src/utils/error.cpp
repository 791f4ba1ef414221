#include "polygraph/error.hpp"
#include <sstream>

namespace polygraph {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";
        case ErrorCode::NotImplemented: return "Not implemented";

        case ErrorCode::NodeNotFound: return "Node not found";
        case ErrorCode::RelationNotFound: return "Relation not found";
        case ErrorCode::AttributeNotFound: return "Attribute not found";
        case ErrorCode::MorphNotFound: return "Morph not found";
        case ErrorCode::MissingEndpoint: return "Missing relation endpoint";
        case ErrorCode::MissingSource: return "Missing attribute source";
        case ErrorCode::InvalidName: return "Invalid name";
        case ErrorCode::ExpressionInvalid: return "Invalid expression";

        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";
        case ErrorCode::CryptoSignatureFailed: return "Signature failed";
        case ErrorCode::CryptoVerificationFailed: return "Verification failed";
        case ErrorCode::InvalidPublicKey: return "Invalid public key";
        case ErrorCode::InvalidSecretKey: return "Invalid secret key";

        case ErrorCode::NetworkConnectionFailed: return "Connection failed";
        case ErrorCode::NetworkTimeout: return "Network timeout";
        case ErrorCode::NetworkDisconnected: return "Disconnected";
        case ErrorCode::NetworkInvalidMessage: return "Invalid network message";
        case ErrorCode::NetworkPeerNotFound: return "Peer not found";
        case ErrorCode::NetworkHandshakeFailed: return "Handshake failed";

        case ErrorCode::StorageNotFound: return "Not found in storage";
        case ErrorCode::StorageReadFailed: return "Storage read failed";
        case ErrorCode::StorageWriteFailed: return "Storage write failed";
        case ErrorCode::StorageCorrupted: return "Storage corrupted";
        case ErrorCode::StorageReadOnly: return "Storage is read-only";

        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::DeserializationFailed: return "Deserialization failed";
        case ErrorCode::InvalidFormat: return "Invalid format";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace polygraph
