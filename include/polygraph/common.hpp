#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// Polygraph Framework Version
#define POLYGRAPH_VERSION_MAJOR 0
#define POLYGRAPH_VERSION_MINOR 1
#define POLYGRAPH_VERSION_PATCH 0
#define POLYGRAPH_VERSION_STRING "0.1.0"

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef POLYGRAPH_PLATFORM_WINDOWS
        #define POLYGRAPH_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef POLYGRAPH_PLATFORM_LINUX
        #define POLYGRAPH_PLATFORM_LINUX
    #endif
#elif defined(__APPLE__)
    #ifndef POLYGRAPH_PLATFORM_MACOS
        #define POLYGRAPH_PLATFORM_MACOS
    #endif
#endif

// Utility macros
#define POLYGRAPH_UNUSED(x) (void)(x)
#define POLYGRAPH_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define POLYGRAPH_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define POLYGRAPH_DISALLOW_COPY_AND_MOVE(TypeName) \
    POLYGRAPH_DISALLOW_COPY(TypeName); \
    POLYGRAPH_DISALLOW_MOVE(TypeName)

// Constants
namespace polygraph {
namespace constants {

// Key namespaces of the graph store
constexpr const char* NODES_PREFIX = "nodes";
constexpr const char* RELATIONS_PREFIX = "relations";
constexpr const char* ATTRIBUTES_PREFIX = "attributes";

// Model constants
constexpr const char* BASIC_MORPH_NAME = "basic";
constexpr const char* DEFAULT_ROLE = "individual";
constexpr size_t ATTRIBUTE_VALUE_HASH_CHARS = 16;

// Network constants
constexpr uint16_t DEFAULT_PORT = 7878;
constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024; // 16 MB
constexpr size_t MAX_ENTRIES_PER_DATA_MESSAGE = 256;
constexpr uint32_t DEFAULT_JOIN_TIMEOUT_MS = 10000;
constexpr uint32_t DEFAULT_SYNC_TIMEOUT_MS = 10000;

// Cryptography constants
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;  // libsodium: 32-byte seed + 32-byte public key
constexpr size_t ED25519_SIGNATURE_SIZE = 64;
constexpr size_t BLAKE3_HASH_SIZE = 32;
constexpr const char* DISCOVERY_NAMESPACE = "polygraph-discovery";

} // namespace constants
} // namespace polygraph

// Core types
namespace polygraph {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

// Cryptographic types
template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;
using PublicKey = fixed_bytes<32>;
using SecretKey = fixed_bytes<64>;  // Ed25519 secret key is 64 bytes in libsodium
using Signature = fixed_bytes<64>;

// Topic a swarm announces or looks up; derived from a log's public key
using DiscoveryKey = Hash256;

// Utility functions
std::string hash_to_hex(const Hash256& hash);
Hash256 hex_to_hash(const std::string& hex);

std::string bytes_to_hex(const byte* data, size_t len);
bool hex_to_bytes(const std::string& hex, byte* out, size_t out_len);

template<size_t N>
std::string to_hex(const fixed_bytes<N>& value) {
    return bytes_to_hex(value.data(), value.size());
}

template<size_t N>
std::optional<fixed_bytes<N>> from_hex(const std::string& hex) {
    fixed_bytes<N> value{};
    if (!hex_to_bytes(hex, value.data(), value.size())) {
        return std::nullopt;
    }
    return value;
}

} // namespace polygraph

// Hash support for std::unordered_map
namespace std {
template<>
struct hash<polygraph::Hash256> {
    size_t operator()(const polygraph::Hash256& h) const noexcept {
        // Hash first 8 bytes
        size_t result = 0;
        for (size_t i = 0; i < 8 && i < h.size(); ++i) {
            result = (result << 8) | h[i];
        }
        return result;
    }
};
} // namespace std
