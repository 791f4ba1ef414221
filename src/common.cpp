#include "polygraph/common.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>

namespace polygraph {

// Utility functions
std::string bytes_to_hex(const byte* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

bool hex_to_bytes(const std::string& hex, byte* out, size_t out_len) {
    if (hex.length() != out_len * 2) return false;

    for (size_t i = 0; i < out_len; ++i) {
        char hi = hex[i * 2];
        char lo = hex[i * 2 + 1];
        if (!std::isxdigit(static_cast<unsigned char>(hi)) ||
            !std::isxdigit(static_cast<unsigned char>(lo))) {
            return false;
        }
        out[i] = static_cast<byte>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
    return true;
}

std::string hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

Hash256 hex_to_hash(const std::string& hex) {
    Hash256 hash;
    if (!hex_to_bytes(hex, hash.data(), hash.size())) {
        throw std::runtime_error("Invalid hex string: " + hex);
    }
    return hash;
}

} // namespace polygraph
