#include "blake3.hpp"
#include <blake3.h>

namespace polygraph::crypto {

Hash256 Blake3::hash(const bytes& data) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Hash256 Blake3::hash(const std::string& str) {
    bytes data(str.begin(), str.end());
    return hash(data);
}

Hash256 Blake3::keyed_hash(const Hash256& key, const bytes& data) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init_keyed(&hasher, key.data());
    blake3_hasher_update(&hasher, data.data(), data.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

std::string Blake3::short_hex(const std::string& str, size_t hex_chars) {
    return hash_to_hex(hash(str)).substr(0, hex_chars);
}

std::string Blake3::hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

std::optional<Hash256> Blake3::hash_from_hex(const std::string& hex) {
    Hash256 hash;
    if (!hex_to_bytes(hex, hash.data(), hash.size())) {
        return std::nullopt;
    }
    return hash;
}

} // namespace polygraph::crypto
