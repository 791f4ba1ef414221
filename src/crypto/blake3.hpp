#pragma once

#include "polygraph/common.hpp"
#include <optional>

namespace polygraph::crypto {

/**
 * BLAKE3 cryptographic hash function wrapper
 */
class Blake3 {
public:
    /**
     * Hash data using BLAKE3
     * @param data The data to hash
     * @return 32-byte hash
     */
    static Hash256 hash(const bytes& data);

    /**
     * Hash a string using BLAKE3
     */
    static Hash256 hash(const std::string& str);

    /**
     * Keyed BLAKE3 (MAC mode)
     * @param key 32-byte key
     * @param data The data to hash
     */
    static Hash256 keyed_hash(const Hash256& key, const bytes& data);

    /**
     * First `hex_chars` hex digits of the hash of a string
     */
    static std::string short_hex(const std::string& str, size_t hex_chars);

    /**
     * Convert hash to hex string
     */
    static std::string hash_to_hex(const Hash256& hash);

    /**
     * Parse hash from hex string
     */
    static std::optional<Hash256> hash_from_hex(const std::string& hex);
};

} // namespace polygraph::crypto
