#pragma once

#include "polygraph/common.hpp"
#include <string>
#include <optional>
#include <utility>

namespace polygraph::crypto {

/**
 * Ed25519 digital signature wrapper
 * Signs and verifies append-log entries using libsodium
 */
class Ed25519 {
public:
    /**
     * Generate a new Ed25519 keypair
     * @return pair of (public_key, secret_key)
     */
    static std::pair<PublicKey, SecretKey> generate_keypair();

    /**
     * Sign a message with a secret key
     */
    static Signature sign(const bytes& message, const SecretKey& secret_key);

    /**
     * Verify a detached signature
     * @return true if signature is valid
     */
    static bool verify(const bytes& message, const Signature& signature, const PublicKey& public_key);

    /**
     * Derive public key from secret key
     */
    static PublicKey secret_to_public(const SecretKey& secret_key);

    static std::string public_key_to_hex(const PublicKey& key);
    static std::optional<PublicKey> public_key_from_hex(const std::string& hex);
};

} // namespace polygraph::crypto
