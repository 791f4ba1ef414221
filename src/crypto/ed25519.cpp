#include "ed25519.hpp"
#include "polygraph/error.hpp"
#include <sodium.h>

namespace polygraph::crypto {

namespace {
    // Ensure libsodium is initialized
    void ensure_sodium() {
        static const bool initialized = [] {
            if (sodium_init() < 0) {
                throw CryptoException(ErrorCode::CryptoInitFailed, "Failed to initialize libsodium");
            }
            return true;
        }();
        POLYGRAPH_UNUSED(initialized);
    }
}

std::pair<PublicKey, SecretKey> Ed25519::generate_keypair() {
    ensure_sodium();
    PublicKey pk;
    SecretKey sk;

    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "Failed to generate Ed25519 keypair");
    }

    return {pk, sk};
}

Signature Ed25519::sign(const bytes& message, const SecretKey& secret_key) {
    ensure_sodium();
    Signature sig;
    unsigned long long sig_len;

    if (crypto_sign_detached(
        sig.data(),
        &sig_len,
        message.data(),
        message.size(),
        secret_key.data()
    ) != 0) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "Failed to sign message");
    }

    return sig;
}

bool Ed25519::verify(const bytes& message, const Signature& signature, const PublicKey& public_key) {
    ensure_sodium();
    return crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    ) == 0;
}

PublicKey Ed25519::secret_to_public(const SecretKey& secret_key) {
    ensure_sodium();
    PublicKey pk;
    if (crypto_sign_ed25519_sk_to_pk(pk.data(), secret_key.data()) != 0) {
        throw CryptoException(ErrorCode::InvalidSecretKey, "Failed to derive public key from secret key");
    }
    return pk;
}

std::string Ed25519::public_key_to_hex(const PublicKey& key) {
    return to_hex(key);
}

std::optional<PublicKey> Ed25519::public_key_from_hex(const std::string& hex) {
    return from_hex<32>(hex);
}

} // namespace polygraph::crypto
