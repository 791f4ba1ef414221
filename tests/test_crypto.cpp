#include <gtest/gtest.h>
#include "crypto/ed25519.hpp"
#include "crypto/blake3.hpp"
#include "crypto/random.hpp"
#include "storage/append_log.hpp"

using namespace polygraph;
using namespace polygraph::crypto;

TEST(Ed25519Test, KeypairGeneration) {
    auto [pk, sk] = Ed25519::generate_keypair();
    EXPECT_EQ(pk.size(), 32u);
    EXPECT_EQ(sk.size(), 64u);
    EXPECT_EQ(Ed25519::secret_to_public(sk), pk);
}

TEST(Ed25519Test, SignAndVerify) {
    auto [pk, sk] = Ed25519::generate_keypair();

    bytes message = {'n', 'o', 'd', 'e', 's', '/', 'w', 'a', 't', 'e', 'r'};
    auto signature = Ed25519::sign(message, sk);

    EXPECT_TRUE(Ed25519::verify(message, signature, pk));

    // Tampered message should fail
    message[0] = 'N';
    EXPECT_FALSE(Ed25519::verify(message, signature, pk));

    // Other key should fail
    auto [other_pk, other_sk] = Ed25519::generate_keypair();
    message[0] = 'n';
    EXPECT_FALSE(Ed25519::verify(message, signature, other_pk));
}

TEST(Ed25519Test, HexConversion) {
    auto [pk, sk] = Ed25519::generate_keypair();

    auto hex = Ed25519::public_key_to_hex(pk);
    EXPECT_EQ(hex.size(), 64u);
    auto parsed = Ed25519::public_key_from_hex(hex);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(pk, *parsed);

    EXPECT_FALSE(Ed25519::public_key_from_hex("abcd").has_value());
    EXPECT_FALSE(Ed25519::public_key_from_hex(std::string(64, 'g')).has_value());
}

TEST(Blake3Test, BasicHashing) {
    bytes data = {'t', 'e', 's', 't'};
    auto hash1 = Blake3::hash(data);
    auto hash2 = Blake3::hash(std::string("test"));

    EXPECT_EQ(hash1, hash2);
    EXPECT_EQ(hash1.size(), 32u);
    EXPECT_NE(hash1, Blake3::hash(std::string("test2")));
}

TEST(Blake3Test, KnownVector) {
    // BLAKE3 of the empty input
    EXPECT_EQ(Blake3::hash_to_hex(Blake3::hash(bytes{})),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(Blake3Test, KeyedHashDependsOnKey) {
    bytes data = {1, 2, 3};
    auto k1 = Blake3::hash(std::string("k1"));
    auto k2 = Blake3::hash(std::string("k2"));

    EXPECT_EQ(Blake3::keyed_hash(k1, data), Blake3::keyed_hash(k1, data));
    EXPECT_NE(Blake3::keyed_hash(k1, data), Blake3::keyed_hash(k2, data));
    EXPECT_NE(Blake3::keyed_hash(k1, data), Blake3::hash(data));
}

TEST(Blake3Test, ShortHexIsPrefix) {
    auto full = Blake3::hash_to_hex(Blake3::hash(std::string("H2O")));
    EXPECT_EQ(Blake3::short_hex("H2O", 16), full.substr(0, 16));

    auto parsed = Blake3::hash_from_hex(full);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(Blake3::hash_to_hex(*parsed), full);
    EXPECT_FALSE(Blake3::hash_from_hex("xyz").has_value());
}

TEST(DiscoveryKeyTest, DerivedFromPublicKey) {
    auto [pk, sk] = Ed25519::generate_keypair();
    auto [other, other_sk] = Ed25519::generate_keypair();

    auto key = storage::discovery_key_for(pk);
    EXPECT_EQ(key, storage::discovery_key_for(pk));
    EXPECT_NE(key, storage::discovery_key_for(other));

    // The topic does not reveal the public key
    EXPECT_NE(to_hex(key), to_hex(pk));
    auto ns = Blake3::hash(std::string(constants::DISCOVERY_NAMESPACE));
    EXPECT_EQ(key, Blake3::keyed_hash(ns, bytes(pk.begin(), pk.end())));
}

TEST(RandomTest, GeneratesRequestedSizes) {
    EXPECT_EQ(Random::generate(24).size(), 24u);
    EXPECT_TRUE(Random::generate(0).empty());

    auto a = Random::generate_fixed<16>();
    auto b = Random::generate_fixed<16>();
    EXPECT_NE(a, b);
    EXPECT_NE(Random::generate_uint64(), Random::generate_uint64());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
