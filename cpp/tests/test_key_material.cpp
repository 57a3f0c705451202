/**
 * @file test_key_material.cpp
 * @brief Unit tests for key material types and encoding helpers
 *
 * Tests:
 * - Fixed-length parsing from bytes and hex
 * - Constant-time equality
 * - Hex and base64 encoding edge cases
 */

#include <gtest/gtest.h>
#include "secretchat/key_material.hpp"
#include "secretchat/secret_crypto.hpp"
#include <string>
#include <vector>

using namespace secretchat;

class KeyMaterialTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecretCrypto::initialize());
    }
};

// ============================================================================
// KeyBytes
// ============================================================================

TEST_F(KeyMaterialTest, DefaultConstructedIsZero) {
    PublicKey key;
    EXPECT_TRUE(key.is_zero());
    EXPECT_EQ(key.size(), 32u);
    EXPECT_EQ(key.to_hex(), std::string(64, '0'));
}

TEST_F(KeyMaterialTest, FromBytesRequiresExactLength) {
    std::vector<uint8_t> bytes(32, 0xAB);

    auto key = PrivateKey::from_bytes(bytes.data(), bytes.size());
    ASSERT_TRUE(key.has_value());
    EXPECT_FALSE(key->is_zero());

    EXPECT_FALSE(PrivateKey::from_bytes(bytes.data(), 31).has_value());
    EXPECT_FALSE(PrivateKey::from_bytes(bytes.data(), 16).has_value());
    EXPECT_FALSE(PrivateKey::from_bytes(nullptr, 32).has_value());
}

TEST_F(KeyMaterialTest, HexRoundTripIsLowercase) {
    std::vector<uint8_t> bytes(32);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(i * 7 + 0xA0);
    }

    auto key = PublicKey::from_bytes(bytes.data(), bytes.size());
    ASSERT_TRUE(key.has_value());

    std::string hex = key->to_hex();
    EXPECT_EQ(hex.size(), 64u);
    for (char c : hex) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << hex;
    }

    auto parsed = PublicKey::from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, *key);
}

TEST_F(KeyMaterialTest, FromHexAcceptsUppercase) {
    std::string upper(64, 'F');
    auto key = PublicKey::from_hex(upper);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->to_hex(), std::string(64, 'f'));
}

TEST_F(KeyMaterialTest, FromHexRejectsWrongLengthAndCharacters) {
    EXPECT_FALSE(PublicKey::from_hex("").has_value());
    EXPECT_FALSE(PublicKey::from_hex(std::string(62, 'a')).has_value());
    EXPECT_FALSE(PublicKey::from_hex(std::string(66, 'a')).has_value());
    EXPECT_FALSE(PublicKey::from_hex(std::string(63, 'a') + "g").has_value());
    EXPECT_FALSE(PublicKey::from_hex(std::string(63, 'a') + " ").has_value());
}

TEST_F(KeyMaterialTest, EqualityComparesContent) {
    std::vector<uint8_t> a(32, 1);
    std::vector<uint8_t> b(32, 1);
    b[31] = 2;

    auto key_a = SharedSecret::from_bytes(a.data(), a.size());
    auto key_a2 = SharedSecret::from_bytes(a.data(), a.size());
    auto key_b = SharedSecret::from_bytes(b.data(), b.size());

    EXPECT_TRUE(*key_a == *key_a2);
    EXPECT_TRUE(*key_a != *key_b);
}

TEST_F(KeyMaterialTest, FingerprintIsHexPrefix) {
    std::vector<uint8_t> bytes(32, 0x5C);
    auto key = PublicKey::from_bytes(bytes.data(), bytes.size());
    EXPECT_EQ(fingerprint(*key), "5c5c5c5c");
}

// ============================================================================
// Encoding Helpers
// ============================================================================

TEST_F(KeyMaterialTest, HexToBytesRejectsOddLength) {
    EXPECT_FALSE(SecretCrypto::hex_to_bytes("abc").has_value());
    auto decoded = SecretCrypto::hex_to_bytes("00ff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (std::vector<uint8_t>{0x00, 0xFF}));
}

TEST_F(KeyMaterialTest, Base64UsesStandardPaddedAlphabet) {
    std::vector<uint8_t> data = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(SecretCrypto::bytes_to_base64(data.data(), data.size()), "+/+/");

    std::vector<uint8_t> one = {'a'};
    EXPECT_EQ(SecretCrypto::bytes_to_base64(one.data(), one.size()), "YQ==");
}

TEST_F(KeyMaterialTest, Base64DecodeRejectsInvalidInput) {
    EXPECT_FALSE(SecretCrypto::base64_to_bytes("not base64!").has_value());
    EXPECT_FALSE(SecretCrypto::base64_to_bytes("-_-_").has_value());

    auto decoded = SecretCrypto::base64_to_bytes("YQ==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (std::vector<uint8_t>{'a'}));
}

TEST_F(KeyMaterialTest, ConstantTimeCompare) {
    std::vector<uint8_t> a = {1, 2, 3};
    std::vector<uint8_t> b = {1, 2, 3};
    std::vector<uint8_t> c = {1, 2, 4};

    EXPECT_TRUE(SecretCrypto::constant_time_compare(a.data(), a.size(), b.data(), b.size()));
    EXPECT_FALSE(SecretCrypto::constant_time_compare(a.data(), a.size(), c.data(), c.size()));
    EXPECT_FALSE(SecretCrypto::constant_time_compare(a.data(), a.size(), b.data(), 2));
}

TEST_F(KeyMaterialTest, SecureZeroClearsString) {
    std::string secret = "very secret text";
    SecretCrypto::secure_zero(secret);
    EXPECT_TRUE(secret.empty());
}
