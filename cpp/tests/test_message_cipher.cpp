/**
 * @file test_message_cipher.cpp
 * @brief Unit tests for MessageCipher
 *
 * Tests:
 * - Encrypt/decrypt and wire payload layout
 * - Tamper detection for every single-bit flip
 * - Nonce uniqueness
 * - Key length precondition and size limit
 * - Display classification (pass-through vs undecryptable)
 */

#include <gtest/gtest.h>
#include "secretchat/message_cipher.hpp"
#include "secretchat/secure_config.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace secretchat;

namespace {

class FailingRandomSource : public RandomSource {
public:
    bool fill(uint8_t*, size_t) override { return false; }
};

SharedSecret make_secret(uint8_t seed) {
    std::vector<uint8_t> bytes(SharedSecret::SIZE);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(seed + i * 13);
    }
    return *SharedSecret::from_bytes(bytes.data(), bytes.size());
}

} // namespace

class MessageCipherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecretCrypto::initialize());
        secret_ = make_secret(1);
        other_secret_ = make_secret(2);
    }

    std::string encrypt(const std::string& plaintext) {
        auto payload = cipher_.encrypt(secret_, plaintext);
        EXPECT_TRUE(payload.is_ok()) << payload.message();
        return payload.value_or("");
    }

    MessageCipher cipher_;
    SharedSecret secret_;
    SharedSecret other_secret_;
};

// ============================================================================
// Encryption / Decryption
// ============================================================================

TEST_F(MessageCipherTest, EncryptDecrypt) {
    std::string plaintext = "Meet at the usual place, 7pm.";

    std::string payload = encrypt(plaintext);
    EXPECT_NE(payload, plaintext);

    auto decrypted = cipher_.decrypt(secret_, payload);
    ASSERT_TRUE(decrypted.is_ok()) << decrypted.message();
    EXPECT_EQ(*decrypted, plaintext);
}

TEST_F(MessageCipherTest, EmptyAndUnicodePlaintext) {
    for (const std::string& plaintext : {std::string(""), std::string("Xin chào 👋 ünïcødé")}) {
        auto decrypted = cipher_.decrypt(secret_, encrypt(plaintext));
        ASSERT_TRUE(decrypted.is_ok());
        EXPECT_EQ(*decrypted, plaintext);
    }
}

TEST_F(MessageCipherTest, PayloadLayout) {
    std::string plaintext = "twelve bytes";
    std::string payload = encrypt(plaintext);

    auto raw = SecretCrypto::base64_to_bytes(payload);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->size(), security::NONCE_SIZE + plaintext.size() + security::TAG_SIZE);
    EXPECT_EQ(payload.size() % 4, 0u);
    EXPECT_TRUE(MessageCipher::is_ciphertext_candidate(payload));
}

TEST_F(MessageCipherTest, SamePlaintextEncryptsDifferently) {
    EXPECT_NE(encrypt("hello"), encrypt("hello"));
}

TEST_F(MessageCipherTest, WrongKeyFails) {
    std::string payload = encrypt("for your eyes only");

    auto decrypted = cipher_.decrypt(other_secret_, payload);
    ASSERT_FALSE(decrypted.is_ok());
    EXPECT_EQ(decrypted.error(), SecretError::DECRYPTION_FAILED);
}

TEST_F(MessageCipherTest, EverySingleBitFlipDetected) {
    std::string payload = encrypt("hello secret world");
    auto raw = SecretCrypto::base64_to_bytes(payload);
    ASSERT_TRUE(raw.has_value());

    for (size_t byte = 0; byte < raw->size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<uint8_t> tampered = *raw;
            tampered[byte] ^= static_cast<uint8_t>(1u << bit);

            std::string tampered_payload = SecretCrypto::bytes_to_base64(tampered.data(), tampered.size());
            auto decrypted = cipher_.decrypt(secret_, tampered_payload);

            ASSERT_FALSE(decrypted.is_ok()) << "byte " << byte << " bit " << bit;
            EXPECT_EQ(decrypted.error(), SecretError::DECRYPTION_FAILED);
        }
    }
}

TEST_F(MessageCipherTest, TruncatedPayloadFails) {
    std::string payload = encrypt("truncate me");
    auto raw = SecretCrypto::base64_to_bytes(payload);
    ASSERT_TRUE(raw.has_value());

    raw->resize(security::NONCE_SIZE + security::TAG_SIZE - 1);
    auto decrypted = cipher_.decrypt(secret_, SecretCrypto::bytes_to_base64(raw->data(), raw->size()));
    ASSERT_FALSE(decrypted.is_ok());
    EXPECT_EQ(decrypted.error(), SecretError::DECRYPTION_FAILED);
}

TEST_F(MessageCipherTest, MalformedBase64Fails) {
    auto decrypted = cipher_.decrypt(secret_, "this is !!! not base64");
    ASSERT_FALSE(decrypted.is_ok());
    EXPECT_EQ(decrypted.error(), SecretError::DECRYPTION_FAILED);
}

TEST_F(MessageCipherTest, TenThousandDistinctNonces) {
    std::set<std::string> nonces;

    for (int i = 0; i < 10000; ++i) {
        auto raw = SecretCrypto::base64_to_bytes(encrypt("x"));
        ASSERT_TRUE(raw.has_value());
        nonces.insert(std::string(raw->begin(), raw->begin() + security::NONCE_SIZE));
    }

    EXPECT_EQ(nonces.size(), 10000u);
}

// ============================================================================
// Preconditions
// ============================================================================

TEST_F(MessageCipherTest, RawKeyMustBe32Bytes) {
    std::vector<uint8_t> short_key(16, 7);
    std::vector<uint8_t> long_key(33, 7);

    auto encrypted = cipher_.encrypt_raw(short_key.data(), short_key.size(), "hello");
    ASSERT_FALSE(encrypted.is_ok());
    EXPECT_EQ(encrypted.error(), SecretError::INVALID_KEY_LENGTH);

    auto decrypted = cipher_.decrypt_raw(long_key.data(), long_key.size(), encrypt("hello"));
    ASSERT_FALSE(decrypted.is_ok());
    EXPECT_EQ(decrypted.error(), SecretError::INVALID_KEY_LENGTH);

    auto null_key = cipher_.encrypt_raw(nullptr, 32, "hello");
    ASSERT_FALSE(null_key.is_ok());
    EXPECT_EQ(null_key.error(), SecretError::INVALID_KEY_LENGTH);
}

TEST_F(MessageCipherTest, RawKeyInteroperatesWithSharedSecret) {
    auto payload = cipher_.encrypt_raw(secret_.data(), secret_.size(), "raw");
    ASSERT_TRUE(payload.is_ok());

    auto decrypted = cipher_.decrypt(secret_, *payload);
    ASSERT_TRUE(decrypted.is_ok());
    EXPECT_EQ(*decrypted, "raw");
}

TEST_F(MessageCipherTest, OversizedPlaintextRejected) {
    std::string big(security::MAX_MESSAGE_SIZE + 1, 'a');

    auto payload = cipher_.encrypt(secret_, big);
    ASSERT_FALSE(payload.is_ok());
    EXPECT_EQ(payload.error(), SecretError::MESSAGE_TOO_LARGE);
}

TEST_F(MessageCipherTest, NonceEntropyFailureReported) {
    MessageCipher cipher(std::make_shared<FailingRandomSource>());

    auto payload = cipher.encrypt(secret_, "hello");
    ASSERT_FALSE(payload.is_ok());
    EXPECT_EQ(payload.error(), SecretError::ENTROPY_UNAVAILABLE);
}

// ============================================================================
// Display Classification
// ============================================================================

TEST_F(MessageCipherTest, UriDetection) {
    EXPECT_TRUE(MessageCipher::is_uri("https://cdn.example.com/a.png"));
    EXPECT_TRUE(MessageCipher::is_uri("HTTP://EXAMPLE.COM"));
    EXPECT_TRUE(MessageCipher::is_uri("data:image/png;base64,AAAA"));
    EXPECT_TRUE(MessageCipher::is_uri("blob:https://app/1234"));
    EXPECT_TRUE(MessageCipher::is_uri("file:///tmp/x"));
    EXPECT_FALSE(MessageCipher::is_uri("hello"));
    EXPECT_FALSE(MessageCipher::is_uri(""));
}

TEST_F(MessageCipherTest, CiphertextCandidate) {
    EXPECT_TRUE(MessageCipher::is_ciphertext_candidate(encrypt("")));
    EXPECT_FALSE(MessageCipher::is_ciphertext_candidate(""));
    EXPECT_FALSE(MessageCipher::is_ciphertext_candidate("hello there"));
    EXPECT_FALSE(MessageCipher::is_ciphertext_candidate("YWJj"));
    EXPECT_FALSE(MessageCipher::is_ciphertext_candidate(std::string(40, 'A') + "!"));
    EXPECT_FALSE(MessageCipher::is_ciphertext_candidate("https://cdn.example.com/images/photo-1.png"));
}

TEST_F(MessageCipherTest, DisplayDecrypted) {
    DisplayContent content = cipher_.open_for_display(secret_, encrypt("visible"));

    EXPECT_EQ(content.status, DisplayStatus::DECRYPTED);
    EXPECT_EQ(content.text, "visible");
}

TEST_F(MessageCipherTest, DisplayPassesUriThrough) {
    std::string url = "https://cdn.example.com/uploads/2025/photo.png";
    DisplayContent content = cipher_.open_for_display(secret_, url);

    EXPECT_EQ(content.status, DisplayStatus::PASS_THROUGH);
    EXPECT_EQ(content.text, url);
}

TEST_F(MessageCipherTest, DisplayPassesPlainTextThrough) {
    DisplayContent content = cipher_.open_for_display(secret_, "sent before encryption was on");

    EXPECT_EQ(content.status, DisplayStatus::PASS_THROUGH);
    EXPECT_EQ(content.text, "sent before encryption was on");
}

TEST_F(MessageCipherTest, DisplayUndecryptablePlaceholder) {
    DisplayContent content = cipher_.open_for_display(other_secret_, encrypt("hidden"));

    EXPECT_EQ(content.status, DisplayStatus::UNDECRYPTABLE);
    EXPECT_EQ(content.text, security::UNDECRYPTABLE_PLACEHOLDER);
}
