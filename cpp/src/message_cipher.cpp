/**
 * @file message_cipher.cpp
 * @brief Implementation of ChaCha20-Poly1305 message encryption
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/message_cipher.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"

#include <array>
#include <cctype>
#include <sodium.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace secretchat {

static_assert(security::NONCE_SIZE == crypto_aead_chacha20poly1305_ietf_NPUBBYTES, "nonce size");
static_assert(security::TAG_SIZE == crypto_aead_chacha20poly1305_ietf_ABYTES, "tag size");

namespace {

const char* const URI_PREFIXES[] = {"http://", "https://", "data:", "blob:", "file://"};

// Smallest payload: nonce + tag over an empty plaintext, base64 encoded
constexpr size_t MIN_PAYLOAD_BYTES = security::NONCE_SIZE + security::TAG_SIZE;
constexpr size_t MIN_PAYLOAD_CHARS = (MIN_PAYLOAD_BYTES + 2) / 3 * 4;

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // namespace

const char* to_string(DisplayStatus status) {
    switch (status) {
        case DisplayStatus::DECRYPTED:     return "DECRYPTED";
        case DisplayStatus::PASS_THROUGH:  return "PASS_THROUGH";
        case DisplayStatus::UNDECRYPTABLE: return "UNDECRYPTABLE";
        default:                           return "UNKNOWN";
    }
}

MessageCipher::MessageCipher()
    : random_source_(default_random_source())
{
}

MessageCipher::MessageCipher(std::shared_ptr<RandomSource> random_source)
    : random_source_(std::move(random_source))
{
    if (!random_source_) {
        throw std::invalid_argument("MessageCipher requires a random source");
    }
}

// ============================================================================
// Encryption (ChaCha20-Poly1305 AEAD)
// ============================================================================

Result<std::string> MessageCipher::encrypt(const SharedSecret& shared_secret,
                                           const std::string& plaintext) const {
    return encrypt_raw(shared_secret.data(), shared_secret.size(), plaintext);
}

Result<std::string> MessageCipher::decrypt(const SharedSecret& shared_secret,
                                           const std::string& wire_payload) const {
    return decrypt_raw(shared_secret.data(), shared_secret.size(), wire_payload);
}

Result<std::string> MessageCipher::encrypt_raw(const uint8_t* key, size_t key_size,
                                               const std::string& plaintext) const {
    if (key == nullptr || key_size != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
        return Result<std::string>::fail(SecretError::INVALID_KEY_LENGTH,
            "expected a " + std::to_string(crypto_aead_chacha20poly1305_ietf_KEYBYTES) +
            "-byte key, got " + std::to_string(key_size));
    }

    if (plaintext.size() > security::MAX_MESSAGE_SIZE) {
        return Result<std::string>::fail(SecretError::MESSAGE_TOO_LARGE,
            "plaintext exceeds " + std::to_string(security::MAX_MESSAGE_SIZE) + " bytes");
    }

    // nonce || ciphertext || tag
    std::vector<uint8_t> payload(security::NONCE_SIZE + plaintext.size() + security::TAG_SIZE);

    if (!random_source_->fill(payload.data(), security::NONCE_SIZE)) {
        utilities::log_critical("MessageCipher: secure random source unavailable for nonce");
        return Result<std::string>::fail(SecretError::ENTROPY_UNAVAILABLE,
                                         "secure random source unavailable");
    }

    unsigned long long ciphertext_len = 0;

    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        payload.data() + security::NONCE_SIZE,
        &ciphertext_len,
        reinterpret_cast<const unsigned char*>(plaintext.data()),
        plaintext.size(),
        nullptr,  // No additional data
        0,
        nullptr,  // No secret nonce
        payload.data(),
        key
    );

    if (result != 0) {
        return Result<std::string>::fail(SecretError::DECRYPTION_FAILED, "encryption failed");
    }

    payload.resize(security::NONCE_SIZE + ciphertext_len);
    return Result<std::string>::ok(SecretCrypto::bytes_to_base64(payload.data(), payload.size()));
}

Result<std::string> MessageCipher::decrypt_raw(const uint8_t* key, size_t key_size,
                                               const std::string& wire_payload) const {
    if (key == nullptr || key_size != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
        return Result<std::string>::fail(SecretError::INVALID_KEY_LENGTH,
            "expected a " + std::to_string(crypto_aead_chacha20poly1305_ietf_KEYBYTES) +
            "-byte key, got " + std::to_string(key_size));
    }

    auto payload = SecretCrypto::base64_to_bytes(wire_payload);
    if (!payload) {
        return Result<std::string>::fail(SecretError::DECRYPTION_FAILED, "payload is not base64");
    }

    // Payload must hold at least the nonce and the authentication tag
    if (payload->size() < MIN_PAYLOAD_BYTES) {
        return Result<std::string>::fail(SecretError::DECRYPTION_FAILED, "payload too short");
    }

    const uint8_t* nonce = payload->data();
    const uint8_t* ciphertext = payload->data() + security::NONCE_SIZE;
    size_t ciphertext_size = payload->size() - security::NONCE_SIZE;

    std::string plaintext(ciphertext_size - security::TAG_SIZE, '\0');
    unsigned long long plaintext_len = 0;

    // Fails if the authentication tag doesn't match (tampering detected)
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        plaintext.empty() ? nullptr : reinterpret_cast<unsigned char*>(&plaintext[0]),
        &plaintext_len,
        nullptr,  // No secret nonce
        ciphertext,
        ciphertext_size,
        nullptr,  // No additional data
        0,
        nonce,
        key
    );

    if (result != 0) {
        SecretCrypto::secure_zero(plaintext);
        return Result<std::string>::fail(SecretError::DECRYPTION_FAILED,
                                         "authentication tag mismatch");
    }

    plaintext.resize(plaintext_len);
    return Result<std::string>::ok(std::move(plaintext));
}

// ============================================================================
// Display
// ============================================================================

DisplayContent MessageCipher::open_for_display(const SharedSecret& shared_secret,
                                               const std::string& content) const {
    if (!is_ciphertext_candidate(content)) {
        return DisplayContent{content, DisplayStatus::PASS_THROUGH};
    }

    auto plaintext = decrypt(shared_secret, content);
    if (!plaintext) {
        utilities::log_debug(std::string("MessageCipher: undecryptable message (") +
                             to_string(plaintext.error()) + ")");
        return DisplayContent{security::UNDECRYPTABLE_PLACEHOLDER, DisplayStatus::UNDECRYPTABLE};
    }

    return DisplayContent{std::move(plaintext).value(), DisplayStatus::DECRYPTED};
}

bool MessageCipher::is_uri(const std::string& content) {
    std::string lower = utilities::to_lowercase(content.substr(0, 8));
    for (const char* prefix : URI_PREFIXES) {
        if (utilities::starts_with(lower, prefix)) {
            return true;
        }
    }
    return false;
}

bool MessageCipher::is_ciphertext_candidate(const std::string& content) {
    if (content.size() < MIN_PAYLOAD_CHARS || content.size() % 4 != 0) {
        return false;
    }
    if (is_uri(content)) {
        return false;
    }

    size_t body_end = content.size();
    while (body_end > content.size() - 2 && content[body_end - 1] == '=') {
        --body_end;
    }

    for (size_t i = 0; i < body_end; ++i) {
        if (!is_base64_char(content[i])) {
            return false;
        }
    }

    return true;
}

} // namespace secretchat
