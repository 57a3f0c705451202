/**
 * @file message_cipher.hpp
 * @brief Authenticated encryption of secret conversation messages
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Wire payload: base64(nonce(12) || ciphertext || tag(16)), standard padded
 * alphabet. ChaCha20-Poly1305 IETF with a 256-bit key and a fresh random
 * nonce per message.
 */

#pragma once

#include "secretchat/key_material.hpp"
#include "secretchat/result.hpp"
#include "secretchat/secret_crypto.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace secretchat {

/**
 * @brief How a stored message body should be presented
 */
enum class DisplayStatus {
    DECRYPTED,      ///< Ciphertext verified and decrypted
    PASS_THROUGH,   ///< Not an encrypted payload (URI, plain text); shown as-is
    UNDECRYPTABLE   ///< Looked like ciphertext but failed to verify
};

/**
 * @brief Text to render plus how it was obtained
 */
struct DisplayContent {
    std::string text;
    DisplayStatus status;
};

/**
 * @brief Convert DisplayStatus to string
 */
const char* to_string(DisplayStatus status);

/**
 * @brief MessageCipher - AEAD encrypt/decrypt of message content
 */
class MessageCipher {
public:
    /**
     * @brief Cipher drawing nonces from libsodium randombytes
     */
    MessageCipher();

    /**
     * @brief Cipher drawing nonces from an injected source
     */
    explicit MessageCipher(std::shared_ptr<RandomSource> random_source);

    /**
     * @brief Encrypt plaintext under the conversation key
     * @param shared_secret Derived 32-byte key
     * @param plaintext Message text (at most MAX_MESSAGE_SIZE bytes)
     * @return base64(nonce || ciphertext || tag)
     */
    Result<std::string> encrypt(const SharedSecret& shared_secret, const std::string& plaintext) const;

    /**
     * @brief Verify and decrypt a wire payload
     * @return Plaintext, or DecryptionFailed (wrong key, corruption, tampering)
     */
    Result<std::string> decrypt(const SharedSecret& shared_secret, const std::string& wire_payload) const;

    /**
     * @brief Encrypt with a raw key buffer
     * @return InvalidKeyLength unless key_size is exactly 32
     */
    Result<std::string> encrypt_raw(const uint8_t* key, size_t key_size, const std::string& plaintext) const;

    /**
     * @brief Decrypt with a raw key buffer
     * @return InvalidKeyLength unless key_size is exactly 32
     */
    Result<std::string> decrypt_raw(const uint8_t* key, size_t key_size, const std::string& wire_payload) const;

    /**
     * @brief Decrypt for rendering; never throws
     *
     * URIs and text that is structurally not a payload pass through
     * unchanged. A payload that fails verification is replaced with
     * UNDECRYPTABLE_PLACEHOLDER.
     */
    DisplayContent open_for_display(const SharedSecret& shared_secret, const std::string& content) const;

    /**
     * @brief Whether content is a URI placed in the message body (attachments)
     */
    static bool is_uri(const std::string& content);

    /**
     * @brief Cheap structural check for a wire payload
     *
     * Base64 alphabet only, length a multiple of 4, decoded size at least
     * nonce + tag, and not a URI.
     */
    static bool is_ciphertext_candidate(const std::string& content);

private:
    std::shared_ptr<RandomSource> random_source_;
};

} // namespace secretchat
