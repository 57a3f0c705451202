/**
 * @file secret_crypto.hpp
 * @brief libsodium runtime, randomness and encoding primitives
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Shared low-level helpers for the key, derivation and cipher components.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace secretchat {

/**
 * @brief Source of cryptographically secure random bytes
 *
 * Injected into KeyPairService and MessageCipher so that a platform without
 * usable entropy is reported instead of silently producing weak keys.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Fill buffer with random bytes
     * @param buffer Destination
     * @param size Number of bytes
     * @return false if secure randomness is unavailable
     */
    virtual bool fill(uint8_t* buffer, size_t size) = 0;
};

/**
 * @brief RandomSource backed by libsodium randombytes_buf
 */
class SodiumRandomSource : public RandomSource {
public:
    bool fill(uint8_t* buffer, size_t size) override;
};

/**
 * @brief Process-wide default random source (stateless, safe to share)
 */
std::shared_ptr<RandomSource> default_random_source();

/**
 * @brief SecretCrypto - stateless libsodium helpers
 */
class SecretCrypto {
public:
    /**
     * @brief Initialize libsodium (safe to call multiple times)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Constant-time comparison of byte arrays
     * @return true if equal length and equal content
     */
    static bool constant_time_compare(
        const uint8_t* a, size_t a_size,
        const uint8_t* b, size_t b_size
    );

    /**
     * @brief Securely zero memory (not removed by the optimizer)
     */
    static void secure_zero(void* data, size_t size);

    /**
     * @brief Securely zero a string's buffer, then clear it
     */
    static void secure_zero(std::string& text);

    /**
     * @brief Lowercase hexadecimal encoding
     */
    static std::string bytes_to_hex(const uint8_t* data, size_t size);

    /**
     * @brief Decode hexadecimal (either case)
     * @return Decoded bytes, or std::nullopt on odd length or invalid characters
     */
    static std::optional<std::vector<uint8_t>> hex_to_bytes(const std::string& hex);

    /**
     * @brief Standard padded base64 encoding
     */
    static std::string bytes_to_base64(const uint8_t* data, size_t size);

    /**
     * @brief Decode standard padded base64
     * @return Decoded bytes, or std::nullopt if any character is not base64
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);
};

} // namespace secretchat
