/**
 * @file secret_crypto.cpp
 * @brief Implementation of libsodium runtime, randomness and encodings
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - libsodium: randombytes, sodium_memcmp, sodium_memzero
 * - hex / base64 codecs used by key material and wire payloads
 */

#include "secretchat/secret_crypto.hpp"
#include <sodium.h>

namespace secretchat {

// ============================================================================
// Randomness
// ============================================================================

bool SodiumRandomSource::fill(uint8_t* buffer, size_t size) {
    if (!SecretCrypto::initialize()) {
        return false;
    }
    randombytes_buf(buffer, size);
    return true;
}

std::shared_ptr<RandomSource> default_random_source() {
    static std::shared_ptr<RandomSource> source = std::make_shared<SodiumRandomSource>();
    return source;
}

// ============================================================================
// Initialization
// ============================================================================

bool SecretCrypto::initialize() {
    // sodium_init returns 1 when already initialized
    return sodium_init() >= 0;
}

// ============================================================================
// Memory
// ============================================================================

bool SecretCrypto::constant_time_compare(
    const uint8_t* a, size_t a_size,
    const uint8_t* b, size_t b_size
) {
    if (a_size != b_size) {
        return false;
    }
    if (a_size == 0) {
        return true;
    }
    return sodium_memcmp(a, b, a_size) == 0;
}

void SecretCrypto::secure_zero(void* data, size_t size) {
    sodium_memzero(data, size);
}

void SecretCrypto::secure_zero(std::string& text) {
    if (!text.empty()) {
        sodium_memzero(&text[0], text.size());
    }
    text.clear();
}

// ============================================================================
// Encodings
// ============================================================================

std::string SecretCrypto::bytes_to_hex(const uint8_t* data, size_t size) {
    std::vector<char> hex(size * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), data, size);
    std::string result(hex.data(), size * 2);
    sodium_memzero(hex.data(), hex.size());
    return result;
}

std::optional<std::vector<uint8_t>> SecretCrypto::hex_to_bytes(const std::string& hex) {
    // Hex string must have even length
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(hex.length() / 2);
    size_t decoded_len = 0;

    // With a null end pointer libsodium rejects any unparsed trailing input
    int result = sodium_hex2bin(
        bytes.data(),
        bytes.size(),
        hex.c_str(),
        hex.length(),
        nullptr,
        &decoded_len,
        nullptr
    );

    if (result != 0 || decoded_len != bytes.size()) {
        return std::nullopt;
    }

    return bytes;
}

std::string SecretCrypto::bytes_to_base64(const uint8_t* data, size_t size) {
    size_t base64_len = sodium_base64_encoded_len(size, sodium_base64_VARIANT_ORIGINAL);

    std::vector<char> base64(base64_len);
    sodium_bin2base64(
        base64.data(),
        base64.size(),
        data,
        size,
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> SecretCrypto::base64_to_bytes(const std::string& base64) {
    // Decoded output is never longer than 3/4 of the input
    std::vector<uint8_t> bytes(base64.length() / 4 * 3 + 3);
    size_t decoded_len = 0;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,
        &decoded_len,
        nullptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0) {
        return std::nullopt;
    }

    bytes.resize(decoded_len);
    return bytes;
}

} // namespace secretchat
