/**
 * @file key_material.hpp
 * @brief Strongly typed X25519 key material for secret conversations
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * PrivateKey, PublicKey and SharedSecret are distinct types so one can never
 * be passed where another is expected. Every instance wipes its bytes on
 * destruction; equality is constant-time.
 */

#pragma once

#include "secretchat/secret_crypto.hpp"
#include "secretchat/secure_config.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <sodium.h>

namespace secretchat {

struct PrivateKeyTag {};
struct PublicKeyTag {};
struct SharedSecretTag {};

/**
 * @brief Fixed-size key buffer distinguished by Tag
 */
template <size_t N, typename Tag>
class KeyBytes {
public:
    static constexpr size_t SIZE = N;

    KeyBytes() { bytes_.fill(0); }

    explicit KeyBytes(const std::array<uint8_t, N>& bytes) : bytes_(bytes) {}

    KeyBytes(const KeyBytes&) = default;
    KeyBytes& operator=(const KeyBytes&) = default;

    ~KeyBytes() {
        SecretCrypto::secure_zero(bytes_.data(), bytes_.size());
    }

    /**
     * @brief Copy exactly N bytes
     * @return Key, or std::nullopt if size != N
     */
    static std::optional<KeyBytes> from_bytes(const uint8_t* data, size_t size) {
        if (data == nullptr || size != N) {
            return std::nullopt;
        }
        KeyBytes key;
        std::copy(data, data + N, key.bytes_.begin());
        return key;
    }

    /**
     * @brief Parse 2*N hex characters (either case)
     */
    static std::optional<KeyBytes> from_hex(const std::string& hex) {
        if (hex.length() != N * 2) {
            return std::nullopt;
        }
        auto decoded = SecretCrypto::hex_to_bytes(hex);
        if (!decoded) {
            return std::nullopt;
        }
        auto key = from_bytes(decoded->data(), decoded->size());
        SecretCrypto::secure_zero(decoded->data(), decoded->size());
        return key;
    }

    std::string to_hex() const {
        return SecretCrypto::bytes_to_hex(bytes_.data(), bytes_.size());
    }

    const uint8_t* data() const { return bytes_.data(); }
    uint8_t* data() { return bytes_.data(); }
    constexpr size_t size() const { return N; }
    const std::array<uint8_t, N>& bytes() const { return bytes_; }

    bool is_zero() const {
        return sodium_is_zero(bytes_.data(), bytes_.size()) == 1;
    }

    friend bool operator==(const KeyBytes& a, const KeyBytes& b) {
        return sodium_memcmp(a.bytes_.data(), b.bytes_.data(), N) == 0;
    }

    friend bool operator!=(const KeyBytes& a, const KeyBytes& b) {
        return !(a == b);
    }

private:
    std::array<uint8_t, N> bytes_;
};

/// X25519 secret scalar; never leaves the device except through a KeyStore
using PrivateKey = KeyBytes<crypto_scalarmult_curve25519_SCALARBYTES, PrivateKeyTag>;

/// X25519 public u-coordinate; safe to transmit
using PublicKey = KeyBytes<crypto_scalarmult_curve25519_BYTES, PublicKeyTag>;

/// 256-bit symmetric key derived from an X25519 agreement
using SharedSecret = KeyBytes<crypto_aead_chacha20poly1305_ietf_KEYBYTES, SharedSecretTag>;

static_assert(PrivateKey::SIZE == security::X25519_SECKEY_SIZE, "X25519 scalar size");
static_assert(PublicKey::SIZE == security::X25519_PUBKEY_SIZE, "X25519 point size");
static_assert(SharedSecret::SIZE == security::SHARED_SECRET_SIZE, "AEAD key size");

/**
 * @brief Device-local key pair for one conversation
 */
struct KeyPair {
    PrivateKey private_key;
    PublicKey public_key;
};

/**
 * @brief Short public key fingerprint for log lines (first 8 hex characters)
 */
std::string fingerprint(const PublicKey& public_key);

} // namespace secretchat
