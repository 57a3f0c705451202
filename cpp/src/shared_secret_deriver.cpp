/**
 * @file shared_secret_deriver.cpp
 * @brief Implementation of validated X25519 key agreement
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - X25519: crypto_scalarmult_curve25519 (fails on small-order peer points)
 * - KDF: BLAKE2b-256 over context, raw agreement and ordered public keys
 */

#include "secretchat/shared_secret_deriver.hpp"
#include "secretchat/key_pair_service.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"

#include <array>
#include <cstring>
#include <sodium.h>

namespace secretchat {

namespace {

// Field prime p = 2^255 - 19, little-endian
bool is_canonical_u(const PublicKey& key) {
    const uint8_t* u = key.data();

    if (u[31] & 0x80) {
        return false;
    }
    if (u[31] != 0x7F) {
        return true;
    }
    for (size_t i = 30; i >= 1; --i) {
        if (u[i] != 0xFF) {
            return true;
        }
    }
    return u[0] < 0xED;
}

} // namespace

bool SharedSecretDeriver::is_valid_public_key(const PublicKey& public_key) {
    if (public_key.is_zero()) {
        return false;
    }
    return is_canonical_u(public_key);
}

Result<SharedSecret> SharedSecretDeriver::derive(
    const PrivateKey& local_private_key,
    const PublicKey& peer_public_key
) {
    if (!SecretCrypto::initialize()) {
        return Result<SharedSecret>::fail(SecretError::ENTROPY_UNAVAILABLE,
                                          "libsodium could not be initialized");
    }

    if (!is_valid_public_key(peer_public_key)) {
        utilities::log_warn("SharedSecretDeriver: rejected malformed peer key " +
                            fingerprint(peer_public_key));
        return Result<SharedSecret>::fail(SecretError::INVALID_PEER_KEY,
                                          "peer public key is zero or non-canonical");
    }

    auto own_public_key = KeyPairService::derive_public_key(local_private_key);
    if (!own_public_key) {
        return Result<SharedSecret>::fail(SecretError::LOCAL_KEY_MISSING,
                                          "local private key is degenerate");
    }

    std::array<uint8_t, crypto_scalarmult_curve25519_BYTES> agreement;

    // libsodium returns -1 when the result is the identity (small-order peer point)
    if (crypto_scalarmult_curve25519(agreement.data(),
                                     local_private_key.data(),
                                     peer_public_key.data()) != 0) {
        SecretCrypto::secure_zero(agreement.data(), agreement.size());
        utilities::log_warn("SharedSecretDeriver: peer key " + fingerprint(peer_public_key) +
                            " is a small-order point");
        return Result<SharedSecret>::fail(SecretError::INVALID_PEER_KEY,
                                          "peer public key has small order");
    }

    const PublicKey* low = &peer_public_key;
    const PublicKey* high = &*own_public_key;
    if (std::memcmp(own_public_key->data(), peer_public_key.data(), PublicKey::SIZE) < 0) {
        low = &*own_public_key;
        high = &peer_public_key;
    }

    SharedSecret shared;
    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, shared.size());
    crypto_generichash_update(&state,
        reinterpret_cast<const unsigned char*>(security::SHARED_SECRET_CONTEXT),
        std::strlen(security::SHARED_SECRET_CONTEXT));
    crypto_generichash_update(&state, agreement.data(), agreement.size());
    crypto_generichash_update(&state, low->data(), low->size());
    crypto_generichash_update(&state, high->data(), high->size());
    crypto_generichash_final(&state, shared.data(), shared.size());

    SecretCrypto::secure_zero(agreement.data(), agreement.size());
    SecretCrypto::secure_zero(&state, sizeof(state));

    return Result<SharedSecret>::ok(shared);
}

Result<SharedSecret> SharedSecretDeriver::derive(
    const PrivateKey& local_private_key,
    const std::string& peer_public_key_hex
) {
    auto peer_public_key = PublicKey::from_hex(peer_public_key_hex);
    if (!peer_public_key) {
        return Result<SharedSecret>::fail(SecretError::INVALID_PEER_KEY,
                                          "peer public key is not 64 hex characters");
    }
    return derive(local_private_key, *peer_public_key);
}

} // namespace secretchat
