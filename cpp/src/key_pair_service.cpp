/**
 * @file key_pair_service.cpp
 * @brief Implementation of X25519 key pair generation
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/key_pair_service.hpp"
#include "secretchat/utilities.hpp"

#include <sodium.h>
#include <stdexcept>
#include <utility>

namespace secretchat {

KeyPairService::KeyPairService()
    : random_source_(default_random_source())
{
}

KeyPairService::KeyPairService(std::shared_ptr<RandomSource> random_source)
    : random_source_(std::move(random_source))
{
    if (!random_source_) {
        throw std::invalid_argument("KeyPairService requires a random source");
    }
}

Result<KeyPair> KeyPairService::generate() const {
    if (!SecretCrypto::initialize()) {
        utilities::log_critical("KeyPairService: libsodium initialization failed");
        return Result<KeyPair>::fail(SecretError::ENTROPY_UNAVAILABLE,
                                     "libsodium could not be initialized");
    }

    KeyPair keypair;

    if (!random_source_->fill(keypair.private_key.data(), keypair.private_key.size())) {
        utilities::log_critical("KeyPairService: secure random source unavailable");
        return Result<KeyPair>::fail(SecretError::ENTROPY_UNAVAILABLE,
                                     "secure random source unavailable");
    }

    // A zero scalar means the source produced nothing usable
    if (keypair.private_key.is_zero()) {
        utilities::log_critical("KeyPairService: random source returned an all-zero scalar");
        return Result<KeyPair>::fail(SecretError::ENTROPY_UNAVAILABLE,
                                     "random source returned an all-zero scalar");
    }

    auto public_key = derive_public_key(keypair.private_key);
    if (!public_key) {
        return Result<KeyPair>::fail(SecretError::ENTROPY_UNAVAILABLE,
                                     "generated scalar is degenerate");
    }
    keypair.public_key = *public_key;

    utilities::log_debug("KeyPairService: generated key pair " + fingerprint(keypair.public_key));
    return Result<KeyPair>::ok(keypair);
}

std::optional<PublicKey> KeyPairService::derive_public_key(const PrivateKey& private_key) {
    PublicKey public_key;

    // X25519 base point multiplication (scalar is clamped internally)
    if (crypto_scalarmult_curve25519_base(public_key.data(), private_key.data()) != 0) {
        return std::nullopt;
    }

    return public_key;
}

} // namespace secretchat
