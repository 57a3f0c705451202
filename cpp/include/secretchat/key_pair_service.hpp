/**
 * @file key_pair_service.hpp
 * @brief X25519 key pair generation for secret conversations
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "secretchat/key_material.hpp"
#include "secretchat/result.hpp"
#include "secretchat/secret_crypto.hpp"

#include <memory>
#include <optional>

namespace secretchat {

/**
 * @brief KeyPairService - generates one fresh key pair per conversation
 *
 * Stateless apart from its random source; safe to share between threads
 * when the random source is.
 */
class KeyPairService {
public:
    /**
     * @brief Service drawing from libsodium randombytes
     */
    KeyPairService();

    /**
     * @brief Service drawing from an injected source
     * @param random_source Secure random source (must not be null)
     */
    explicit KeyPairService(std::shared_ptr<RandomSource> random_source);

    /**
     * @brief Generate an X25519 key pair
     * @return KeyPair, or EntropyUnavailable if no secure randomness exists
     */
    Result<KeyPair> generate() const;

    /**
     * @brief Recompute the public key for a private scalar
     * @return PublicKey, or std::nullopt for a degenerate scalar
     */
    static std::optional<PublicKey> derive_public_key(const PrivateKey& private_key);

private:
    std::shared_ptr<RandomSource> random_source_;
};

} // namespace secretchat
