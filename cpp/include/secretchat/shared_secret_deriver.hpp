/**
 * @file shared_secret_deriver.hpp
 * @brief Validated X25519 key agreement producing a symmetric key
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * shared = BLAKE2b-256(context || X25519(sk, pk_peer) || min(pk_a, pk_b) || max(pk_a, pk_b))
 *
 * Ordering the two public keys makes the output identical for both parties:
 * derive(skA, pkB) == derive(skB, pkA).
 */

#pragma once

#include "secretchat/key_material.hpp"
#include "secretchat/result.hpp"

#include <string>

namespace secretchat {

/**
 * @brief SharedSecretDeriver - deterministic, symmetric ECDH + KDF
 */
class SharedSecretDeriver {
public:
    /**
     * @brief Derive the conversation key from our private key and the peer's public key
     * @param local_private_key Our X25519 scalar
     * @param peer_public_key Peer's X25519 public key
     * @return 32-byte SharedSecret, or InvalidPeerKey if the peer key is unusable
     */
    static Result<SharedSecret> derive(
        const PrivateKey& local_private_key,
        const PublicKey& peer_public_key
    );

    /**
     * @brief Derive from a peer key received as hex over the wire
     * @return SharedSecret, or InvalidPeerKey if the text is not a 32-byte key
     */
    static Result<SharedSecret> derive(
        const PrivateKey& local_private_key,
        const std::string& peer_public_key_hex
    );

    /**
     * @brief Structural validation of a public key
     *
     * Rejects the all-zero key and non-canonical encodings (u >= 2^255 - 19).
     * Small-order points are additionally caught during derivation.
     */
    static bool is_valid_public_key(const PublicKey& public_key);
};

} // namespace secretchat
