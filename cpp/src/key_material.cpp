/**
 * @file key_material.cpp
 * @brief Key material helpers
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/key_material.hpp"

namespace secretchat {

std::string fingerprint(const PublicKey& public_key) {
    return public_key.to_hex().substr(0, 8);
}

} // namespace secretchat
