/**
 * @file key_store.cpp
 * @brief KeyStore identifier checks and the in-memory store
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/key_store.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"

namespace secretchat {

std::optional<Failure> KeyStore::check_identifier(const std::string& conversation_id) {
    if (!security::validate_identifier(conversation_id)) {
        return Failure{SecretError::INVALID_IDENTIFIER,
                       "invalid conversation id '" + conversation_id.substr(0, 80) + "'"};
    }
    return std::nullopt;
}

// ============================================================================
// InMemoryKeyStore
// ============================================================================

Result<bool> InMemoryKeyStore::put_if_absent(const std::string& conversation_id, const KeyPair& key_pair) {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    bool created = entries_.emplace(conversation_id, key_pair).second;
    if (created) {
        utilities::log_debug("KeyStore: stored key pair " + fingerprint(key_pair.public_key) +
                             " for conversation " + conversation_id);
    }
    return Result<bool>::ok(created);
}

Result<std::optional<KeyPair>> InMemoryKeyStore::get(const std::string& conversation_id) const {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(conversation_id);
    if (it == entries_.end()) {
        return Result<std::optional<KeyPair>>::ok(std::nullopt);
    }
    return Result<std::optional<KeyPair>>::ok(it->second);
}

Result<bool> InMemoryKeyStore::remove(const std::string& conversation_id) {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // KeyBytes destructors zero the erased material
    return Result<bool>::ok(entries_.erase(conversation_id) > 0);
}

Result<size_t> InMemoryKeyStore::wipe() {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = entries_.size();
    entries_.clear();

    utilities::log_info("KeyStore: wiped " + std::to_string(count) + " in-memory key pairs");
    return Result<size_t>::ok(count);
}

size_t InMemoryKeyStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace secretchat
