/**
 * @file key_store.hpp
 * @brief Local storage of per-conversation key pairs
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A key pair is written once per conversation and never replaced. Concurrent
 * put_if_absent calls for the same conversation create exactly one entry; the
 * losers observe the winner's pair.
 */

#pragma once

#include "secretchat/key_material.hpp"
#include "secretchat/result.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace secretchat {

/**
 * @brief KeyStore - conversation id -> KeyPair, write-once
 */
class KeyStore {
public:
    virtual ~KeyStore() = default;

    /**
     * @brief Store key pair unless one already exists for the conversation
     * @param conversation_id Conversation identifier
     * @param key_pair Key pair to store
     * @return true if created, false if an existing pair was retained
     */
    virtual Result<bool> put_if_absent(const std::string& conversation_id, const KeyPair& key_pair) = 0;

    /**
     * @brief Look up the key pair for a conversation
     * @return Key pair, std::nullopt if none stored, or StorageUnavailable
     */
    virtual Result<std::optional<KeyPair>> get(const std::string& conversation_id) const = 0;

    /**
     * @brief Remove the key pair for a conversation
     * @return true if an entry was removed
     */
    virtual Result<bool> remove(const std::string& conversation_id) = 0;

    /**
     * @brief Remove every stored key pair
     * @return Number of entries removed
     */
    virtual Result<size_t> wipe() = 0;

protected:
    /**
     * @brief InvalidIdentifier failure if conversation_id is unusable as a key
     */
    static std::optional<Failure> check_identifier(const std::string& conversation_id);
};

/**
 * @brief Session-scoped KeyStore held in process memory
 */
class InMemoryKeyStore : public KeyStore {
public:
    InMemoryKeyStore() = default;
    ~InMemoryKeyStore() override = default;

    InMemoryKeyStore(const InMemoryKeyStore&) = delete;
    InMemoryKeyStore& operator=(const InMemoryKeyStore&) = delete;

    Result<bool> put_if_absent(const std::string& conversation_id, const KeyPair& key_pair) override;
    Result<std::optional<KeyPair>> get(const std::string& conversation_id) const override;
    Result<bool> remove(const std::string& conversation_id) override;
    Result<size_t> wipe() override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, KeyPair> entries_;
};

} // namespace secretchat
