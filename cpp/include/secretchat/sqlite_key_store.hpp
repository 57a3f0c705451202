/**
 * @file sqlite_key_store.hpp
 * @brief Durable KeyStore backed by SQLite
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Schema:
 *   conversation_keys(conversation_id TEXT PRIMARY KEY, private_key BLOB,
 *                     public_key BLOB, created_at INTEGER)
 *
 * Write-once semantics come from INSERT OR IGNORE on the primary key.
 */

#pragma once

#include "secretchat/key_store.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace secretchat {

/**
 * @brief Key pair row plus bookkeeping, for listing
 */
struct StoredKeyInfo {
    std::string conversation_id;
    std::string public_key_hex;
    uint64_t created_at;
};

/**
 * @brief SqliteKeyStore - conversation keys in a local SQLite database
 */
class SqliteKeyStore : public KeyStore {
public:
    /**
     * @brief Open (or create) the key database
     * @param database_path Path to SQLite file
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit SqliteKeyStore(const std::filesystem::path& database_path);

    /**
     * @brief Open the key database at security::get_key_store_path()
     */
    SqliteKeyStore();

    ~SqliteKeyStore() override;

    SqliteKeyStore(const SqliteKeyStore&) = delete;
    SqliteKeyStore& operator=(const SqliteKeyStore&) = delete;

    Result<bool> put_if_absent(const std::string& conversation_id, const KeyPair& key_pair) override;
    Result<std::optional<KeyPair>> get(const std::string& conversation_id) const override;
    Result<bool> remove(const std::string& conversation_id) override;
    Result<size_t> wipe() override;

    /**
     * @brief List stored conversations with public key and creation time (no private keys)
     */
    Result<std::vector<StoredKeyInfo>> list() const;

    const std::filesystem::path& path() const { return database_path_; }

private:
    std::filesystem::path database_path_;

    /// SQLite connection (opaque pointer)
    void* db_connection_;

    /// Serializes access to db_connection_
    mutable std::mutex db_mutex_;

    bool initialize_database();

    Failure storage_failure(const std::string& action) const;
};

} // namespace secretchat
