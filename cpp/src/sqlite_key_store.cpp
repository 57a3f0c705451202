/**
 * @file sqlite_key_store.cpp
 * @brief Implementation of the SQLite key store
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/sqlite_key_store.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"

#include <sqlite3.h>
#include <stdexcept>

namespace secretchat {

// ============================================================================
// Constructor / Destructor
// ============================================================================

SqliteKeyStore::SqliteKeyStore(const std::filesystem::path& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    std::error_code ec;
    if (database_path_.has_parent_path()) {
        std::filesystem::create_directories(database_path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create key store directory: " +
                                     database_path_.parent_path().string());
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.string().c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open key store database: " + database_path_.string());
    }

    // Other connections to the same file hold the write lock briefly
    if (sqlite3_busy_timeout(db, security::KEY_STORE_BUSY_TIMEOUT_MS) != SQLITE_OK) {
        sqlite3_close(db);
        throw std::runtime_error("Failed to configure key store database: " + database_path_.string());
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize key store schema");
    }

    if (!security::restrict_to_owner(database_path_)) {
        utilities::log_warn("KeyStore: could not restrict permissions on " + database_path_.string());
    }

    utilities::log_info("KeyStore: opened " + database_path_.string());
}

SqliteKeyStore::SqliteKeyStore()
    : SqliteKeyStore(security::get_key_store_path())
{
}

SqliteKeyStore::~SqliteKeyStore() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool SqliteKeyStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    // Deleted rows are overwritten on disk, not just unlinked
    const char* schema = R"(
        PRAGMA secure_delete = ON;
        CREATE TABLE IF NOT EXISTS conversation_keys (
            conversation_id TEXT PRIMARY KEY,
            private_key BLOB NOT NULL,
            public_key BLOB NOT NULL,
            created_at INTEGER NOT NULL
        );
    )";

    int rc = sqlite3_exec(db, schema, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error(std::string("KeyStore: schema error: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

Failure SqliteKeyStore::storage_failure(const std::string& action) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    std::string detail = db ? sqlite3_errmsg(db) : "database not open";

    utilities::log_error("KeyStore: failed to " + action + ": " + detail);
    return Failure{SecretError::STORAGE_UNAVAILABLE, action + ": " + detail};
}

// ============================================================================
// Key Pair Operations
// ============================================================================

Result<bool> SqliteKeyStore::put_if_absent(const std::string& conversation_id, const KeyPair& key_pair) {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR IGNORE INTO conversation_keys
        (conversation_id, private_key, public_key, created_at)
        VALUES (?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_failure("prepare insert");
    }

    sqlite3_bind_text(stmt, 1, conversation_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 2, key_pair.private_key.data(),
                      static_cast<int>(key_pair.private_key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt, 3, key_pair.public_key.data(),
                      static_cast<int>(key_pair.public_key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(utilities::current_timestamp()));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storage_failure("store key pair");
    }

    // Zero changed rows means the primary key already existed
    bool created = sqlite3_changes(db) > 0;
    if (created) {
        utilities::log_debug("KeyStore: stored key pair " + fingerprint(key_pair.public_key) +
                             " for conversation " + conversation_id);
    }

    return Result<bool>::ok(created);
}

Result<std::optional<KeyPair>> SqliteKeyStore::get(const std::string& conversation_id) const {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT private_key, public_key
        FROM conversation_keys
        WHERE conversation_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_failure("prepare select");
    }

    sqlite3_bind_text(stmt, 1, conversation_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return Result<std::optional<KeyPair>>::ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return storage_failure("read key pair");
    }

    auto private_key = PrivateKey::from_bytes(
        static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 0)),
        static_cast<size_t>(sqlite3_column_bytes(stmt, 0)));
    auto public_key = PublicKey::from_bytes(
        static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 1)),
        static_cast<size_t>(sqlite3_column_bytes(stmt, 1)));

    sqlite3_finalize(stmt);

    if (!private_key || !public_key) {
        utilities::log_error("KeyStore: corrupt key row for conversation " + conversation_id);
        return Result<std::optional<KeyPair>>::fail(SecretError::STORAGE_UNAVAILABLE,
            "stored key pair for " + conversation_id + " has invalid length");
    }

    return Result<std::optional<KeyPair>>::ok(KeyPair{*private_key, *public_key});
}

Result<bool> SqliteKeyStore::remove(const std::string& conversation_id) {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "DELETE FROM conversation_keys WHERE conversation_id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_failure("prepare delete");
    }

    sqlite3_bind_text(stmt, 1, conversation_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storage_failure("remove key pair");
    }

    return Result<bool>::ok(sqlite3_changes(db) > 0);
}

Result<size_t> SqliteKeyStore::wipe() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    int rc = sqlite3_exec(db, "DELETE FROM conversation_keys", nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return storage_failure("wipe key store");
    }

    size_t count = static_cast<size_t>(sqlite3_changes(db));
    utilities::log_info("KeyStore: wiped " + std::to_string(count) + " key pairs from " +
                        database_path_.string());

    return Result<size_t>::ok(count);
}

Result<std::vector<StoredKeyInfo>> SqliteKeyStore::list() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT conversation_id, public_key, created_at
        FROM conversation_keys
        ORDER BY created_at ASC, conversation_id ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_failure("prepare list");
    }

    std::vector<StoredKeyInfo> entries;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        StoredKeyInfo info;
        info.conversation_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));

        auto public_key = PublicKey::from_bytes(
            static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 1)),
            static_cast<size_t>(sqlite3_column_bytes(stmt, 1)));
        info.public_key_hex = public_key ? public_key->to_hex() : "";
        info.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));

        entries.push_back(std::move(info));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return storage_failure("list key pairs");
    }

    return Result<std::vector<StoredKeyInfo>>::ok(std::move(entries));
}

} // namespace secretchat
