/**
 * @file json_file_key_store.hpp
 * @brief Durable KeyStore kept in a single JSON document
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * File layout (compatible with the web client's key map):
 * @code
 * {
 *   "<conversation_id>": { "privateKey": "<64 hex>", "publicKey": "<64 hex>" },
 *   ...
 * }
 * @endcode
 */

#pragma once

#include "secretchat/key_store.hpp"

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace secretchat {

/**
 * @brief JsonFileKeyStore - key map persisted as JSON, rewritten atomically
 *
 * Safe to share one file between several store objects or processes: every
 * operation holds an advisory lock on "<file>.lock".
 */
class JsonFileKeyStore : public KeyStore {
public:
    /**
     * @brief Bind the store to a file (created on first write)
     * @param file_path JSON key file
     * @throws std::runtime_error if the parent directory cannot be created
     */
    explicit JsonFileKeyStore(const std::filesystem::path& file_path);

    ~JsonFileKeyStore() override = default;

    JsonFileKeyStore(const JsonFileKeyStore&) = delete;
    JsonFileKeyStore& operator=(const JsonFileKeyStore&) = delete;

    Result<bool> put_if_absent(const std::string& conversation_id, const KeyPair& key_pair) override;
    Result<std::optional<KeyPair>> get(const std::string& conversation_id) const override;
    Result<bool> remove(const std::string& conversation_id) override;
    Result<size_t> wipe() override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
    std::filesystem::path lock_path_;

    /// Serializes load-modify-save cycles within this object; the flock() on
    /// lock_path_ serializes them across objects and processes
    mutable std::mutex file_mutex_;

    /**
     * @brief Read the document; a missing file is an empty object
     */
    Result<nlohmann::json> load_document() const;

    /**
     * @brief Write document to a unique 0600 temp file, fsync it, rename it over
     * the target and fsync the directory
     */
    Result<Unit> save_document(const nlohmann::json& document) const;

    Failure lock_failure(const std::string& detail) const;

    static nlohmann::json entry_to_json(const KeyPair& key_pair);
    static std::optional<KeyPair> entry_from_json(const nlohmann::json& entry);
};

} // namespace secretchat
