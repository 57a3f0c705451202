/**
 * @file json_file_key_store.cpp
 * @brief Implementation of the JSON file key store
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/json_file_key_store.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifndef _WIN32
    #include <fcntl.h>
    #include <sys/file.h>
    #include <unistd.h>
#endif

using json = nlohmann::json;

namespace secretchat {

namespace {

constexpr const char* PRIVATE_KEY_FIELD = "privateKey";
constexpr const char* PUBLIC_KEY_FIELD = "publicKey";

/**
 * @brief Advisory lock on "<key file>.lock", held for one load-modify-save cycle
 *
 * flock() locks belong to the open file description, so two store objects on
 * the same file exclude each other even inside one process.
 */
class FileLock {
public:
    FileLock(const std::filesystem::path& lock_path, bool exclusive) {
#ifndef _WIN32
        fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            error_ = errno;
            return;
        }

        int rc;
        do {
            rc = ::flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0) {
            error_ = errno;
            ::close(fd_);
            fd_ = -1;
            return;
        }
        locked_ = true;
#else
        (void)lock_path;
        (void)exclusive;
        locked_ = true;
#endif
    }

    ~FileLock() {
#ifndef _WIN32
        // Closing the descriptor releases the lock
        if (fd_ >= 0) {
            ::close(fd_);
        }
#endif
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }
    std::string error() const { return std::strerror(error_); }

private:
    int fd_ = -1;
    int error_ = 0;
    bool locked_ = false;
};

#ifndef _WIN32

// Create path exclusively (0600), write text and fsync before returning
bool write_new_file(const std::filesystem::path& path, const std::string& text, int& error) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        error = errno;
        return false;
    }

    const char* data = text.data();
    size_t remaining = text.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = errno;
            ::close(fd);
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        error = errno;
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        error = errno;
        return false;
    }
    return true;
}

// Persist a rename by syncing the containing directory
bool sync_directory(const std::filesystem::path& dir, int& error) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        error = errno;
        return false;
    }
    int rc = ::fsync(fd);
    if (rc != 0) {
        error = errno;
    }
    ::close(fd);
    return rc == 0;
}

#else

bool write_new_file(const std::filesystem::path& path, const std::string& text, int& error) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = EIO;
        return false;
    }
    if (!security::restrict_to_owner(path)) {
        error = EACCES;
        return false;
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.flush();
    if (!file) {
        error = EIO;
        return false;
    }
    return true;
}

bool sync_directory(const std::filesystem::path&, int&) {
    return true;
}

#endif

} // namespace

JsonFileKeyStore::JsonFileKeyStore(const std::filesystem::path& file_path)
    : file_path_(file_path)
{
    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create key file directory: " +
                                     file_path_.parent_path().string());
        }
    }

    lock_path_ = file_path_;
    lock_path_ += ".lock";
}

// ============================================================================
// Document I/O
// ============================================================================

Result<json> JsonFileKeyStore::load_document() const {
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        if (ec) {
            return Result<json>::fail(SecretError::STORAGE_UNAVAILABLE,
                                      "cannot stat " + file_path_.string() + ": " + ec.message());
        }
        return Result<json>::ok(json::object());
    }

    auto file_size = std::filesystem::file_size(file_path_, ec);
    if (ec || file_size > security::MAX_KEY_FILE_SIZE) {
        utilities::log_error("KeyStore: key file unreadable or oversized: " + file_path_.string());
        return Result<json>::fail(SecretError::STORAGE_UNAVAILABLE,
                                  "key file unreadable or oversized");
    }

    std::ifstream file(file_path_, std::ios::binary);
    if (!file) {
        return Result<json>::fail(SecretError::STORAGE_UNAVAILABLE,
                                  "cannot open " + file_path_.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    try {
        json document = text.empty() ? json::object() : json::parse(text);
        SecretCrypto::secure_zero(text);

        if (!document.is_object()) {
            return Result<json>::fail(SecretError::STORAGE_UNAVAILABLE,
                                      "key file is not a JSON object");
        }
        return Result<json>::ok(std::move(document));

    } catch (const json::exception& e) {
        SecretCrypto::secure_zero(text);
        utilities::log_error("KeyStore: corrupt key file " + file_path_.string() + ": " + e.what());
        return Result<json>::fail(SecretError::STORAGE_UNAVAILABLE,
                                  std::string("corrupt key file: ") + e.what());
    }
}

Result<Unit> JsonFileKeyStore::save_document(const json& document) const {
    // Unique per write so concurrent writers never share a temp file
    auto temp_path = file_path_;
    temp_path += ".tmp-" + utilities::generate_uuid();

    std::string text = document.dump(2);

    int error = 0;
    bool written = write_new_file(temp_path, text, error);
    SecretCrypto::secure_zero(text);

    if (!written) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        utilities::log_error("KeyStore: failed to write " + temp_path.string() + ": " + std::strerror(error));
        return Result<Unit>::fail(SecretError::STORAGE_UNAVAILABLE,
                                  "cannot write " + temp_path.string() + ": " + std::strerror(error));
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, file_path_, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        utilities::log_error("KeyStore: failed to replace " + file_path_.string() + ": " + ec.message());
        return Result<Unit>::fail(SecretError::STORAGE_UNAVAILABLE,
                                  "cannot replace key file: " + ec.message());
    }

    if (!sync_directory(file_path_.parent_path(), error)) {
        utilities::log_error("KeyStore: failed to sync directory of " + file_path_.string() + ": " +
                             std::strerror(error));
        return Result<Unit>::fail(SecretError::STORAGE_UNAVAILABLE,
                                  std::string("cannot sync key file directory: ") + std::strerror(error));
    }

    return Result<Unit>::ok(Unit{});
}

Failure JsonFileKeyStore::lock_failure(const std::string& detail) const {
    utilities::log_error("KeyStore: cannot lock " + lock_path_.string() + ": " + detail);
    return Failure{SecretError::STORAGE_UNAVAILABLE, "cannot lock key file: " + detail};
}

json JsonFileKeyStore::entry_to_json(const KeyPair& key_pair) {
    return json{
        {PRIVATE_KEY_FIELD, key_pair.private_key.to_hex()},
        {PUBLIC_KEY_FIELD, key_pair.public_key.to_hex()}
    };
}

std::optional<KeyPair> JsonFileKeyStore::entry_from_json(const json& entry) {
    if (!entry.is_object()) {
        return std::nullopt;
    }

    auto private_it = entry.find(PRIVATE_KEY_FIELD);
    auto public_it = entry.find(PUBLIC_KEY_FIELD);
    if (private_it == entry.end() || public_it == entry.end() ||
        !private_it->is_string() || !public_it->is_string()) {
        return std::nullopt;
    }

    auto private_key = PrivateKey::from_hex(private_it->get<std::string>());
    auto public_key = PublicKey::from_hex(public_it->get<std::string>());
    if (!private_key || !public_key) {
        return std::nullopt;
    }

    return KeyPair{*private_key, *public_key};
}

// ============================================================================
// Key Pair Operations
// ============================================================================

Result<bool> JsonFileKeyStore::put_if_absent(const std::string& conversation_id, const KeyPair& key_pair) {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(file_mutex_);
    FileLock file_lock(lock_path_, true);
    if (!file_lock.locked()) {
        return lock_failure(file_lock.error());
    }

    auto document = load_document();
    if (!document) {
        return document.failure();
    }

    if (document->contains(conversation_id)) {
        return Result<bool>::ok(false);
    }

    (*document)[conversation_id] = entry_to_json(key_pair);

    auto saved = save_document(*document);
    if (!saved) {
        return saved.failure();
    }

    utilities::log_debug("KeyStore: stored key pair " + fingerprint(key_pair.public_key) +
                         " for conversation " + conversation_id);
    return Result<bool>::ok(true);
}

Result<std::optional<KeyPair>> JsonFileKeyStore::get(const std::string& conversation_id) const {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(file_mutex_);
    FileLock file_lock(lock_path_, false);
    if (!file_lock.locked()) {
        return lock_failure(file_lock.error());
    }

    auto document = load_document();
    if (!document) {
        return document.failure();
    }

    auto it = document->find(conversation_id);
    if (it == document->end()) {
        return Result<std::optional<KeyPair>>::ok(std::nullopt);
    }

    auto key_pair = entry_from_json(*it);
    if (!key_pair) {
        utilities::log_error("KeyStore: malformed key entry for conversation " + conversation_id);
        return Result<std::optional<KeyPair>>::fail(SecretError::STORAGE_UNAVAILABLE,
            "malformed key entry for " + conversation_id);
    }

    return Result<std::optional<KeyPair>>::ok(std::move(key_pair));
}

Result<bool> JsonFileKeyStore::remove(const std::string& conversation_id) {
    if (auto failure = check_identifier(conversation_id)) {
        return *failure;
    }

    std::lock_guard<std::mutex> lock(file_mutex_);
    FileLock file_lock(lock_path_, true);
    if (!file_lock.locked()) {
        return lock_failure(file_lock.error());
    }

    auto document = load_document();
    if (!document) {
        return document.failure();
    }

    if (document->erase(conversation_id) == 0) {
        return Result<bool>::ok(false);
    }

    auto saved = save_document(*document);
    if (!saved) {
        return saved.failure();
    }

    return Result<bool>::ok(true);
}

Result<size_t> JsonFileKeyStore::wipe() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    FileLock file_lock(lock_path_, true);
    if (!file_lock.locked()) {
        return lock_failure(file_lock.error());
    }

    auto document = load_document();
    if (!document) {
        return document.failure();
    }

    size_t count = document->size();

    auto saved = save_document(json::object());
    if (!saved) {
        return saved.failure();
    }

    utilities::log_info("KeyStore: wiped " + std::to_string(count) + " key pairs from " +
                        file_path_.string());
    return Result<size_t>::ok(count);
}

} // namespace secretchat
