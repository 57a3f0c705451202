/**
 * @file secure_config.hpp
 * @brief Security constants, data locations and input validation
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace secretchat {
namespace security {

// ============================================================================
// Size Limits
// ============================================================================

/// Maximum plaintext size accepted by MessageCipher (1MB)
constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;

/// Maximum identifier length (conversation ID, user ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum size of the JSON key file read back from disk (4MB)
constexpr size_t MAX_KEY_FILE_SIZE = 4 * 1024 * 1024;

/// How long a key store connection waits on another connection's write lock
constexpr int KEY_STORE_BUSY_TIMEOUT_MS = 5000;

// ============================================================================
// Cryptographic Configuration
// ============================================================================

/// X25519 public key size
constexpr size_t X25519_PUBKEY_SIZE = 32;

/// X25519 secret scalar size
constexpr size_t X25519_SECKEY_SIZE = 32;

/// Derived shared secret / AEAD key size (256-bit)
constexpr size_t SHARED_SECRET_SIZE = 32;

/// ChaCha20-Poly1305 IETF nonce size
constexpr size_t NONCE_SIZE = 12;

/// Poly1305 authentication tag size
constexpr size_t TAG_SIZE = 16;

/// Domain separation label mixed into every derived shared secret
constexpr const char* SHARED_SECRET_CONTEXT = "secretchat-shared-v1";

// ============================================================================
// Display Strings
// ============================================================================

/// Shown in place of a message whose ciphertext fails authentication
constexpr const char* UNDECRYPTABLE_PLACEHOLDER = "[unable to decrypt message]";

/// Conversation list preview for secret conversations
constexpr const char* SECRET_PREVIEW_TEXT = "Click to show secret msg";

// ============================================================================
// Data Locations
// ============================================================================

/**
 * @brief Get secretchat data directory from SECRETCHAT_DATA_DIR or use default
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get directory holding local key storage
 * @return Filesystem path to key directory (created if missing)
 */
std::filesystem::path get_key_directory();

/**
 * @brief Get default SQLite key store path
 * @return <data>/keys/conversation_keys.db
 */
std::filesystem::path get_key_store_path();

/**
 * @brief Get log directory
 * @return Filesystem path to log directory (created if missing)
 */
std::filesystem::path get_log_directory();

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric + underscore/hyphen only)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Restrict a file to owner read/write (no-op on Windows)
 * @param path File to restrict
 * @return true if permissions were applied
 */
bool restrict_to_owner(const std::filesystem::path& path);

} // namespace security
} // namespace secretchat
