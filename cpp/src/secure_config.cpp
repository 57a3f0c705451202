/**
 * @file secure_config.cpp
 * @brief Implementation of security configuration and validation functions
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "secretchat/secure_config.hpp"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <system_error>

namespace secretchat {
namespace security {

namespace {

std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }
    return dir;
}

} // namespace

// ============================================================================
// Data Locations
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* env_data_dir = std::getenv("SECRETCHAT_DATA_DIR");

    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        return ensure_directory(std::filesystem::path(env_data_dir));
    }

#ifdef _WIN32
    std::filesystem::path default_dir = "C:\\ProgramData\\secretchat";
#else
    std::filesystem::path default_dir = "/var/lib/secretchat";
#endif

    return ensure_directory(default_dir);
}

std::filesystem::path get_key_directory() {
    return ensure_directory(get_data_directory() / "keys");
}

std::filesystem::path get_key_store_path() {
    return get_key_directory() / "conversation_keys.db";
}

std::filesystem::path get_log_directory() {
    return ensure_directory(get_data_directory() / "logs");
}

// ============================================================================
// Input Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Identifiers end up in file names and SQL parameters
    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }

    return true;
}

bool restrict_to_owner(const std::filesystem::path& path) {
#ifndef _WIN32
    std::error_code ec;
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    return !ec;
#else
    (void)path;
    return true;
#endif
}

} // namespace security
} // namespace secretchat
