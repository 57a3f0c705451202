/**
 * @file utilities.hpp
 * @brief Common utility functions for secretchat
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout secretchat:
 * - Logging and error reporting
 * - Environment access
 * - String helpers
 * - Identifier generation
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace secretchat {
namespace utilities {

/**
 * @brief Log levels for secretchat logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Level from SECRETCHAT_LOG_LEVEL, INFO when unset or invalid
 */
LogLevel log_level_from_env();

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp Unix timestamp (seconds since epoch)
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z")
 */
std::string format_timestamp(uint64_t timestamp);

/**
 * @brief Current Unix time in seconds
 */
uint64_t current_timestamp();

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check if string starts with prefix
 * @param str String to check
 * @param prefix Prefix to check for
 * @return true if starts with prefix, false otherwise
 */
bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Generate UUID v4 string from libsodium randomness
 * @return UUID string (e.g., "550e8400-e29b-41d4-a716-446655440000")
 */
std::string generate_uuid();

} // namespace utilities
} // namespace secretchat
