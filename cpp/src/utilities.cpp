/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for secretchat
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

namespace secretchat {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    // Convert LogLevel to spdlog level
    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> build_logger(const std::string& log_file, LogLevel level) {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("secretchat", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        return logger;
    }

    std::shared_ptr<spdlog::logger> current_logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (!g_logger) {
            try {
                g_logger = build_logger("", log_level_from_env());
                spdlog::set_default_logger(g_logger);
            } catch (const spdlog::spdlog_ex& ex) {
                fprintf(stderr, "Log initialization failed: %s\n", ex.what());
            }
        }
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        auto logger = build_logger(log_file, level);

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = logger;

        // Register as default logger
        spdlog::set_default_logger(g_logger);

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(name);
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

LogLevel log_level_from_env() {
    auto level = parse_log_level(get_env("SECRETCHAT_LOG_LEVEL", "info"));
    return level.value_or(LogLevel::INFO);
}

void log(LogLevel level, const std::string& message) {
    auto logger = current_logger();
    if (!logger) {
        return;
    }

    switch (level) {
        case LogLevel::DEBUG:    logger->debug(message); break;
        case LogLevel::INFO:     logger->info(message); break;
        case LogLevel::WARN:     logger->warn(message); break;
        case LogLevel::ERROR:    logger->error(message); break;
        case LogLevel::CRITICAL: logger->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// TIME FUNCTIONS
// ============================================================================

std::string format_timestamp(uint64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;

#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

uint64_t current_timestamp() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

// ============================================================================
// STRING FUNCTIONS
// ============================================================================

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.length() > str.length()) {
        return false;
    }
    return str.compare(0, prefix.length(), prefix) == 0;
}

// ============================================================================
// ENVIRONMENT / IDENTIFIERS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string generate_uuid() {
    uint8_t data[16];
    randombytes_buf(data, sizeof(data));

    // Set version (4) and variant bits according to RFC 4122
    data[6] = static_cast<uint8_t>((data[6] & 0x0F) | 0x40);
    data[8] = static_cast<uint8_t>((data[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << "-";
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }

    return oss.str();
}

} // namespace utilities
} // namespace secretchat
