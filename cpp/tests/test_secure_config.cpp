/**
 * @file test_secure_config.cpp
 * @brief Unit tests for security configuration and utility helpers
 *
 * Tests:
 * - Cryptographic size constants
 * - Identifier validation
 * - Data directory configuration from the environment
 * - Log level parsing
 * - UUID generation
 */

#include <gtest/gtest.h>
#include "secretchat/secret_crypto.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <string>

using namespace secretchat;
using namespace secretchat::security;
namespace fs = std::filesystem;

class SecureConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecretCrypto::initialize());
        test_dir_ = fs::temp_directory_path() / ("secretchat_config_test_" + utilities::generate_uuid());
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
};

// ============================================================================
// Constants
// ============================================================================

TEST_F(SecureConfigTest, CryptoSizesAreCorrect) {
    EXPECT_EQ(X25519_PUBKEY_SIZE, 32u);
    EXPECT_EQ(X25519_SECKEY_SIZE, 32u);
    EXPECT_EQ(SHARED_SECRET_SIZE, 32u);
    EXPECT_EQ(NONCE_SIZE, 12u);
    EXPECT_EQ(TAG_SIZE, 16u);
}

TEST_F(SecureConfigTest, DisplayStrings) {
    EXPECT_STREQ(SECRET_PREVIEW_TEXT, "Click to show secret msg");
    EXPECT_STRNE(UNDECRYPTABLE_PLACEHOLDER, "");
}

// ============================================================================
// Identifier Validation
// ============================================================================

TEST_F(SecureConfigTest, ValidIdentifiers) {
    EXPECT_TRUE(validate_identifier("alice"));
    EXPECT_TRUE(validate_identifier("user_42"));
    EXPECT_TRUE(validate_identifier("550e8400-e29b-41d4-a716-446655440000"));
    EXPECT_TRUE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH, 'a')));
}

TEST_F(SecureConfigTest, InvalidIdentifiers) {
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
    EXPECT_FALSE(validate_identifier("../etc/passwd"));
    EXPECT_FALSE(validate_identifier("alice bob"));
    EXPECT_FALSE(validate_identifier("id'; DROP TABLE conversation_keys;--"));
    EXPECT_FALSE(validate_identifier(std::string("nul\0byte", 8)));
}

TEST_F(SecureConfigTest, CustomMaxLength) {
    EXPECT_TRUE(validate_identifier("abcd", 4));
    EXPECT_FALSE(validate_identifier("abcde", 4));
}

// ============================================================================
// Data Locations
// ============================================================================

#ifndef _WIN32
TEST_F(SecureConfigTest, DirectoriesFollowEnvironment) {
    const char* previous = std::getenv("SECRETCHAT_DATA_DIR");
    std::string saved = previous ? previous : "";

    ASSERT_EQ(setenv("SECRETCHAT_DATA_DIR", test_dir_.string().c_str(), 1), 0);

    EXPECT_EQ(get_data_directory(), test_dir_);
    EXPECT_EQ(get_key_directory(), test_dir_ / "keys");
    EXPECT_EQ(get_key_store_path(), test_dir_ / "keys" / "conversation_keys.db");
    EXPECT_EQ(get_log_directory(), test_dir_ / "logs");
    EXPECT_TRUE(fs::is_directory(test_dir_ / "keys"));
    EXPECT_TRUE(fs::is_directory(test_dir_ / "logs"));

    if (previous) {
        setenv("SECRETCHAT_DATA_DIR", saved.c_str(), 1);
    } else {
        unsetenv("SECRETCHAT_DATA_DIR");
    }
}

TEST_F(SecureConfigTest, RestrictToOwner) {
    fs::create_directories(test_dir_);
    fs::path file = test_dir_ / "secret.txt";
    std::ofstream(file) << "key material";

    ASSERT_TRUE(restrict_to_owner(file));
    auto perms = fs::status(file).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}
#endif

// ============================================================================
// Utilities
// ============================================================================

TEST_F(SecureConfigTest, ParseLogLevel) {
    EXPECT_EQ(utilities::parse_log_level("debug"), utilities::LogLevel::DEBUG);
    EXPECT_EQ(utilities::parse_log_level("INFO"), utilities::LogLevel::INFO);
    EXPECT_EQ(utilities::parse_log_level("Warning"), utilities::LogLevel::WARN);
    EXPECT_EQ(utilities::parse_log_level("error"), utilities::LogLevel::ERROR);
    EXPECT_EQ(utilities::parse_log_level("critical"), utilities::LogLevel::CRITICAL);
    EXPECT_FALSE(utilities::parse_log_level("verbose").has_value());
}

TEST_F(SecureConfigTest, UuidFormat) {
    std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string uuid = utilities::generate_uuid();
        EXPECT_TRUE(std::regex_match(uuid, pattern)) << uuid;
        EXPECT_TRUE(validate_identifier(uuid));
        seen.insert(uuid);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST_F(SecureConfigTest, FormatTimestamp) {
    EXPECT_EQ(utilities::format_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(utilities::format_timestamp(1731250245), "2024-11-10T14:50:45Z");
}

TEST_F(SecureConfigTest, StringHelpers) {
    EXPECT_EQ(utilities::to_lowercase("HTTPS://Example"), "https://example");
    EXPECT_TRUE(utilities::starts_with("blob:abc", "blob:"));
    EXPECT_FALSE(utilities::starts_with("bl", "blob:"));
}
