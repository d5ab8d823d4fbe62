/**
 * @file test_app_config.cpp
 * @brief Unit tests for ConfigManager, AppConfig and logger level parsing
 */

#include <gtest/gtest.h>
#include <cstdlib>

#include "config_manager.h"
#include "exceptions.h"
#include "logger.h"
#include "../src/infrastructure/app_config.h"

using namespace fiscid::importer;
using common::ConfigManager;

namespace {

const char* const IMPORT_KEYS[] = {
    ConfigManager::LOG_LEVEL,
    ConfigManager::LOG_FILE,
    ConfigManager::IMPORT_MAX_ROWS,
    ConfigManager::IMPORT_STRICT_CHECKSUM,
    ConfigManager::IMPORT_CHECK_NAME_MATCH,
};

const char* const TEST_KEY = "FISCID_TEST_CONFIG_VALUE";

} // namespace

class AppConfigTest : public ::testing::Test {
protected:
    ConfigManager& config = ConfigManager::getInstance();

    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    void clear() {
        for (const char* key : IMPORT_KEYS) {
            ::unsetenv(key);
            config.unset(key);
        }
        ::unsetenv(TEST_KEY);
        config.unset(TEST_KEY);
    }
};

// ============================================================================
// ConfigManager
// ============================================================================

TEST_F(AppConfigTest, GetString_Default) {
    EXPECT_FALSE(config.has(TEST_KEY));
    EXPECT_EQ(config.getString(TEST_KEY, "fallback"), "fallback");
}

TEST_F(AppConfigTest, GetString_EnvironmentThenOverride) {
    ::setenv(TEST_KEY, "from-env", 1);
    EXPECT_TRUE(config.has(TEST_KEY));
    EXPECT_EQ(config.getString(TEST_KEY), "from-env");

    config.set(TEST_KEY, "override");
    EXPECT_EQ(config.getString(TEST_KEY), "override");

    config.unset(TEST_KEY);
    EXPECT_EQ(config.getString(TEST_KEY), "from-env");
}

TEST_F(AppConfigTest, GetInt) {
    config.set(TEST_KEY, "250");
    EXPECT_EQ(config.getInt(TEST_KEY, 1), 250);

    config.set(TEST_KEY, "-3");
    EXPECT_EQ(config.getInt(TEST_KEY, 1), -3);
}

TEST_F(AppConfigTest, GetInt_MalformedFallsBackToDefault) {
    config.set(TEST_KEY, "12abc");
    EXPECT_EQ(config.getInt(TEST_KEY, 5), 5);

    config.set(TEST_KEY, "lots");
    EXPECT_EQ(config.getInt(TEST_KEY, 5), 5);

    config.set(TEST_KEY, "99999999999999");
    EXPECT_EQ(config.getInt(TEST_KEY, 5), 5);
}

TEST_F(AppConfigTest, GetBool) {
    for (const char* yes : {"true", "TRUE", "1", "yes", "On"}) {
        config.set(TEST_KEY, yes);
        EXPECT_TRUE(config.getBool(TEST_KEY, false)) << yes;
    }
    for (const char* no : {"false", "0", "NO", "off"}) {
        config.set(TEST_KEY, no);
        EXPECT_FALSE(config.getBool(TEST_KEY, true)) << no;
    }
}

TEST_F(AppConfigTest, GetBool_UnknownFallsBackToDefault) {
    config.set(TEST_KEY, "maybe");
    EXPECT_TRUE(config.getBool(TEST_KEY, true));
    EXPECT_FALSE(config.getBool(TEST_KEY, false));
}

// ============================================================================
// AppConfig
// ============================================================================

TEST_F(AppConfigTest, Defaults) {
    AppConfig appConfig = AppConfig::fromConfigManager(config);
    EXPECT_EQ(appConfig.logLevel, "info");
    EXPECT_EQ(appConfig.logFile, "");
    EXPECT_EQ(appConfig.maxRows, 0);
    EXPECT_FALSE(appConfig.strictChecksum);
    EXPECT_TRUE(appConfig.checkNameMatch);
    EXPECT_NO_THROW(appConfig.validate());
}

TEST_F(AppConfigTest, FromConfigManager) {
    config.set(ConfigManager::LOG_LEVEL, "debug");
    config.set(ConfigManager::LOG_FILE, "/tmp/import-checker.log");
    config.set(ConfigManager::IMPORT_MAX_ROWS, "200");
    config.set(ConfigManager::IMPORT_STRICT_CHECKSUM, "yes");
    config.set(ConfigManager::IMPORT_CHECK_NAME_MATCH, "false");

    AppConfig appConfig = AppConfig::fromConfigManager(config);
    EXPECT_EQ(appConfig.logLevel, "debug");
    EXPECT_EQ(appConfig.logFile, "/tmp/import-checker.log");
    EXPECT_EQ(appConfig.maxRows, 200);
    EXPECT_TRUE(appConfig.strictChecksum);
    EXPECT_FALSE(appConfig.checkNameMatch);
}

TEST_F(AppConfigTest, FromEnvironment) {
    ::setenv(ConfigManager::IMPORT_MAX_ROWS, "50", 1);

    AppConfig appConfig = AppConfig::fromConfigManager(config);
    EXPECT_EQ(appConfig.maxRows, 50);
}

TEST_F(AppConfigTest, Validate_NegativeMaxRows) {
    config.set(ConfigManager::IMPORT_MAX_ROWS, "-1");

    AppConfig appConfig = AppConfig::fromConfigManager(config);
    EXPECT_THROW(appConfig.validate(), common::ConfigException);
}

TEST_F(AppConfigTest, ToImportOptions) {
    AppConfig appConfig;
    appConfig.maxRows = 10;
    appConfig.strictChecksum = true;
    appConfig.checkNameMatch = false;

    ImportOptions options = appConfig.toImportOptions();
    EXPECT_EQ(options.maxRows, 10);
    EXPECT_TRUE(options.strictChecksum);
    EXPECT_FALSE(options.checkNameMatch);
}

// ============================================================================
// Exceptions
// ============================================================================

TEST_F(AppConfigTest, ExceptionMessages) {
    EXPECT_STREQ(common::ConfigException("bad").what(), "Configuration error: bad");
    EXPECT_STREQ(common::ParsingException("bad").what(), "Parsing error: bad");
    EXPECT_STREQ(common::ImportException("Nessun dato da importare").what(), "Nessun dato da importare");
}

// ============================================================================
// Logger
// ============================================================================

TEST_F(AppConfigTest, LoggerParseLevel) {
    EXPECT_EQ(common::Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(common::Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(common::Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(common::Logger::parseLevel("off"), spdlog::level::off);
    EXPECT_EQ(common::Logger::parseLevel("verbose"), spdlog::level::info);
}
