// tests/test_utils.cpp
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <stdlib.h>

#include "gtest/gtest.h"

#include "Mocks.hpp"
#include "../src/utils/Utils.hpp"

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"command=flush_all"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("command"), "flush_all");
}

TEST(UtilsTest, ParseArgumentsKeyContainingSeparator) {
    std::vector<std::string> args = {"command=contains", "key=pc::add::8102"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("key"), "pc::add::8102");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    auto result = Utils::parseArguments({});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidFormats) {
    std::streambuf* oldCerr = std::cerr.rdbuf();
    std::ostringstream newCerr;
    std::cerr.rdbuf(newCerr.rdbuf());

    EXPECT_FALSE(Utils::parseArguments({"flush_all"}).has_value());
    EXPECT_FALSE(Utils::parseArguments({"=value"}).has_value());
    // One bad argument rejects the whole set
    EXPECT_FALSE(Utils::parseArguments({"command=flush", "oops", "key=k"}).has_value());

    std::cerr.rdbuf(oldCerr);
    EXPECT_NE(newCerr.str().find("Invalid argument format"), std::string::npos);
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    auto result = Utils::parseArguments({"key="});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("key"), "");
}

// --- Tests for conversions ---

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("INFO"), LogUtils::LogLevel::INFO);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("CERROR"), LogUtils::LogLevel::CERROR);
    EXPECT_THROW(Utils::stringToLogLevel("debug"), std::invalid_argument);
}

TEST(UtilsTest, StringToStorageKind) {
    EXPECT_EQ(Utils::stringToStorageKind("file"), StorageKind::File);
    EXPECT_EQ(Utils::stringToStorageKind("file_memory"), StorageKind::FileMemory);
    EXPECT_EQ(Utils::stringToStorageKind("redis"), StorageKind::Redis);
    EXPECT_THROW(Utils::stringToStorageKind("memcached"), std::invalid_argument);
    EXPECT_EQ(storageKindToString(StorageKind::FileMemory), "file_memory");
}

TEST(UtilsTest, StringToInt) {
    EXPECT_EQ(Utils::stringToInt("250"), 250);
    EXPECT_FALSE(Utils::stringToInt("250ms").has_value());
    EXPECT_FALSE(Utils::stringToInt("").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999999999999").has_value());
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  key_prefix = pc \r\n"), "key_prefix = pc");
    EXPECT_EQ(Utils::trim(" \t "), "");
}

// --- Tests for loadConfiguration ---

class LoadConfigurationTest : public ::testing::Test {
protected:
    TempDir dir;
    std::streambuf* oldCerr = nullptr;
    std::ostringstream newCerr;

    void SetUp() override {
        std::filesystem::create_directories(dir.path());
        // Point at a file that does not exist so no installed config is picked up
        pointConfigAt((dir.path() / "absent.config").string());
        oldCerr = std::cerr.rdbuf(newCerr.rdbuf());
    }

    void TearDown() override {
        std::cerr.rdbuf(oldCerr);
        unsetenv(Constants::CONFIG_PATH_ENV);
    }

    void pointConfigAt(const std::string& path) {
        setenv(Constants::CONFIG_PATH_ENV, path.c_str(), 1);
    }

    std::string writeConfig(const std::string& contents) {
        std::string path = (dir.path() / "persistcache.config").string();
        std::ofstream(path) << contents;
        return path;
    }
};

TEST_F(LoadConfigurationTest, Defaults) {
    AppConfig config = Utils::loadConfiguration({});
    EXPECT_EQ(config.storage_kind, StorageKind::File);
    EXPECT_EQ(config.root_directory, "persistcache_data");
    EXPECT_EQ(config.connection_string, "redis://127.0.0.1:6379");
    EXPECT_EQ(config.key_prefix, "pc");
    EXPECT_EQ(config.lock_timeout_in_millis, 5000);
    EXPECT_EQ(config.redis_connect_timeout_in_millis, 1000);
    EXPECT_EQ(config.redis_command_timeout_in_millis, 1000);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
    EXPECT_NE(newCerr.str().find("Configuration file not found"), std::string::npos);
}

TEST_F(LoadConfigurationTest, CommandLineOverrides) {
    std::map<std::string, std::string> args = {
        {"storage_kind", "redis"},
        {"connection_string", "redis://cache:6380/1"},
        {"key_prefix", "app.v2"},
        {"lock_timeout_in_millis", "250"},
        {"log_level", "DEBUG"},
        {"command", "flush_all"}};
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.storage_kind, StorageKind::Redis);
    EXPECT_EQ(config.connection_string, "redis://cache:6380/1");
    EXPECT_EQ(config.key_prefix, "app.v2");
    EXPECT_EQ(config.lock_timeout_in_millis, 250);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
}

TEST_F(LoadConfigurationTest, InvalidValuesKeepDefaults) {
    std::map<std::string, std::string> args = {
        {"storage_kind", "tape"},
        {"key_prefix", "has space"},
        {"lock_timeout_in_millis", "-5"},
        {"redis_command_timeout_in_millis", "soon"},
        {"root_directory", ""},
        {"log_level", "LOUD"}};
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.storage_kind, StorageKind::File);
    EXPECT_EQ(config.key_prefix, "pc");
    EXPECT_EQ(config.lock_timeout_in_millis, 5000);
    EXPECT_EQ(config.redis_command_timeout_in_millis, 1000);
    EXPECT_EQ(config.root_directory, "persistcache_data");
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
    EXPECT_NE(newCerr.str().find("Warning: Invalid key_prefix"), std::string::npos);
}

TEST_F(LoadConfigurationTest, ReadsFileFromEnvironmentPath) {
    pointConfigAt(writeConfig(
        "# cache settings\n"
        "\n"
        "storage_kind = file_memory\n"
        "  root_directory = /var/cache/app  \n"
        "redis_connect_timeout_in_millis=300\n"
        "colour = blue\n"));

    AppConfig config = Utils::loadConfiguration({});
    EXPECT_EQ(config.storage_kind, StorageKind::FileMemory);
    EXPECT_EQ(config.root_directory, "/var/cache/app");
    EXPECT_EQ(config.redis_connect_timeout_in_millis, 300);
    EXPECT_NE(newCerr.str().find("Unknown setting 'colour'"), std::string::npos);
    EXPECT_EQ(newCerr.str().find("Configuration file not found"), std::string::npos);
}

TEST_F(LoadConfigurationTest, CommandLineBeatsFile) {
    pointConfigAt(writeConfig("key_prefix = fromfile\nlock_timeout_in_millis = 100\n"));

    AppConfig config = Utils::loadConfiguration({{"key_prefix", "fromcli"}});
    EXPECT_EQ(config.key_prefix, "fromcli");
    EXPECT_EQ(config.lock_timeout_in_millis, 100);
}

TEST_F(LoadConfigurationTest, StorageConfigMapping) {
    AppConfig config = Utils::loadConfiguration({
        {"storage_kind", "file_memory"},
        {"root_directory", "/tmp/pc"},
        {"lock_timeout_in_millis", "1500"},
        {"redis_command_timeout_in_millis", "700"}});

    StorageConfig storage = config.storageConfig();
    EXPECT_EQ(storage.kind, StorageKind::FileMemory);
    EXPECT_EQ(storage.root_directory, "/tmp/pc");
    EXPECT_EQ(storage.key_prefix, "pc");
    EXPECT_EQ(storage.lock_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(storage.redis_connect_timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(storage.redis_command_timeout, std::chrono::milliseconds(700));
}

TEST_F(LoadConfigurationTest, ToStringListsSettings) {
    AppConfig config = Utils::loadConfiguration({{"storage_kind", "redis"}});
    const std::string text = config.to_string();
    EXPECT_NE(text.find("storage_kind: redis"), std::string::npos);
    EXPECT_NE(text.find("key_prefix: pc"), std::string::npos);
    EXPECT_NE(text.find("lock_timeout_in_millis: 5000"), std::string::npos);
}
