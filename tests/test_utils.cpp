// test/test_utils.cpp
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp" // Include the header with the class definition

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"key1=value1", "key2=value2"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at("key1"), "value1");
    EXPECT_EQ(result->at("key2"), "value2");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    std::vector<std::string> args = {"keyvalue"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    std::vector<std::string> args = {"=value"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    // The current implementation returns nullopt if *any* arg is invalid
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

// --- Tests for loadConfiguration ---

namespace {
    // Silences std::cerr for the lifetime of the object and keeps what was written.
    class CerrCapture {
    public:
        CerrCapture() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
        ~CerrCapture() { std::cerr.rdbuf(old_); }
        std::string str() const { return captured_.str(); }

    private:
        std::ostringstream captured_;
        std::streambuf* old_;
    };

    const std::vector<std::string> NO_CONFIG_FILES = {"/nonexistent/memocache.config"};

    std::string writeConfigFile(const std::string& name, const std::string& contents) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }
}

TEST(UtilsTest, LoadConfigurationDefaults) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {};
    CacheConfig config = Utils::loadConfiguration(args, NO_CONFIG_FILES);
    EXPECT_EQ(config.max_size, 128);
    EXPECT_EQ(config.ttl_in_millis, 0);
    EXPECT_FALSE(config.ttl().has_value());
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
    EXPECT_FALSE(config.emit_metrics);
    EXPECT_EQ(config.num_io_threads, 2);
    EXPECT_NE(capture.str().find("Configuration file not found"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationCommandLineOverrides) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {
        {"max_size", "16"}, {"ttl_ms", "2500"}, {"log_level", "DEBUG"}, {"io_threads", "4"}, {"metrics", "1"}};
    CacheConfig config = Utils::loadConfiguration(args, NO_CONFIG_FILES);
    EXPECT_EQ(config.max_size, 16);
    EXPECT_EQ(config.ttl_in_millis, 2500);
    ASSERT_TRUE(config.ttl().has_value());
    EXPECT_EQ(config.ttl()->count(), 2500);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(config.num_io_threads, 4);
    EXPECT_TRUE(config.emit_metrics);
}

TEST(UtilsTest, LoadConfigurationInvalidMaxSizeKeepsDefault) {
    CerrCapture capture;
    CacheConfig config = Utils::loadConfiguration({{"max_size", "0"}}, NO_CONFIG_FILES);
    EXPECT_EQ(config.max_size, 128);
    config = Utils::loadConfiguration({{"max_size", "abc"}}, NO_CONFIG_FILES);
    EXPECT_EQ(config.max_size, 128);
    EXPECT_NE(capture.str().find("Invalid max_size"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationInvalidTtlKeepsDefault) {
    CerrCapture capture;
    CacheConfig config = Utils::loadConfiguration({{"ttl_ms", "-10"}}, NO_CONFIG_FILES);
    EXPECT_EQ(config.ttl_in_millis, 0);
    EXPECT_NE(capture.str().find("Invalid ttl_ms"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationInvalidLogLevelKeepsDefault) {
    CerrCapture capture;
    CacheConfig config = Utils::loadConfiguration({{"log_level", "LOUD"}}, NO_CONFIG_FILES);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
    EXPECT_NE(capture.str().find("Invalid log level: LOUD"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationInvalidMetricsFlagKeepsDefault) {
    CerrCapture capture;
    CacheConfig config = Utils::loadConfiguration({{"metrics", "yes"}}, NO_CONFIG_FILES);
    EXPECT_FALSE(config.emit_metrics);
}

TEST(UtilsTest, LoadConfigurationStatsDBatching) {
    CacheConfig defaults = Utils::loadConfiguration({}, NO_CONFIG_FILES);
    EXPECT_EQ(defaults.metrics_batch_size, 100);
    EXPECT_EQ(defaults.metrics_send_interval_in_millis, 1000);

    CacheConfig config = Utils::loadConfiguration(
        {{"metrics_batch_size", "0"}, {"metrics_send_interval", "250"}}, NO_CONFIG_FILES);
    EXPECT_EQ(config.metrics_batch_size, 0);
    EXPECT_EQ(config.metrics_send_interval_in_millis, 250);
}

TEST(UtilsTest, LoadConfigurationInvalidStatsDBatchingKeepsDefault) {
    CerrCapture capture;
    CacheConfig config = Utils::loadConfiguration(
        {{"metrics_batch_size", "-1"}, {"metrics_send_interval", "soon"}}, NO_CONFIG_FILES);
    EXPECT_EQ(config.metrics_batch_size, 100);
    EXPECT_EQ(config.metrics_send_interval_in_millis, 1000);
    EXPECT_NE(capture.str().find("Invalid metrics_batch_size"), std::string::npos);
    EXPECT_NE(capture.str().find("Invalid metrics_send_interval"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationIgnoresUnknownArguments) {
    CerrCapture capture;
    CacheConfig config = Utils::loadConfiguration({{"port", "9000"}}, NO_CONFIG_FILES);
    EXPECT_EQ(config.max_size, 128);
    EXPECT_NE(capture.str().find("Ignoring unknown argument 'port'"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationReadsFirstConfigFileFound) {
    CerrCapture capture;
    std::string path = writeConfigFile("memocache_utils_test.config",
                                       "# engine\n"
                                       "max_size = 32\n"
                                       "\n"
                                       "ttl_ms=750\n"
                                       "log_level = INFO\n"
                                       "colour = blue\n");
    std::string ignored = writeConfigFile("memocache_utils_test_second.config", "max_size=1\n");

    CacheConfig config = Utils::loadConfiguration({}, {"/nonexistent/memocache.config", path, ignored});
    EXPECT_EQ(config.max_size, 32);
    EXPECT_EQ(config.ttl_in_millis, 750);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::INFO);
    EXPECT_NE(capture.str().find("Unknown key 'colour'"), std::string::npos);

    std::remove(path.c_str());
    std::remove(ignored.c_str());
}

TEST(UtilsTest, LoadConfigurationCommandLineBeatsConfigFile) {
    CerrCapture capture;
    std::string path = writeConfigFile("memocache_utils_test_override.config", "max_size=32\nttl_ms=750\n");

    CacheConfig config = Utils::loadConfiguration({{"max_size", "8"}}, {path});
    EXPECT_EQ(config.max_size, 8);
    EXPECT_EQ(config.ttl_in_millis, 750);

    std::remove(path.c_str());
}

TEST(UtilsTest, ApplySettingReportsUnknownKeys) {
    CacheConfig config;
    EXPECT_TRUE(Utils::applySetting(config, "max_size", "5", "test"));
    EXPECT_EQ(config.max_size, 5);
    EXPECT_FALSE(Utils::applySetting(config, "frontend_port", "9000", "test"));
}

// --- Tests for helpers ---

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("INFO"), LogUtils::LogLevel::INFO);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("CERROR"), LogUtils::LogLevel::CERROR);
    EXPECT_THROW(Utils::stringToLogLevel("debug"), std::invalid_argument);
}

TEST(UtilsTest, StringToInt) {
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_EQ(Utils::stringToInt("-7"), -7);
    EXPECT_FALSE(Utils::stringToInt("4x").has_value());
    EXPECT_FALSE(Utils::stringToInt("").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999999").has_value());
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  max_size \t"), "max_size");
    EXPECT_EQ(Utils::trim("value"), "value");
    EXPECT_EQ(Utils::trim(" \t\r\n"), "");
}
