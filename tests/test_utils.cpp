// tests/test_utils.cpp
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/config/AppConfig.hpp"
#include "../src/utils/Utils.hpp"

namespace {

// Captures std::cerr for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* old_;
};

struct OpaqueKey {
    int id;
};

} // namespace

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"cache_capacity=10", "log_level=DEBUG"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2u);
    EXPECT_EQ(result->at("cache_capacity"), "10");
    EXPECT_EQ(result->at("log_level"), "DEBUG");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    CerrCapture capture;
    std::vector<std::string> args = {"keyvalue"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    CerrCapture capture;
    std::vector<std::string> args = {"=value"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    CerrCapture capture;
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    EXPECT_FALSE(Utils::parseArguments(args).has_value());
}

// --- Tests for the small parsers ---

TEST(UtilsTest, StringToIntAcceptsWholeNumbersOnly) {
    EXPECT_EQ(Utils::stringToInt("42"), std::optional<int>(42));
    EXPECT_EQ(Utils::stringToInt("-7"), std::optional<int>(-7));
    EXPECT_FALSE(Utils::stringToInt("").has_value());
    EXPECT_FALSE(Utils::stringToInt("12ab").has_value());
    EXPECT_FALSE(Utils::stringToInt("abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999999").has_value());
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("INFO"), LogUtils::LogLevel::INFO);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("CERROR"), LogUtils::LogLevel::CERROR);
    EXPECT_THROW(Utils::stringToLogLevel("verbose"), std::invalid_argument);
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  value \t\r\n"), "value");
    EXPECT_EQ(Utils::trim("value"), "value");
    EXPECT_EQ(Utils::trim(" \t "), "");
    EXPECT_EQ(Utils::trim(""), "");
}

TEST(UtilsTest, DescribeKey) {
    EXPECT_EQ(Utils::describeKey(std::string("user:1")), "user:1");
    EXPECT_EQ(Utils::describeKey(42), "42");
    EXPECT_EQ(Utils::describeKey(OpaqueKey{1}), "<opaque key>");
}

// --- Tests for applySetting ---

TEST(UtilsTest, ApplySettingCacheKeys) {
    AppConfig config;
    EXPECT_TRUE(Utils::applySetting(config, "cache_capacity", "250"));
    EXPECT_TRUE(Utils::applySetting(config, "default_ttl_in_millis", "1500"));
    EXPECT_TRUE(Utils::applySetting(config, "coalesce_loads", "1"));

    EXPECT_EQ(config.cache_capacity, 250);
    EXPECT_EQ(config.defaultTtl(), std::chrono::milliseconds(1500));
    EXPECT_TRUE(config.coalesce_loads);
}

TEST(UtilsTest, ApplySettingSweepIntervalZeroDisablesSweeper) {
    AppConfig config;
    ASSERT_TRUE(config.sweepInterval().has_value());

    EXPECT_TRUE(Utils::applySetting(config, "sweep_interval_in_millis", "0"));
    EXPECT_FALSE(config.sweepInterval().has_value());

    EXPECT_TRUE(Utils::applySetting(config, "sweep_interval_in_millis", "250"));
    EXPECT_EQ(config.sweepInterval(), std::optional<std::chrono::milliseconds>(std::chrono::milliseconds(250)));
}

TEST(UtilsTest, ApplySettingRejectsNegativeSweepInterval) {
    CerrCapture capture;
    AppConfig config;
    EXPECT_FALSE(Utils::applySetting(config, "sweep_interval_in_millis", "-1"));
    EXPECT_EQ(config.sweep_interval_in_millis, std::optional<int>(5000));
}

TEST(UtilsTest, ApplySettingStoreAndMetricsKeys) {
    AppConfig config;
    EXPECT_TRUE(Utils::applySetting(config, "use_redis", "1"));
    EXPECT_TRUE(Utils::applySetting(config, "redis_host", "cache.internal"));
    EXPECT_TRUE(Utils::applySetting(config, "redis_port", "6380"));
    EXPECT_TRUE(Utils::applySetting(config, "store_latency_in_millis", "5"));
    EXPECT_TRUE(Utils::applySetting(config, "demo_worker_threads", "8"));
    EXPECT_TRUE(Utils::applySetting(config, "metrics_batch_size", "10"));
    EXPECT_TRUE(Utils::applySetting(config, "log_level", "INFO"));

    EXPECT_TRUE(config.use_redis);
    EXPECT_EQ(config.redis_host, "cache.internal");
    EXPECT_EQ(config.redis_port, 6380);
    EXPECT_EQ(config.store_latency_in_millis, 5);
    EXPECT_EQ(config.demo_worker_threads, 8);
    EXPECT_EQ(config.metrics_batch_size, 10);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::INFO);
}

TEST(UtilsTest, ApplySettingInvalidValueKeepsPrevious) {
    CerrCapture capture;
    AppConfig config;
    EXPECT_FALSE(Utils::applySetting(config, "cache_capacity", "lots"));
    EXPECT_FALSE(Utils::applySetting(config, "coalesce_loads", "yes"));
    EXPECT_FALSE(Utils::applySetting(config, "log_level", "LOUD"));

    EXPECT_EQ(config.cache_capacity, 1000);
    EXPECT_FALSE(config.coalesce_loads);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::CERROR);
    EXPECT_NE(capture.str().find("Warning: Invalid integer for cache_capacity"), std::string::npos);
}

TEST(UtilsTest, ApplySettingLeavesRangeChecksToCache) {
    // Capacity and TTL are validated, and rejected, when the cache is built.
    AppConfig config;
    EXPECT_TRUE(Utils::applySetting(config, "cache_capacity", "0"));
    EXPECT_TRUE(Utils::applySetting(config, "default_ttl_in_millis", "-5"));
    EXPECT_EQ(config.cache_capacity, 0);
    EXPECT_EQ(config.default_ttl_in_millis, -5);
}

TEST(UtilsTest, ApplySettingUnknownKey) {
    CerrCapture capture;
    AppConfig config;
    EXPECT_FALSE(Utils::applySetting(config, "frontend_port", "9000"));
    EXPECT_NE(capture.str().find("Unknown configuration key: frontend_port"), std::string::npos);
}

// --- Tests for configuration files ---

TEST(UtilsTest, LoadConfigurationFileSkipsCommentsAndBlankLines) {
    std::istringstream file(
        "# cache settings\n"
        "\n"
        "cache_capacity = 64\n"
        "  default_ttl_in_millis=2000  \n"
        "sweep_interval_in_millis = 0\n"
        "log_level = DEBUG\n");
    AppConfig config;
    Utils::loadConfigurationFile(file, config);

    EXPECT_EQ(config.cache_capacity, 64);
    EXPECT_EQ(config.default_ttl_in_millis, 2000);
    EXPECT_FALSE(config.sweep_interval_in_millis.has_value());
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
}

TEST(UtilsTest, LoadConfigurationFileIgnoresMalformedLines) {
    CerrCapture capture;
    std::istringstream file(
        "cache_capacity 64\n"
        "= 12\n"
        "redis_port = 7000\n");
    AppConfig config;
    Utils::loadConfigurationFile(file, config);

    EXPECT_EQ(config.cache_capacity, 1000);
    EXPECT_EQ(config.redis_port, 7000);
    EXPECT_NE(capture.str().find("malformed configuration line"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationArgumentsOverrideEverything) {
    CerrCapture capture;
    std::map<std::string, std::string> args = {
        {"cache_capacity", "7"},
        {"default_ttl_in_millis", "123"},
        {"coalesce_loads", "1"},
    };
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.cache_capacity, 7);
    EXPECT_EQ(config.default_ttl_in_millis, 123);
    EXPECT_TRUE(config.coalesce_loads);
}

TEST(UtilsTest, ConfigToStringListsEffectiveValues) {
    AppConfig config;
    config.sweep_interval_in_millis = std::nullopt;
    std::string dump = config.to_string();

    EXPECT_NE(dump.find("cache_capacity: 1000"), std::string::npos);
    EXPECT_NE(dump.find("sweep_interval_in_millis: disabled"), std::string::npos);
    EXPECT_NE(dump.find("coalesce_loads: false"), std::string::npos);
}
