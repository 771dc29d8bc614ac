// tests/test_logging.cpp
#include <memory>
#include <regex>
#include <sstream>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/logging/ComponentLogger.hpp"
#include "../src/logging/ConsoleLogger.hpp"

using ::testing::NiceMock;
using ::testing::Return;

// --- ConsoleLogger ---

class ConsoleLoggerTest : public ::testing::Test {
protected:
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(ConsoleLoggerTest, LinesCarryPrefixAndElapsedMillis) {
    ConsoleLogger logger(LogUtils::LogLevel::DEBUG, out, err);
    logger.info("cache created");

    EXPECT_TRUE(std::regex_match(out.str(), std::regex(R"(\[Info\] \+\d+ms cache created\n)"))) << out.str();
    EXPECT_TRUE(err.str().empty());
}

TEST_F(ConsoleLoggerTest, ErrorsGoToErrorStream) {
    ConsoleLogger logger(LogUtils::LogLevel::DEBUG, out, err);
    logger.error("loader failed");

    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("[Error] "), std::string::npos);
    EXPECT_NE(err.str().find("loader failed"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, LevelFiltersLowerLevelsButNotSetup) {
    ConsoleLogger logger(LogUtils::LogLevel::WARN, out, err);
    logger.debug("hidden debug");
    logger.info("hidden info");
    logger.warn("shown warning");
    logger.setup("shown setup");

    EXPECT_EQ(out.str().find("hidden"), std::string::npos);
    EXPECT_NE(out.str().find("[Warning] "), std::string::npos);
    EXPECT_NE(out.str().find("[Setup] "), std::string::npos);
    EXPECT_FALSE(logger.isDebugEnabled());
}

TEST(ConsoleLoggerSingletonTest, GetInstanceReturnsSameLogger) {
    auto first = ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR);
    auto second = ConsoleLogger::getInstance(LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(first, second);
    EXPECT_EQ(second->getLogLevel(), LogUtils::LogLevel::CERROR);
}

// --- ComponentLogger ---

TEST(ComponentLoggerTest, PrefixesEveryLevelWithComponent) {
    auto inner = std::make_shared<NiceMock<MockLogger>>();
    ComponentLogger logger("sweeper", inner);

    EXPECT_CALL(*inner, info("[sweeper] tick"));
    EXPECT_CALL(*inner, debug("[sweeper] removed 3"));
    EXPECT_CALL(*inner, warn("[sweeper] slow tick"));
    EXPECT_CALL(*inner, error("[sweeper] purge failed"));
    EXPECT_CALL(*inner, setup("[sweeper] started"));

    logger.info("tick");
    logger.debug("removed 3");
    logger.warn("slow tick");
    logger.error("purge failed");
    logger.setup("started");
}

TEST(ComponentLoggerTest, ForwardsLevelToInnerLogger) {
    auto inner = std::make_shared<NiceMock<MockLogger>>();
    ON_CALL(*inner, getLogLevel()).WillByDefault(Return(LogUtils::LogLevel::DEBUG));
    auto logger = makeComponentLogger("cache-aside", inner);

    EXPECT_TRUE(logger->isDebugEnabled());
}

TEST(ComponentLoggerTest, WritesThroughToConsoleLogger) {
    std::ostringstream out;
    std::ostringstream err;
    auto console = std::make_shared<ConsoleLogger>(LogUtils::LogLevel::INFO, out, err);
    auto logger = makeComponentLogger("store", console);

    logger->info("seeded 20 users");
    EXPECT_NE(out.str().find("ms [store] seeded 20 users"), std::string::npos) << out.str();
}

TEST(ComponentLoggerTest, RejectsNullInner) {
    EXPECT_THROW(ComponentLogger("store", nullptr), std::invalid_argument);
}
