#ifndef TESTMOCKS_HPP
#define TESTMOCKS_HPP

#include <chrono>
#include <string>

#include "gmock/gmock.h"

#include "../src/interfaces/ILogger.hpp"
#include "../src/interfaces/IStatsDClient.hpp"

// --- Mock StatsD client ---
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, decrement, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
};

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

#endif // TESTMOCKS_HPP
