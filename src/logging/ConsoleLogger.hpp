#pragma once

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Line logger. Each line carries the level prefix and the milliseconds
// elapsed since the logger was created. Errors go to the error stream.
class ConsoleLogger : public ILogger {
public:
    // Process-wide logger on std::cout / std::cerr. The first call fixes the
    // level; later calls return the same instance.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);

    ConsoleLogger(LogUtils::LogLevel logLevel, std::ostream& out, std::ostream& err)
        : logLevel(logLevel), out_(out), err_(err), start_(std::chrono::steady_clock::now()) {}
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel; }

private:
    void write(std::ostream& out, const std::string& prefix, const std::string& message);

    LogUtils::LogLevel logLevel;
    std::ostream& out_;
    std::ostream& err_;
    const std::chrono::steady_clock::time_point start_;
    std::mutex out_mutex_; // Serializes writes to both streams

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
