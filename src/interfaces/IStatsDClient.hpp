#pragma once

#include <chrono>
#include <string>

// StatsD-style metrics sink for the cache counters in MetricsDefinitions.
// Implementations must be safe to call from any thread.
class IStatsDClient {
public:
    virtual ~IStatsDClient() = default;

    virtual void increment(const std::string& key, int value = 1) = 0;
    virtual void decrement(const std::string& key, int value = 1) = 0;
    virtual void gauge(const std::string& key, double value) = 0;
    virtual void timing(const std::string& key, std::chrono::milliseconds value) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;

    // Reports the time from start until now, e.g. one backing store load.
    void timingSince(const std::string& key, std::chrono::steady_clock::time_point start) {
        timing(key, std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start));
    }
};
