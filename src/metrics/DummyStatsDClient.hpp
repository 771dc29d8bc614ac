#pragma once

#include <chrono>
#include <string>

#include "../interfaces/IStatsDClient.hpp"

// Used when no STATSD_SERVER is configured; drops every metric.
class DummyStatsDClient : public IStatsDClient {
public:
    DummyStatsDClient() = default;
    ~DummyStatsDClient() override = default;

    void increment(const std::string& /* key */, int /* value */ = 1) override {}
    void decrement(const std::string& /* key */, int /* value */ = 1) override {}
    void gauge(const std::string& /* key */, double /* value */) override {}
    void timing(const std::string& /* key */, std::chrono::milliseconds /* value */) override {}
    void set(const std::string& /* key */, const std::string& /* value */) override {}
};
