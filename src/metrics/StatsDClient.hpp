#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace net = boost::asio;

// Sends StatsD line protocol over UDP. Lines are batched (newline separated)
// until metrics_batch_size lines are queued or flush() is called.
class StatsDClient : public IStatsDClient {
public:
    // stats_server_endpoint is "<host>:<port>"; throws std::runtime_error if it cannot be parsed or resolved.
    StatsDClient(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    void flush();

private:
    void send(const std::string& message);
    void flushLocked();

    std::shared_ptr<ILogger> logger_;
    size_t batch_size_;
    net::io_context ioc_;
    net::ip::udp::socket socket_;
    net::ip::udp::endpoint endpoint_;
    std::mutex mutex_;
    std::vector<std::string> pending_;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
