#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

#include "StatsDClient.hpp"

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address)
    : logger_(logger),
      batch_size_(config.metrics_batch_size > 0 ? static_cast<size_t>(config.metrics_batch_size) : 1),
      socket_(ioc_) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    std::string port = statsd_address.substr(colon_pos + 1);
    try {
        int port_number = std::stoi(port);
        if (port_number <= 0 || port_number > 65535) {
            throw std::out_of_range("port outside 1-65535");
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }

    boost::system::error_code ec;
    net::ip::udp::resolver resolver(ioc_);
    auto results = resolver.resolve(net::ip::udp::v4(), host, port, ec);
    if (ec || results.empty()) {
        throw std::runtime_error("Failed to resolve STATSD_SERVER " + statsd_address + ": " + ec.message());
    }
    endpoint_ = *results.begin();

    socket_.open(net::ip::udp::v4(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open UDP socket for StatsD: " + ec.message());
    }
    pending_.reserve(batch_size_);
    logger_->setup("StatsDClient sending to " + host + ":" + port + " in batches of " + std::to_string(batch_size_));
}

StatsDClient::~StatsDClient() {
    flush();
    boost::system::error_code ec;
    socket_.close(ec);
}

void StatsDClient::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flushLocked();
}

void StatsDClient::flushLocked() {
    if (pending_.empty()) {
        return;
    }
    std::string payload;
    for (const auto& line : pending_) {
        if (!payload.empty()) {
            payload += '\n';
        }
        payload += line;
    }
    pending_.clear();

    boost::system::error_code ec;
    socket_.send_to(net::buffer(payload), endpoint_, 0, ec);
    if (ec) {
        logger_->error("StatsDClient: Failed to send UDP message: " + ec.message());
    }
}

void StatsDClient::send(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(message);
    if (pending_.size() >= batch_size_) {
        flushLocked();
    }
}

void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    std::stringstream ss;
    ss << key << ":" << value << "|s";
    send(ss.str());
}
