#ifndef EXPIRATIONSWEEPER_HPP
#define EXPIRATIONSWEEPER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace net = boost::asio;

// Periodically removes expired entries from a cache.
//
// Runs on the caller's io_context; every tick calls purgeExpired() and re-arms
// the timer. Lazy expiration in the cache stays authoritative, this only bounds
// memory held by entries nobody reads. A failing tick is logged and counted and
// the loop carries on.
//
// Must be owned by a std::shared_ptr: pending timer handlers keep it alive.
class ExpirationSweeper : public std::enable_shared_from_this<ExpirationSweeper> {
public:
    // Throws std::invalid_argument for a null dependency or a non-positive interval.
    ExpirationSweeper(net::io_context& ioc,
                      std::shared_ptr<ISweepable> target,
                      std::chrono::milliseconds interval,
                      std::shared_ptr<ILogger> logger,
                      std::shared_ptr<IStatsDClient> statsd_client);

    ExpirationSweeper(const ExpirationSweeper&) = delete;
    ExpirationSweeper& operator=(const ExpirationSweeper&) = delete;

    // Arms the first tick. Calling it again, or after cancel(), does nothing.
    void start();
    // Stops the tick loop. Idempotent and safe from any thread.
    void cancel();
    // Runs one sweep on the calling thread.
    void sweepOnce();

    bool isRunning() const { return started_ && !cancelled_; }
    uint64_t tickCount() const { return ticks_; }
    uint64_t failureCount() const { return failures_; }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void arm();
    void onTick(const boost::system::error_code& ec);

    net::strand<net::io_context::executor_type> strand_;
    net::steady_timer timer_;
    std::shared_ptr<ISweepable> target_;
    const std::chrono::milliseconds interval_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failures_{0};
};

#endif // EXPIRATIONSWEEPER_HPP
