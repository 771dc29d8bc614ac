#include "ExpirationSweeper.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>

#include "../config/AppConfig.hpp"

ExpirationSweeper::ExpirationSweeper(net::io_context& ioc,
                                     std::shared_ptr<ISweepable> target,
                                     std::chrono::milliseconds interval,
                                     std::shared_ptr<ILogger> logger,
                                     std::shared_ptr<IStatsDClient> statsd_client)
    : strand_(net::make_strand(ioc)),
      timer_(strand_),
      target_(target),
      interval_(interval),
      logger_(logger),
      statsd_client_(statsd_client) {
    if (!target_) {
        throw std::invalid_argument("Sweep target cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ExpirationSweeper");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for ExpirationSweeper");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Sweep interval must be positive, got " + std::to_string(interval_.count()) + "ms");
    }
}

void ExpirationSweeper::start() {
    if (cancelled_) {
        logger_->warn("ExpirationSweeper::start called after cancel, ignoring.");
        return;
    }
    if (started_.exchange(true)) {
        return;
    }
    logger_->setup("ExpirationSweeper started, interval " + std::to_string(interval_.count()) + "ms");
    net::dispatch(strand_, [self = shared_from_this()]() { self->arm(); });
}

void ExpirationSweeper::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    logger_->info("ExpirationSweeper cancelled after " + std::to_string(ticks_.load()) + " ticks.");
    net::dispatch(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void ExpirationSweeper::arm() {
    if (cancelled_) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait(net::bind_executor(strand_,
        [self = shared_from_this()](const boost::system::error_code& ec) { self->onTick(ec); }));
}

void ExpirationSweeper::onTick(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || cancelled_) {
        logger_->debug("ExpirationSweeper timer stopped.");
        return;
    }
    if (ec) {
        logger_->error("ExpirationSweeper timer error: " + ec.message());
    } else {
        sweepOnce();
    }
    arm();
}

void ExpirationSweeper::sweepOnce() {
    ++ticks_;
    try {
        size_t removed = target_->purgeExpired();
        if (removed > 0) {
            statsd_client_->increment(MetricsDefinitions::SWEEP_REMOVED, static_cast<int>(removed));
        }
        size_t remaining = target_->size();
        statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(remaining));
        if (logger_->isDebugEnabled()) {
            logger_->debug("Sweep removed " + std::to_string(removed) + " expired entries, "
                + std::to_string(remaining) + " remain.");
        }
    } catch (const std::exception& e) {
        ++failures_;
        logger_->error("Exception caught during expiration sweep: " + std::string(e.what()));
        statsd_client_->increment(MetricsDefinitions::SWEEP_ERROR);
    } catch (...) {
        ++failures_;
        logger_->error("Unknown exception caught during expiration sweep.");
        statsd_client_->increment(MetricsDefinitions::SWEEP_ERROR);
    }
}
