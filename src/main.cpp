#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "cache/LruTtlCache.hpp"
#include "config/AppConfig.hpp"
#include "core/CacheAside.hpp"
#include "core/ExpirationSweeper.hpp"
#include "core/IoThread.hpp"
#include "core/WorkerPool.hpp"
#include "logging/ComponentLogger.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "models/UserRecord.hpp"
#include "store/InMemoryRecordStore.hpp"
#include "store/RedisRecordStore.hpp"
#include "utils/Utils.hpp"

using UserCache = LruTtlCache<std::string, UserRecord>;
using UserCacheAside = CacheAside<std::string, UserRecord>;

namespace {

constexpr int DEMO_USER_COUNT = 20;
constexpr int DEMO_OPERATIONS = 400;

struct RecordStore {
    std::shared_ptr<IRecordLoader<std::string, UserRecord>> loader;
    std::shared_ptr<IRecordWriter<std::string, UserRecord>> writer;
};

UserRecord makeUser(const std::string& id, const std::string& name) {
    UserRecord user;
    user.id = id;
    user.name = name;
    user.email = name + "@example.com";
    return user;
}

} // namespace

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (statsd_server_endpoint.empty()) {
        logger_->setup("STATSD_SERVER not set. Creating DummyStatsDClient instance.");
        return std::make_shared<DummyStatsDClient>();
    }

    try {
        logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);
        return std::make_shared<StatsDClient>(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()) + ". Creating DummyStatsDClient instance.");
    }
    return std::make_shared<DummyStatsDClient>();
}

// --- Helper Function to Initialize the Backing Store ---
RecordStore initializeRecordStore(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    if (config.use_redis) {
        auto redis_store = std::make_shared<RedisRecordStore>(config, makeComponentLogger("store", logger_));
        if (redis_store->isConnected()) {
            logger_->setup("Redis record store connected successfully.");
            return {redis_store, redis_store};
        }
        logger_->error("Redis record store unavailable. Falling back to InMemoryRecordStore.");
    }
    logger_->setup("Creating InMemoryRecordStore with " + std::to_string(config.store_latency_in_millis) + "ms latency.");
    auto memory_store = std::make_shared<InMemoryRecordStore>(
        std::chrono::milliseconds(config.store_latency_in_millis), makeComponentLogger("store", logger_));
    return {memory_store, memory_store};
}

// Capacity 2, TTL 60s: u2 is evicted once u1 has been read and u3 inserted.
bool runEvictionScenario(std::shared_ptr<ILogger> logger_) {
    UserCache cache(2);
    const CacheTtl ttl = std::chrono::milliseconds(60 * 1000);
    cache.set("u1", makeUser("u1", "alice"), ttl);
    cache.set("u2", makeUser("u2", "bob"), ttl);
    auto first = cache.get("u1");
    cache.set("u3", makeUser("u3", "carol"), ttl);
    auto evicted = cache.get("u2");
    auto u1 = cache.get("u1");
    auto u3 = cache.get("u3");

    bool passed = first && first->name == "alice"
        && !evicted
        && u1 && u1->name == "alice"
        && u3 && u3->name == "carol"
        && cache.size() == 2;

    std::stringstream ss;
    ss << "Eviction scenario " << (passed ? "passed" : "FAILED")
       << ". Recency order:";
    for (const auto& key : cache.keysByRecency()) {
        ss << " " << key;
    }
    ss << ". " << cache.stats().to_string();
    if (passed) {
        logger_->setup(ss.str());
    } else {
        logger_->error(ss.str());
    }
    return passed;
}

void runWorkload(UserCacheAside& users, WorkerPool& pool, const std::atomic<bool>& stop_requested,
                 std::shared_ptr<ILogger> logger_) {
    std::atomic<int> reads_found{0};
    std::atomic<int> reads_missing{0};
    std::atomic<int> writes{0};

    for (int op = 0; op < DEMO_OPERATIONS && !stop_requested; ++op) {
        // Ids past DEMO_USER_COUNT exercise NotFound; every tenth operation writes.
        std::string id = "u" + std::to_string(op % (DEMO_USER_COUNT + 5));
        bool is_write = (op % 10 == 0) && (op % (DEMO_USER_COUNT + 5)) < DEMO_USER_COUNT;
        bool queued = pool.enqueue([&users, &reads_found, &reads_missing, &writes, id, is_write, op]() {
            if (is_write) {
                UserRecord updated = makeUser(id, "user" + id.substr(1));
                updated.role = (op % 20 == 0) ? "admin" : "member";
                users.write(updated);
                ++writes;
                return;
            }
            if (users.read(id)) {
                ++reads_found;
            } else {
                ++reads_missing;
            }
        });
        if (!queued) {
            break;
        }
    }
    pool.waitIdle();

    logger_->setup("Workload finished. Reads found: " + std::to_string(reads_found.load())
        + ", reads not found: " + std::to_string(reads_missing.load())
        + ", writes: " + std::to_string(writes.load())
        + ", failed tasks: " + std::to_string(pool.failedTasks()));
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        RecordStore store = initializeRecordStore(config_, logger_);

        // Invalid capacity or TTL throws here, before any work starts.
        auto cache = std::make_shared<UserCache>(config_.cache_capacity);
        UserCacheAside users(cache, store.loader, store.writer, userKey, config_.defaultTtl(),
                             makeComponentLogger("cache-aside", logger_), statsd_client, config_.coalesce_loads);
        logger_->setup("Cache created with capacity " + std::to_string(cache->capacity()));

        for (int i = 0; i < DEMO_USER_COUNT; ++i) {
            store.writer->persist(makeUser("u" + std::to_string(i), "user" + std::to_string(i)));
        }

        // --- Boost.Asio io_context for the sweeper and signal handling ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        std::shared_ptr<ExpirationSweeper> sweeper;
        if (auto interval = config_.sweepInterval()) {
            sweeper = std::make_shared<ExpirationSweeper>(ioc, cache, *interval,
                                                          makeComponentLogger("sweeper", logger_), statsd_client);
            sweeper->start();
        } else {
            logger_->setup("Expiration sweeper disabled; relying on lazy expiration.");
        }

        std::atomic<bool> stop_requested{false};
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&stop_requested, logger_](const boost::system::error_code& ec, int signal_number) {
                if (ec) {
                    return; // cancelled at normal shutdown
                }
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Stopping workload...");
                stop_requested = true;
            });

        IoThread io_thread(ioc, logger_);

        bool scenario_passed = runEvictionScenario(logger_);

        {
            WorkerPool pool(static_cast<size_t>(std::max(1, config_.demo_worker_threads)),
                            makeComponentLogger("workers", logger_));
            runWorkload(users, pool, stop_requested, logger_);
        }

        logger_->setup("Cache stats: " + users.stats().to_string() + ", size: " + std::to_string(cache->size()));

        if (sweeper) {
            sweeper->cancel();
            logger_->setup("Sweeper ran " + std::to_string(sweeper->tickCount()) + " ticks, "
                + std::to_string(sweeper->failureCount()) + " failed.");
        }
        boost::system::error_code ignored;
        signals.cancel(ignored);
        work_guard.reset();
        io_thread.join();
        logger_->setup("Shutdown complete.");
        return scenario_passed ? 0 : 1;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    } catch (...) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unknown error occurred. Exiting.");
        return 1;
    }
}
