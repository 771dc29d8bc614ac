#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <sstream>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "cache.hit";
    static std::string CACHE_MISS = "cache.miss";

    // Loader answered NotFound; nothing was cached.
    static std::string LOAD_NOT_FOUND = "cache.load_not_found";
    static std::string LOAD_ERROR = "cache.load_error";
    static std::string WRITE_ERROR = "cache.write_error";

    static std::string INVALIDATE = "cache.invalidate";

    static std::string SWEEP_REMOVED = "cache.sweep.removed";
    static std::string SWEEP_ERROR = "cache.sweep.error";

    static std::string CACHE_SIZE = "cache.size";
    static std::string STORE_LOAD_TIME = "store.load_time";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "cacheaside.config";
    static constexpr auto USER_KEY_PREFIX = "user:";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    int cache_capacity;
    int default_ttl_in_millis;
    // Absent disables the expiration sweeper.
    std::optional<int> sweep_interval_in_millis;
    bool coalesce_loads;

    // Backing store
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int store_latency_in_millis;

    // Demo workload
    int demo_worker_threads;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;

    AppConfig() {
        // --- Set Defaults  ---
        cache_capacity = 1000;
        default_ttl_in_millis = 60 * 1000; // 1 minute
        sweep_interval_in_millis = 5 * 1000;
        coalesce_loads = false;

        use_redis = false;
        redis_host = "localhost";
        redis_port = 6379;
        store_latency_in_millis = 50;

        demo_worker_threads = 4;

        log_level = LogUtils::LogLevel::CERROR; // Default log level
        metrics_batch_size = 100;
    }

    std::chrono::milliseconds defaultTtl() const {
        return std::chrono::milliseconds(default_ttl_in_millis);
    }

    std::optional<std::chrono::milliseconds> sweepInterval() const {
        if (!sweep_interval_in_millis) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(*sweep_interval_in_millis);
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "cache_capacity: " << cache_capacity << std::endl
            << "default_ttl_in_millis: " << default_ttl_in_millis << std::endl
            << "sweep_interval_in_millis: "
            << (sweep_interval_in_millis ? std::to_string(*sweep_interval_in_millis) : "disabled") << std::endl
            << "coalesce_loads: " << std::boolalpha << coalesce_loads << std::noboolalpha << std::endl
            << "// --- Backing Store --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "store_latency_in_millis: " << store_latency_in_millis << std::endl
            << "demo_worker_threads: " << demo_worker_threads << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_batch_size: " << metrics_batch_size << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
