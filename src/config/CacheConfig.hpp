#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <chrono>
#include <optional>
#include <sstream>
#include <string>

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
    static std::string CACHE_HIT = "memocache.hit";
    static std::string CACHE_MISS = "memocache.miss";
    static std::string CACHE_EVICTION = "memocache.eviction";
    static std::string CACHE_EXPIRED = "memocache.expired";
    static std::string CACHE_SIZE = "memocache.size";

    static std::string FLIGHT_JOINED = "memocache.flight_joined";
    static std::string FLIGHT_CANCELLED = "memocache.flight_cancelled";

    static std::string COMPUTATION_FAILED = "memocache.computation_failed";
    static std::string COMPUTE_TIME = "memocache.compute_time";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static constexpr auto CONFIG_FILE_NAME = "memocache.config";
};

// --- Configuration Struct ---
class CacheConfig {
public:
    // Engine
    int max_size;
    int ttl_in_millis; // 0 disables expiry

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    bool emit_metrics; // Log StatsD lines when no STATSD_SERVER is set
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Demo executable
    int num_io_threads;

    CacheConfig() {
        // --- Set Defaults  ---
        max_size = 128;
        ttl_in_millis = 0;
        log_level = LogUtils::LogLevel::CERROR;
        emit_metrics = false;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
        num_io_threads = 2;
    }

    std::optional<std::chrono::milliseconds> ttl() const {
        if (ttl_in_millis == 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(ttl_in_millis);
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "max_size: " << max_size << std::endl
            << "ttl_in_millis: " << ttl_in_millis << (ttl_in_millis == 0 ? " (no expiry)" : "") << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "emit_metrics: " << std::boolalpha << emit_metrics << std::noboolalpha << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // CACHECONFIG_HPP
