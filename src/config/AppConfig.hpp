#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <sstream>

#include "../cache/CacheOptions.hpp"

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
    static std::string CACHE_HIT = "ttlcache.hit";

    static std::string CACHE_MISS = "ttlcache.miss";

    static std::string CACHE_EVICTION = "ttlcache.eviction";

    static std::string CACHE_EXPIRED = "ttlcache.expired";

    static std::string PRODUCER_ERROR = "ttlcache.producer_error";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "ttlcache.config";
    static constexpr auto SQUARE_PATH = "/squareme";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    int cache_capacity; // negative means unbounded; 0 keeps at most one entry
    int expiry_granularity_ms;
    OverwritePolicy overwrite_policy;

    // Square backend used by the demo client
    std::string backend_host;
    int backend_port;
    int request_timeout_ms;

    // Square backend server (ttlcache_square_server), listening on backend_host:backend_port
    int server_threads;
    int square_base_ttl_ms;
    int square_min_delay_ms;
    int square_max_delay_ms;
    int square_error_one_in; // 0 disables simulated errors

    // Logging Level
    LogUtils::LogLevel log_level;

    AppConfig() {
        // --- Set Defaults  ---
        cache_capacity = -1;
        expiry_granularity_ms = 10;
        overwrite_policy = OverwritePolicy::AlwaysReplace;

        backend_host = "localhost";
        backend_port = 5000;
        request_timeout_ms = 2000;

        server_threads = 2;
        square_base_ttl_ms = 100;
        square_min_delay_ms = 100;
        square_max_delay_ms = 250;
        square_error_one_in = 11;

        log_level = LogUtils::LogLevel::CERROR; // Default log level
    }

    CacheOptions cacheOptions() const {
        CacheOptions options;
        if (cache_capacity >= 0) {
            options.capacity = static_cast<std::size_t>(cache_capacity);
        }
        options.expiry_granularity = std::chrono::milliseconds(expiry_granularity_ms);
        options.overwrite_policy = overwrite_policy;
        return options;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "cache_capacity: " << (cache_capacity >= 0 ? std::to_string(cache_capacity) : "unbounded") << std::endl
            << "expiry_granularity_ms: " << expiry_granularity_ms << std::endl
            << "overwrite_policy: " << (overwrite_policy == OverwritePolicy::KeepLongest ? "keep_longest" : "replace") << std::endl
            << "// --- Square Backend --- //" << std::endl
            << "backend_host: " << backend_host << std::endl
            << "backend_port: " << backend_port << std::endl
            << "request_timeout_ms: " << request_timeout_ms << std::endl
            << "server_threads: " << server_threads << std::endl
            << "square_base_ttl_ms: " << square_base_ttl_ms << std::endl
            << "square_delay_ms: " << square_min_delay_ms << "-" << square_max_delay_ms << std::endl
            << "square_error_one_in: " << square_error_one_in << std::endl
            << "// --- Logging --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
