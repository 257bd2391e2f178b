#include <cstdint>
#include <cstdlib>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/system/system_error.hpp>

#include "cache/CachedFunction.hpp"
#include "cache/ConcurrentTtlCache.hpp"
#include "config/AppConfig.hpp"
#include "core/SquareClientSession.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/NullStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using SquareCache = ConcurrentTtlCache<int, uint32_t>;

// STATSD_SERVER=<host>:<port> enables metrics; anything else falls back to the no-op client.
std::shared_ptr<IStatsDClient> initializeStatsDClient(std::shared_ptr<ILogger> logger_) {
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value == nullptr || std::string(statsd_server_value).empty()) {
        logger_->setup("STATSD_SERVER not set. Metrics disabled.");
        return NullStatsDClient::shared();
    }

    try {
        return std::make_shared<StatsDClient>(logger_, statsd_server_value);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()));
    }
    return NullStatsDClient::shared();
}

// Prints "the square of <num> is <result>" for one memoized call.
void printSquare(const CachedFunction<int, uint32_t>& square, int num, std::shared_ptr<ILogger> logger_) {
    auto future = square.fetch(num);
    try {
        uint32_t value = future.get();
        std::cout << "the square of " << num << " is " << value << std::endl;
    } catch (const boost::system::system_error& e) {
        std::cout << "the square of " << num << " failed: " << e.code().message() << std::endl;
        logger_->warn("Square request for " + std::to_string(num) + " failed: " + e.what());
    }
}

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
        const std::map<std::string, std::string>& startupArguments = *parsedArgsOpt;

        AppConfig config_ = Utils::loadConfiguration(startupArguments);

        std::shared_ptr<ConsoleLogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setLogLevel(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        int num = 30;
        auto num_it = startupArguments.find("num");
        if (num_it != startupArguments.end()) {
            auto parsed = Utils::stringToInt(num_it->second);
            if (!parsed) {
                logger_->error("Invalid integer for num: " + num_it->second);
                return 1;
            }
            num = *parsed;
        }

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(logger_);

        auto cache = std::make_shared<SquareCache>(config_.cacheOptions(), logger_, statsd_client);

        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);
        std::thread io_thread([&ioc, logger_]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                logger_->error("Exception in Boost.Asio I/O thread: " + std::string(e.what()));
            }
        });

        const std::chrono::milliseconds timeout(config_.request_timeout_ms);
        auto square = cacheFn(
            cache,
            [&ioc, &config_, timeout, logger_](const int& key, CachedFunction<int, uint32_t>::ProducerHandler handler) {
                std::make_shared<SquareClientSession>(
                    ioc, config_.backend_host, config_.backend_port, key, timeout, std::move(handler), logger_)->run();
            },
            logger_,
            statsd_client);

        // The second call is answered from the cache while the TTL lasts.
        printSquare(square, num, logger_);
        printSquare(square, num, logger_);

        work_guard.reset();
        ioc.stop();
        if (io_thread.joinable()) io_thread.join();
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
