#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp> // For graceful shutdown

#include "config/AppConfig.hpp"
#include "core/SquareServer.hpp"
#include "logging/ConsoleLogger.hpp"
#include "utils/Utils.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        auto parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(*parsedArgsOpt);

        std::shared_ptr<ConsoleLogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setLogLevel(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        net::io_context ioc;

        boost::system::error_code ec;
        auto address = net::ip::make_address(config_.backend_host == "localhost" ? "127.0.0.1" : config_.backend_host, ec);
        if (ec) {
            logger_->error("Invalid listen address " + config_.backend_host + ": " + ec.message());
            return 1;
        }
        tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.backend_port));

        auto server = std::make_shared<SquareServer>(ioc, endpoint, SquareServerOptions::fromConfig(config_), logger_);
        server->run();
        logger_->setup("Square server listening on " + address.to_string() + ":" + std::to_string(server->port()) +
                       Constants::SQUARE_PATH);

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](beast::error_code const&, int signal_number) {
            logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
            server->stop();
            ioc.stop();
        });

        std::vector<std::thread> ioc_threads;
        int extra_threads = config_.server_threads > 1 ? config_.server_threads - 1 : 0;
        for (int i = 0; i < extra_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in Boost.Asio I/O thread: " + std::string(e.what()));
                }
            });
        }

        ioc.run();

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger_->setup("Square server stopped.");
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
