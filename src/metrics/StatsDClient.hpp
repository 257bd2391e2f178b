#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Fire-and-forget StatsD client. Each metric is one UDP datagram in the
// plain StatsD line format, e.g. "ttlcache.hit:1|c".
class StatsDClient : public IStatsDClient {
public:
    // stats_server_endpoint is "<host>:<port>". Throws std::runtime_error if it
    // is malformed or the host cannot be resolved.
    StatsDClient(std::shared_ptr<ILogger> logger, const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

    // Builds the wire line for one metric. Exposed for tests.
    static std::string formatLine(const std::string& key, const std::string& value, const std::string& type);

private:
    void send(const std::string& message);

    std::shared_ptr<ILogger> logger_;
    boost::asio::io_context ioc_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint endpoint_;
    std::mutex send_mutex_;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
};
