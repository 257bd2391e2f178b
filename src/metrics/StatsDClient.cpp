#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

namespace net = boost::asio;
using udp = net::ip::udp;

StatsDClient::StatsDClient(std::shared_ptr<ILogger> logger, const std::string& statsd_address)
    : logger_(logger), socket_(ioc_) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }

    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    std::string port = statsd_address.substr(colon_pos + 1);
    if (host.empty() || port.empty()) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    boost::system::error_code ec;
    udp::resolver resolver(ioc_);
    auto results = resolver.resolve(udp::v4(), host, port, ec);
    if (ec || results.empty()) {
        throw std::runtime_error("Failed to resolve STATSD_SERVER " + statsd_address + ": " + ec.message());
    }
    endpoint_ = *results.begin();

    socket_.open(udp::v4(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open StatsD socket: " + ec.message());
    }
    logger_->setup("StatsDClient sending to " + endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port()));
}

StatsDClient::~StatsDClient() {
    boost::system::error_code ec;
    socket_.close(ec);
}

std::string StatsDClient::formatLine(const std::string& key, const std::string& value, const std::string& type) {
    return key + ":" + value + "|" + type;
}

void StatsDClient::send(const std::string& message) {
    boost::system::error_code ec;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        socket_.send_to(net::buffer(message), endpoint_, 0, ec);
    }
    if (ec) {
        logger_->error("StatsDClient: Failed to send UDP message: " + ec.message());
    }
}

void StatsDClient::increment(const std::string& key, int value) {
    send(formatLine(key, std::to_string(value), "c"));
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << value;
    send(formatLine(key, ss.str(), "g"));
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(formatLine(key, std::to_string(value.count()), "ms"));
}
