#ifndef SQUARE_SERVER_HPP
#define SQUARE_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// How the server answers one /squareme request: how long it stalls and
// whether it replies with an error body.
struct SquarePlan {
    std::chrono::milliseconds delay{0};
    bool fail = false;
};

struct SquareServerOptions {
    int base_ttl_ms = 100;
    int min_delay_ms = 100;
    int max_delay_ms = 250;
    int error_one_in = 11; // 0 never fails, 1 always fails

    static SquareServerOptions fromConfig(const AppConfig& config) {
        SquareServerOptions options;
        options.base_ttl_ms = config.square_base_ttl_ms;
        options.min_delay_ms = config.square_min_delay_ms;
        options.max_delay_ms = config.square_max_delay_ms;
        options.error_one_in = config.square_error_one_in;
        return options;
    }
};

class SquareServer;

// One connection. Reads requests, stalls for the planned delay on a timer,
// then writes the reply. Loops while the client keeps the connection alive.
class SquareServerSession : public std::enable_shared_from_this<SquareServerSession> {
public:
    SquareServerSession(tcp::socket&& socket,
                        std::shared_ptr<SquareServer> server,
                        std::shared_ptr<ILogger> logger);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void on_delay(beast::error_code ec);
    void do_write();
    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    net::steady_timer delay_timer_;
    SquarePlan plan_;
    std::shared_ptr<SquareServer> server_;
    std::shared_ptr<ILogger> logger_;
};

// Stand-in for the slow, flaky backend the demo client memoizes.
// GET /squareme?num=N answers {"msg": N*N, "ttl(ms)": base_ttl + delay}
// after a random delay, or {"error": "something went wrong"} about once
// every error_one_in requests.
class SquareServer : public std::enable_shared_from_this<SquareServer> {
public:
    // Throws std::runtime_error if the endpoint cannot be bound.
    SquareServer(net::io_context& ioc,
                 tcp::endpoint endpoint,
                 SquareServerOptions options,
                 std::shared_ptr<ILogger> logger);

    void run();
    void stop();

    unsigned short port() const { return acceptor_.local_endpoint().port(); }
    std::size_t requestCount() const { return requests_.load(); }
    const SquareServerOptions& options() const { return options_; }

    // Draws the delay and failure decision for the next request.
    SquarePlan plan();

    // "num" from the query string of target; nullopt if missing or not an integer.
    static std::optional<int> parseNum(std::string_view target);

    // Reply for target under plan. Does not set version or keep-alive.
    static http::response<http::string_body> buildResponse(std::string_view target,
                                                          const SquarePlan& plan,
                                                          int base_ttl_ms);

private:
    friend class SquareServerSession;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    SquareServerOptions options_;
    std::shared_ptr<ILogger> logger_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
    std::atomic<std::size_t> requests_{0};
};

#endif // SQUARE_SERVER_HPP
