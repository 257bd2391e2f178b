#ifndef SQUARE_CLIENT_SESSION_HPP
#define SQUARE_CLIENT_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "SquareErrors.hpp"
#include "../cache/CachedFunction.hpp" // For ProducedValue
#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/SquareResponse.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One GET /squareme?num=<n> round trip against the square backend.
// Create with std::make_shared and call run(); on_complete fires exactly once,
// either with the square and its TTL or with an error code.
class SquareClientSession : public std::enable_shared_from_this<SquareClientSession> {
public:
    using CompletionHandler = std::function<void(beast::error_code, ProducedValue<uint32_t>)>;

    SquareClientSession(
        net::io_context& ioc,
        std::string host,
        int port,
        int num,
        std::chrono::milliseconds timeout,
        CompletionHandler on_complete,
        std::shared_ptr<ILogger> logger = nullptr)
        : strand_(net::make_strand(ioc)),
          resolver_(strand_),
          stream_(strand_),
          host_(std::move(host)),
          port_(port),
          on_complete_(std::move(on_complete)),
          logger_(logger),
          timer_(strand_) {
        req_.version(11); // HTTP/1.1
        req_.method(http::verb::get);
        req_.target(targetFor(num));
        req_.set(http::field::host, host_);
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req_.set(http::field::accept, "application/json");
        req_.prepare_payload();

        timer_.expires_after(timeout);
    }

    static std::string targetFor(int num) {
        return std::string(Constants::SQUARE_PATH) + "?num=" + std::to_string(num);
    }

    // Resolver, socket and timer share one strand, so the timeout never
    // touches the socket while a read or connect handler is using it.
    void run() {
        net::dispatch(strand_, beast::bind_front_handler(&SquareClientSession::start, shared_from_this()));
    }

    // Safe from any thread; the close runs on the session's strand.
    void cancel() {
        net::post(strand_, [self = shared_from_this()]() {
            self->timer_.cancel();
            beast::error_code ec;
            self->stream_.socket().close(ec);
        });
    }

private:
    void start() {
        timer_.async_wait(beast::bind_front_handler(&SquareClientSession::on_timeout, shared_from_this()));
        resolver_.async_resolve(
            host_,
            std::to_string(port_),
            beast::bind_front_handler(&SquareClientSession::on_resolve, shared_from_this()));
    }

    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (logger_) logger_->error("Square request to " + host_ + ":" + std::to_string(port_) + " timed out");
        finish(beast::errc::make_error_code(beast::errc::timed_out), {});
        beast::error_code close_ec;
        stream_.socket().close(close_ec);
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return finish(ec, {});
        stream_.async_connect(
            results,
            beast::bind_front_handler(&SquareClientSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return finish(ec, {});
        http::async_write(stream_, req_,
            beast::bind_front_handler(&SquareClientSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t /* bytes_transferred */) {
        if (ec) return finish(ec, {});
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&SquareClientSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /* bytes_transferred */) {
        timer_.cancel();

        beast::error_code shut_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shut_ec);

        if (ec && ec != http::error::end_of_stream) return finish(ec, {});

        if (res_.result() != http::status::ok) {
            if (logger_) logger_->warn("Square backend returned HTTP " + std::to_string(res_.result_int()));
            return finish(make_error_code(SquareErrc::bad_status), {});
        }

        SquareResponse response = SquareResponse::fromJson(res_.body());
        if (response.isSquare()) {
            ProducedValue<uint32_t> produced;
            produced.value = *response.square;
            produced.ttl = std::chrono::milliseconds(*response.ttl_ms);
            return finish({}, produced);
        }
        if (response.isError()) {
            if (logger_) logger_->warn("Square backend error: " + *response.error);
            return finish(make_error_code(SquareErrc::backend_error), {});
        }
        if (logger_) logger_->error("Unparseable square backend response: " + res_.body());
        finish(make_error_code(SquareErrc::malformed_response), {});
    }

    // The timer and the read chain can both try to complete; only the first wins.
    void finish(beast::error_code ec, ProducedValue<uint32_t> produced) {
        if (completed_.exchange(true)) {
            return;
        }
        on_complete_(ec, std::move(produced));
    }

    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_; // Must persist for reads
    http::request<http::empty_body> req_;
    http::response<http::string_body> res_;
    std::string host_;
    int port_;
    CompletionHandler on_complete_;
    std::shared_ptr<ILogger> logger_;
    net::steady_timer timer_;
    std::atomic<bool> completed_{false};
};

#endif // SQUARE_CLIENT_SESSION_HPP
