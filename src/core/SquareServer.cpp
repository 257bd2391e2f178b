#include "SquareServer.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include "../utils/Utils.hpp"

SquareServer::SquareServer(
    net::io_context& ioc,
    tcp::endpoint endpoint,
    SquareServerOptions options,
    std::shared_ptr<ILogger> logger)
    : ioc_(ioc),
      acceptor_(ioc),
      options_(options),
      logger_(logger),
      rng_(std::random_device{}()) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for SquareServer");
    }

    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        logger_->error("SquareServer open acceptor error: " + ec.message());
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        logger_->error("SquareServer set_option error: " + ec.message());
        throw std::runtime_error("Failed to set_option: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        logger_->error("SquareServer bind error: " + ec.message());
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        logger_->error("SquareServer listen error: " + ec.message());
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

void SquareServer::run() {
    do_accept();
}

void SquareServer::stop() {
    beast::error_code ec;
    acceptor_.cancel(ec);
    if (ec) logger_->error("SquareServer acceptor cancel error: " + ec.message());
    acceptor_.close(ec);
    if (ec) logger_->error("SquareServer acceptor close error: " + ec.message());
    logger_->info("SquareServer stopped accepting new connections.");
}

SquarePlan SquareServer::plan() {
    SquarePlan plan;
    int low = std::max(0, options_.min_delay_ms);
    int high = std::max(low, options_.max_delay_ms);

    std::lock_guard<std::mutex> lock(rng_mutex_);
    plan.delay = std::chrono::milliseconds(std::uniform_int_distribution<int>(low, high)(rng_));
    if (options_.error_one_in > 0) {
        plan.fail = std::uniform_int_distribution<int>(1, options_.error_one_in)(rng_) == 1;
    }
    return plan;
}

std::optional<int> SquareServer::parseNum(std::string_view target) {
    size_t query_pos = target.find('?');
    if (query_pos == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view query = target.substr(query_pos + 1);
    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view param = query.substr(0, amp);
        if (param.substr(0, 4) == "num=") {
            return Utils::stringToInt(Utils::trim(std::string(param.substr(4))));
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query = query.substr(amp + 1);
    }
    return std::nullopt;
}

http::response<http::string_body> SquareServer::buildResponse(std::string_view target,
                                                             const SquarePlan& plan,
                                                             int base_ttl_ms) {
    http::response<http::string_body> res;
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);

    std::string_view path = target.substr(0, target.find('?'));
    if (path != Constants::SQUARE_PATH) {
        res.result(http::status::not_found);
        res.set(http::field::content_type, "text/plain");
        res.body() = "The resource '" + std::string(target) + "' was not found.";
        return res;
    }

    auto num = parseNum(target);
    if (!num) {
        res.result(http::status::internal_server_error);
        res.set(http::field::content_type, "text/plain");
        res.body() = "num must be an integer";
        return res;
    }

    nlohmann::json body;
    if (plan.fail) {
        body["error"] = "something went wrong";
    } else {
        body["msg"] = static_cast<int64_t>(*num) * static_cast<int64_t>(*num);
        body["ttl(ms)"] = base_ttl_ms + static_cast<int>(plan.delay.count());
    }
    res.result(http::status::ok);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    return res;
}

void SquareServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&SquareServer::on_accept, shared_from_this()));
}

void SquareServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        logger_->error("SquareServer accept error: " + ec.message());
        do_accept();
        return;
    }

    std::make_shared<SquareServerSession>(std::move(socket), shared_from_this(), logger_)->run();
    do_accept();
}

SquareServerSession::SquareServerSession(
    tcp::socket&& socket,
    std::shared_ptr<SquareServer> server,
    std::shared_ptr<ILogger> logger)
    : stream_(std::move(socket)),
      delay_timer_(stream_.get_executor()),
      server_(std::move(server)),
      logger_(std::move(logger)) {}

void SquareServerSession::run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&SquareServerSession::do_read, shared_from_this()));
}

void SquareServerSession::do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, req_,
                     beast::bind_front_handler(&SquareServerSession::on_read, shared_from_this()));
}

void SquareServerSession::on_read(beast::error_code ec, std::size_t /* bytes_transferred */) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }
    if (ec) {
        if (ec != net::error::operation_aborted) {
            logger_->error("SquareServerSession on_read error: " + ec.message());
        }
        return do_close();
    }

    ++server_->requests_;
    plan_ = server_->plan();
    if (logger_->isDebugEnabled()) {
        logger_->debug("SquareServerSession " + std::string(req_.target()) + " delayed " +
                       std::to_string(plan_.delay.count()) + "ms" + (plan_.fail ? ", failing" : ""));
    }

    delay_timer_.expires_after(plan_.delay);
    delay_timer_.async_wait(beast::bind_front_handler(&SquareServerSession::on_delay, shared_from_this()));
}

void SquareServerSession::on_delay(beast::error_code ec) {
    if (ec) {
        return do_close();
    }

    auto target = req_.target();
    res_ = SquareServer::buildResponse(std::string_view(target.data(), target.size()), plan_,
                                       server_->options().base_ttl_ms);
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());
    res_.prepare_payload();
    do_write();
}

void SquareServerSession::do_write() {
    http::async_write(stream_, res_,
                      beast::bind_front_handler(&SquareServerSession::on_write, shared_from_this(),
                                                res_.keep_alive()));
}

void SquareServerSession::on_write(bool keep_alive, beast::error_code ec, std::size_t /* bytes_transferred */) {
    if (ec) {
        if (ec != net::error::operation_aborted) {
            logger_->error("SquareServerSession on_write error: " + ec.message());
        }
        return do_close();
    }
    if (!keep_alive) {
        return do_close();
    }
    do_read();
}

void SquareServerSession::do_close() {
    delay_timer_.cancel();
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}
