// tests/test_square_server.cpp
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "Mocks.hpp"
#include "../src/cache/CachedFunction.hpp"
#include "../src/cache/ConcurrentTtlCache.hpp"
#include "../src/core/SquareClientSession.hpp"
#include "../src/core/SquareServer.hpp"
#include "../src/models/SquareResponse.hpp"

using ::testing::NiceMock;

// --- Request handling without sockets ---

TEST(SquareServerResponseTest, ParsesNumFromQuery) {
    EXPECT_EQ(SquareServer::parseNum("/squareme?num=30").value_or(0), 30);
    EXPECT_EQ(SquareServer::parseNum("/squareme?x=1&num=-4").value_or(0), -4);
    EXPECT_FALSE(SquareServer::parseNum("/squareme").has_value());
    EXPECT_FALSE(SquareServer::parseNum("/squareme?num=abc").has_value());
    EXPECT_FALSE(SquareServer::parseNum("/squareme?number=3").has_value());
}

TEST(SquareServerResponseTest, SquaresWithDelayAddedToTtl) {
    SquarePlan plan;
    plan.delay = std::chrono::milliseconds(120);
    auto res = SquareServer::buildResponse("/squareme?num=30", plan, 100);

    EXPECT_EQ(res.result(), http::status::ok);
    auto parsed = SquareResponse::fromJson(res.body());
    ASSERT_TRUE(parsed.isSquare()) << res.body();
    EXPECT_EQ(*parsed.square, 900u);
    EXPECT_EQ(*parsed.ttl_ms, 220u);
}

TEST(SquareServerResponseTest, PlannedFailureIsErrorBody) {
    SquarePlan plan;
    plan.fail = true;
    auto res = SquareServer::buildResponse("/squareme?num=30", plan, 100);

    EXPECT_EQ(res.result(), http::status::ok);
    auto parsed = SquareResponse::fromJson(res.body());
    ASSERT_TRUE(parsed.isError()) << res.body();
    EXPECT_EQ(*parsed.error, "something went wrong");
}

TEST(SquareServerResponseTest, BadNumIsServerError) {
    auto res = SquareServer::buildResponse("/squareme?num=3x", SquarePlan{}, 100);
    EXPECT_EQ(res.result(), http::status::internal_server_error);
}

TEST(SquareServerResponseTest, UnknownPathIsNotFound) {
    auto res = SquareServer::buildResponse("/cube?num=3", SquarePlan{}, 100);
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST(SquareServerResponseTest, OptionsFromConfig) {
    AppConfig config;
    config.square_base_ttl_ms = 5;
    config.square_min_delay_ms = 1;
    config.square_max_delay_ms = 2;
    config.square_error_one_in = 0;

    auto options = SquareServerOptions::fromConfig(config);
    EXPECT_EQ(options.base_ttl_ms, 5);
    EXPECT_EQ(options.min_delay_ms, 1);
    EXPECT_EQ(options.max_delay_ms, 2);
    EXPECT_EQ(options.error_one_in, 0);
}

// --- Served over loopback ---

class SquareServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger = std::make_shared<NiceMock<MockLogger>>();
        work_guard_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc_));
        for (int i = 0; i < 2; ++i) {
            ioc_threads_.emplace_back([this]() { ioc_.run(); });
        }
    }

    void TearDown() override {
        work_guard_.reset();
        ioc_.stop();
        for (auto& t : ioc_threads_) {
            if (t.joinable()) t.join();
        }
    }

    void startServer(SquareServerOptions options) {
        server = std::make_shared<SquareServer>(
            ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0), options, logger);
        server->run();
    }

    std::pair<beast::error_code, ProducedValue<uint32_t>> request(int num) {
        auto promise = std::make_shared<std::promise<std::pair<beast::error_code, ProducedValue<uint32_t>>>>();
        auto future = promise->get_future();
        std::make_shared<SquareClientSession>(
            ioc_, "127.0.0.1", server->port(), num, std::chrono::milliseconds(2000),
            [promise](beast::error_code ec, ProducedValue<uint32_t> produced) {
                promise->set_value({ec, produced});
            })->run();

        if (future.wait_for(std::chrono::seconds(5)) == std::future_status::timeout) {
            throw std::runtime_error("Square request timed out in test");
        }
        return future.get();
    }

    static SquareServerOptions quietOptions() {
        SquareServerOptions options;
        options.base_ttl_ms = 100;
        options.min_delay_ms = 0;
        options.max_delay_ms = 0;
        options.error_one_in = 0;
        return options;
    }

    net::io_context ioc_;
    std::shared_ptr<NiceMock<MockLogger>> logger;
    std::shared_ptr<SquareServer> server;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
    std::vector<std::thread> ioc_threads_;
};

TEST_F(SquareServerTest, AnswersClientWithSquare) {
    startServer(quietOptions());
    auto [ec, produced] = request(12);
    EXPECT_FALSE(ec) << ec.message();
    EXPECT_EQ(produced.value, 144u);
    EXPECT_EQ(produced.ttl, std::chrono::milliseconds(100));
    EXPECT_EQ(server->requestCount(), 1u);
}

TEST_F(SquareServerTest, AlwaysFailingServerYieldsBackendError) {
    SquareServerOptions options = quietOptions();
    options.error_one_in = 1;
    startServer(options);
    EXPECT_EQ(request(12).first, make_error_code(SquareErrc::backend_error));
}

TEST_F(SquareServerTest, DelayIsWithinRangeAndAddedToTtl) {
    SquareServerOptions options = quietOptions();
    options.min_delay_ms = 20;
    options.max_delay_ms = 40;
    startServer(options);

    auto started = std::chrono::steady_clock::now();
    auto [ec, produced] = request(3);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(ec) << ec.message();
    EXPECT_GE(elapsed, std::chrono::milliseconds(20));
    EXPECT_GE(produced.ttl, std::chrono::milliseconds(120));
    EXPECT_LE(produced.ttl, std::chrono::milliseconds(140));
}

TEST_F(SquareServerTest, ClientTimesOutOnSlowServer) {
    SquareServerOptions options = quietOptions();
    options.min_delay_ms = 500;
    options.max_delay_ms = 500;
    startServer(options);

    auto promise = std::make_shared<std::promise<beast::error_code>>();
    auto future = promise->get_future();
    std::make_shared<SquareClientSession>(
        ioc_, "127.0.0.1", server->port(), 3, std::chrono::milliseconds(50),
        [promise](beast::error_code ec, ProducedValue<uint32_t>) { promise->set_value(ec); })->run();

    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(future.get(), beast::errc::make_error_code(beast::errc::timed_out));
}

TEST_F(SquareServerTest, MemoizedDemoRoundTrip) {
    startServer(quietOptions());
    auto cache = std::make_shared<ConcurrentTtlCache<int, uint32_t>>();
    const int port = server->port();
    auto square = cacheFn(cache, [this, port](const int& num, CachedFunction<int, uint32_t>::ProducerHandler handler) {
        std::make_shared<SquareClientSession>(
            ioc_, "127.0.0.1", port, num, std::chrono::milliseconds(2000), std::move(handler))->run();
    });

    EXPECT_EQ(square.fetch(30).get(), 900u);
    EXPECT_EQ(square.fetch(30).get(), 900u);
    EXPECT_EQ(server->requestCount(), 1u);

    // 100ms TTL: once it lapses the backend is asked again.
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(square.fetch(30).get(), 900u);
    EXPECT_EQ(server->requestCount(), 2u);
}
