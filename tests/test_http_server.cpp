// tests/test_http_server.cpp
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "TestMocks.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/core/BeastHttpServer.hpp"
#include "../src/core/TodoService.hpp"
#include "../src/store/TodoStore.hpp"

using json = nlohmann::json;
using ::testing::NiceMock;
using ::testing::Return;

// Runs the real server on an ephemeral port and talks to it over loopback
class HttpServerTest : public ::testing::Test {
protected:
    AppConfig config_;
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> ioc_threads_;

    std::shared_ptr<FakeClock> clock_ = std::make_shared<FakeClock>();
    std::shared_ptr<TodoStore> store_ = std::make_shared<TodoStore>(clock_);
    std::shared_ptr<NiceMock<MockLogger>> logger_ = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<BeastHttpServer> server_;

    void SetUp() override {
        ON_CALL(*logger_, getLogLevel()).WillByDefault(Return(LogUtils::LogLevel::CERROR));

        auto service = std::make_shared<TodoService>(store_, clock_, statsd_, config_, logger_);
        server_ = std::make_shared<BeastHttpServer>(
            ioc_,
            tcp::endpoint{net::ip::make_address("127.0.0.1"), 0},
            service,
            logger_,
            config_);
        server_->run();

        work_guard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(boost::asio::make_work_guard(ioc_));
        ioc_threads_.emplace_back([this]() { ioc_.run(); });
        ioc_threads_.emplace_back([this]() { ioc_.run(); });
    }

    void TearDown() override {
        server_->stop();
        work_guard_.reset();
        // Give closing sessions a moment, then force any stragglers out
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ioc_.stop();
        for (auto& t : ioc_threads_) {
            if (t.joinable()) t.join();
        }
    }

    tcp::socket connect() {
        tcp::socket socket(client_ioc_);
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), server_->port()});
        return socket;
    }

    static http::response<http::string_body> roundTrip(tcp::socket& socket, beast::flat_buffer& buffer,
                                                       http::verb verb, const std::string& target,
                                                       const std::string& body = "", bool keep_alive = true) {
        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(keep_alive);
        if (!body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        http::write(socket, req);

        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        return res;
    }

    http::response<http::string_body> request(http::verb verb, const std::string& target, const std::string& body = "") {
        tcp::socket socket = connect();
        beast::flat_buffer buffer;
        auto res = roundTrip(socket, buffer, verb, target, body, false);
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

private:
    boost::asio::io_context client_ioc_;
};

TEST_F(HttpServerTest, BindsEphemeralPort) {
    EXPECT_NE(server_->port(), 0);
}

TEST_F(HttpServerTest, BuyGroceriesOverTheWire) {
    auto created = request(http::verb::post, "/api/todos", R"({"title":"Buy groceries","description":"Milk, eggs"})");
    ASSERT_EQ(created.result(), http::status::created);
    EXPECT_EQ(created[http::field::content_type], "application/json");
    json todo = json::parse(created.body());
    EXPECT_EQ(todo["title"], "Buy groceries");
    const std::string target = "/api/todos/" + std::to_string(todo["id"].get<TodoId>());

    auto toggled = request(http::verb::patch, target + "/toggle");
    ASSERT_EQ(toggled.result(), http::status::ok);
    EXPECT_EQ(json::parse(toggled.body())["completed"], true);

    auto stats = request(http::verb::get, "/api/stats");
    ASSERT_EQ(stats.result(), http::status::ok);
    EXPECT_EQ(json::parse(stats.body()), json({{"total", 1}, {"completed", 1}, {"pending", 0}}));

    clock_->advance(std::chrono::minutes(5) + std::chrono::seconds(1));
    auto expired = request(http::verb::get, target);
    EXPECT_EQ(expired.result(), http::status::not_found);
    EXPECT_EQ(json::parse(expired.body())["error"], "Todo not found");
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequestsOnOneConnection) {
    tcp::socket socket = connect();
    beast::flat_buffer buffer;

    auto first = roundTrip(socket, buffer, http::verb::post, "/api/todos", R"({"title":"first"})");
    ASSERT_EQ(first.result(), http::status::created);
    EXPECT_TRUE(first.keep_alive());

    auto second = roundTrip(socket, buffer, http::verb::post, "/api/todos", R"({"title":"second"})");
    ASSERT_EQ(second.result(), http::status::created);

    auto list = roundTrip(socket, buffer, http::verb::get, "/api/todos", "", false);
    ASSERT_EQ(list.result(), http::status::ok);
    EXPECT_FALSE(list.keep_alive());

    json todos = json::parse(list.body());
    ASSERT_EQ(todos.size(), 2u);
    EXPECT_EQ(todos[0]["title"], "first");
    EXPECT_EQ(todos[1]["title"], "second");

    // The server closes after a non keep-alive response
    http::response<http::string_body> extra;
    beast::error_code ec;
    http::read(socket, buffer, extra, ec);
    EXPECT_EQ(ec, http::error::end_of_stream);
}

TEST_F(HttpServerTest, ErrorsArriveAsJson) {
    auto bad = request(http::verb::post, "/api/todos", "not json at all");
    EXPECT_EQ(bad.result(), http::status::bad_request);
    EXPECT_EQ(json::parse(bad.body())["error"], "Invalid JSON body");

    auto missing = request(http::verb::get, "/nowhere");
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_TRUE(json::parse(missing.body()).contains("error"));
}

TEST_F(HttpServerTest, ConcurrentClientsGetDistinctIds) {
    constexpr int kClients = 4;
    constexpr int kPerClient = 10;

    std::vector<std::thread> clients;
    for (int c = 0; c < kClients; ++c) {
        clients.emplace_back([this, c]() {
            boost::asio::io_context ioc;
            tcp::socket socket(ioc);
            socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), server_->port()});
            beast::flat_buffer buffer;
            for (int i = 0; i < kPerClient; ++i) {
                json payload = {{"title", "client " + std::to_string(c) + " task " + std::to_string(i)}};
                auto res = roundTrip(socket, buffer, http::verb::post, "/api/todos", payload.dump());
                EXPECT_EQ(res.result(), http::status::created);
            }
            beast::error_code ec;
            socket.shutdown(tcp::socket::shutdown_both, ec);
        });
    }
    for (auto& client : clients) {
        client.join();
    }

    auto todos = store_->list();
    ASSERT_EQ(todos.size(), static_cast<size_t>(kClients * kPerClient));
    for (size_t i = 0; i < todos.size(); ++i) {
        EXPECT_EQ(todos[i].id, i + 1);
    }
}

TEST_F(HttpServerTest, StopClosesIdleConnections) {
    tcp::socket socket = connect();
    beast::flat_buffer buffer;
    auto res = roundTrip(socket, buffer, http::verb::get, "/health");
    ASSERT_EQ(res.result(), http::status::ok);

    server_->stop();

    http::response<http::string_body> after;
    beast::error_code ec;
    http::read(socket, buffer, after, ec);
    EXPECT_TRUE(ec);
}

TEST_F(HttpServerTest, StopRefusesNewConnections) {
    auto res = request(http::verb::get, "/health");
    ASSERT_EQ(res.result(), http::status::ok);

    server_->stop();

    // The acceptor closes on its own strand shortly after stop() returns
    bool refused = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!refused && std::chrono::steady_clock::now() < deadline) {
        boost::asio::io_context ioc;
        tcp::socket socket(ioc);
        beast::error_code ec;
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), server_->port()}, ec);
        refused = static_cast<bool>(ec);
        if (!refused) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    EXPECT_TRUE(refused);

    // A second stop is harmless
    server_->stop();
}
