#ifndef BEAST_HTTP_SERVER_HPP
#define BEAST_HTTP_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include "../interfaces/ILogger.hpp"
#include "../config/AppConfig.hpp"
#include "HttpServerSession.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Forward declaration
class TodoService;

// Accepts connections and keeps track of live sessions so stop() can close them.
class BeastHttpServer : public std::enable_shared_from_this<BeastHttpServer> {
    net::io_context& ioc_;
    tcp::acceptor acceptor_; // Bound to its own strand
    unsigned short port_ = 0;
    std::shared_ptr<TodoService> todo_service_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<HttpServerSession>> active_sessions_;

public:
    // Opens, binds and listens on endpoint. Throws std::runtime_error on failure.
    BeastHttpServer(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        std::shared_ptr<TodoService> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config);

    void run() {
        do_accept();
    }

    void stop();

    // Bound port, useful when constructed with port 0
    unsigned short port() const {
        return port_;
    }

    size_t active_session_count() {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        return active_sessions_.size();
    }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void on_session_finish(std::shared_ptr<HttpServerSession> session);
};

#endif // BEAST_HTTP_SERVER_HPP
