#ifndef HTTP_SERVER_SESSION_HPP
#define HTTP_SERVER_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>
#include <boost/config.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream> // For std::cerr in destructor fallback
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Forward declaration
class TodoService;

// One HTTP/1.1 connection: reads requests, hands them to TodoService and
// writes the responses back in order, honouring keep-alive.
class HttpServerSession : public std::enable_shared_from_this<HttpServerSession> {
    static constexpr std::chrono::seconds READ_TIMEOUT{30};

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<TodoService> todo_service_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::function<void(std::shared_ptr<HttpServerSession>)> on_finish_callback_; // Called when session is done

    // Responses waiting to be written, oldest first
    std::deque<std::shared_ptr<http::response<http::string_body>>> response_queue_;
    bool write_in_progress_ = false;

    // Cleared before each read
    http::request<http::string_body> req_;

public:
    HttpServerSession(
        tcp::socket&& socket,
        std::shared_ptr<TodoService> service,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config,
        std::function<void(std::shared_ptr<HttpServerSession>)> on_finish)
        : stream_(std::move(socket)),
          todo_service_(service),
          logger_(logger),
          config_(config),
          on_finish_callback_(std::move(on_finish)) {
        logger_->debug("HttpServerSession " + id() + " created.");
    }

    ~HttpServerSession() {
        if (logger_) {
            logger_->debug("HttpServerSession " + id() + " destroyed.");
        } else {
            std::cerr << "HttpServerSession " << id() << " destroyed (logger unavailable)." << std::endl;
        }
    }

    void run() {
        // Start on the strand the acceptor gave this socket
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(
                          &HttpServerSession::do_read,
                          shared_from_this()));
    }

    // Closes the socket on the session's strand; pending operations then complete with an error
    void stop() {
        net::post(stream_.get_executor(),
                  beast::bind_front_handler(
                      &HttpServerSession::do_stop,
                      shared_from_this()));
    }

private:
    void do_stop() {
        logger_->debug("HttpServerSession " + id() + " stopping.");

        beast::error_code ec_socket;
        if (stream_.socket().is_open()) {
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec_socket);
            if (ec_socket && ec_socket != beast::errc::not_connected) {
                logger_->error("HttpServerSession " + id() + " socket shutdown error during stop: " + ec_socket.message());
            }
            ec_socket = {};
            stream_.socket().close(ec_socket);
            if (ec_socket) {
                logger_->error("HttpServerSession " + id() + " socket close error during stop: " + ec_socket.message());
            }
        }
    }

    std::string id() const {
        std::ostringstream oss;
        oss << static_cast<const void*>(this);
        return oss.str();
    }

    void do_read() {
        req_ = {};
        stream_.expires_after(READ_TIMEOUT);

        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(
                             &HttpServerSession::on_read,
                             shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == http::error::end_of_stream) {
            return do_close();
        }

        if (ec) {
            if (ec == net::error::operation_aborted || ec == beast::error::timeout) {
                logger_->debug("HttpServerSession " + id() + " on_read: " + ec.message() + ". Closing.");
            } else {
                logger_->error("HttpServerSession " + id() + " on_read error: " + ec.message());
            }
            return do_close();
        }

        handle_request();
    }

    // Implemented in HttpServerSession.cpp
    void handle_request();
    void send_response(std::optional<http::response<http::string_body>>&& opt_res);

    void do_write() {
        if (response_queue_.empty()) {
            write_in_progress_ = false;
            return;
        }
        if (!stream_.socket().is_open()) {
            logger_->error("HttpServerSession " + id() + "::do_write - socket is not open. Dropping " +
                std::to_string(response_queue_.size()) + " queued response(s).");
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        write_in_progress_ = true;
        auto current_response_ptr = response_queue_.front();
        stream_.expires_after(READ_TIMEOUT);

        // The handler owns the response so it outlives the write even if the queue changes
        http::async_write(stream_, *current_response_ptr,
            [self = shared_from_this(), current_response_ptr](beast::error_code ec, std::size_t bytes_transferred) {
                self->on_write(current_response_ptr->keep_alive(), ec, bytes_transferred);
            });
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred) {
        if (ec) {
            if (ec == net::error::operation_aborted) {
                logger_->debug("HttpServerSession " + id() + " on_write: operation aborted. Closing.");
            } else {
                logger_->error("HttpServerSession " + id() + " on_write error: " + ec.message() +
                    ". Bytes transferred: " + std::to_string(bytes_transferred));
            }
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        if (!response_queue_.empty()) {
            response_queue_.pop_front();
        }

        if (!response_queue_.empty()) {
            return do_write();
        }

        write_in_progress_ = false;
        if (!keep_alive) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec_shutdown;
        if (stream_.socket().is_open()) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec_shutdown);
        }
        if (ec_shutdown && ec_shutdown != beast::errc::not_connected) {
            logger_->debug("HttpServerSession " + id() + " socket shutdown in do_close: " + ec_shutdown.message());
        }

        // Notify the server exactly once; the callback may drop the last reference to this session
        if (on_finish_callback_) {
            auto cb = std::move(on_finish_callback_);
            on_finish_callback_ = nullptr;
            net::dispatch(stream_.get_executor(), beast::bind_front_handler(std::move(cb), shared_from_this()));
        }
    }
};

#endif // HTTP_SERVER_SESSION_HPP
