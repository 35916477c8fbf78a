#include "BeastHttpServer.hpp"
#include "HttpServerSession.hpp"
#include "TodoService.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <sstream>
#include <stdexcept>
#include <vector>

BeastHttpServer::BeastHttpServer(
    net::io_context& ioc,
    tcp::endpoint endpoint,
    std::shared_ptr<TodoService> service,
    std::shared_ptr<ILogger> logger,
    const AppConfig& config)
    : ioc_(ioc),
      acceptor_(net::make_strand(ioc)),
      todo_service_(service),
      logger_(logger),
      config_(config) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        logger_->error("BeastHttpServer open acceptor error: " + ec.message());
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        logger_->error("BeastHttpServer set_option error: " + ec.message());
        throw std::runtime_error("Failed to set_option: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        logger_->error("BeastHttpServer bind error: " + ec.message());
        throw std::runtime_error("Failed to bind: " + ec.message());
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        logger_->error("BeastHttpServer listen error: " + ec.message());
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
    port_ = acceptor_.local_endpoint().port();
}

void BeastHttpServer::stop() {
    logger_->info("BeastHttpServer stopping...");

    // The acceptor is only touched from its strand, where on_accept also runs
    net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        if (!self->acceptor_.is_open()) {
            return;
        }
        beast::error_code ec;
        self->acceptor_.cancel(ec);
        if (ec) self->logger_->error("BeastHttpServer acceptor cancel error: " + ec.message());
        self->acceptor_.close(ec);
        if (ec) self->logger_->error("BeastHttpServer acceptor close error: " + ec.message());
    });

    // Copy out so session callbacks can take sessions_mutex_ while we stop them
    std::vector<std::shared_ptr<HttpServerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.assign(active_sessions_.begin(), active_sessions_.end());
        active_sessions_.clear();
    }
    for (const auto& session_ptr : sessions) {
        if (session_ptr) session_ptr->stop();
    }
    logger_->info("BeastHttpServer stopped " + std::to_string(sessions.size()) + " active session(s).");
}

void BeastHttpServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_), // Each session gets its own strand
        beast::bind_front_handler(
            &BeastHttpServer::on_accept,
            shared_from_this()));
}

void BeastHttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            logger_->debug("BeastHttpServer accept cancelled.");
            return;
        }
        // Don't stop accepting on recoverable errors
        logger_->error("BeastHttpServer accept error: " + ec.message());
        return do_accept();
    }

    auto session = std::make_shared<HttpServerSession>(
        std::move(socket),
        todo_service_,
        logger_,
        config_,
        [self = shared_from_this()](std::shared_ptr<HttpServerSession> session_to_remove) {
            self->on_session_finish(session_to_remove);
        });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }

    session->run();

    do_accept();
}

void BeastHttpServer::on_session_finish(std::shared_ptr<HttpServerSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    size_t erased_count = active_sessions_.erase(session);
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        std::ostringstream oss;
        oss << static_cast<void*>(session.get());
        logger_->debug("BeastHttpServer::on_session_finish - session " + oss.str() +
            (erased_count > 0 ? " removed" : " already gone") +
            ". Active sessions: " + std::to_string(active_sessions_.size()));
    }
}
