#include "HttpServerSession.hpp"
#include "TodoService.hpp"
#include <iterator>
#include <sstream>

// Called from on_read once req_ holds a complete request.
void HttpServerSession::handle_request() {
    if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
        logger_->debug("HttpServerSession " + id() + " handle_request " +
            std::string(req_.method_string()) + " " + std::string(req_.target()));
    }

    if (!todo_service_) {
        logger_->error("HttpServerSession " + id() + ": TodoService is null.");
        http::response<http::string_body> res{http::status::internal_server_error, req_.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(req_.keep_alive());
        res.body() = R"({"error":"Internal Error"})";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    todo_service_->processRequest(req_,
        [self = shared_from_this()](std::optional<http::response<http::string_body>> opt_res) {
            self->send_response(std::move(opt_res));
        });
}

void HttpServerSession::send_response(std::optional<http::response<http::string_body>>&& opt_res) {
    if (!opt_res) {
        logger_->warn("HttpServerSession " + id() + "::send_response: no response produced for '" +
            std::string(req_.target()) + "'. Dropping request.");
        if (write_in_progress_) {
            return;
        }
        if (req_.keep_alive()) {
            return do_read();
        }
        return do_close();
    }

    if (response_queue_.size() >= config_.max_response_queue_size) {
        // The front entry may be mid-write; discard the oldest one behind it
        auto oldest_it = write_in_progress_ ? std::next(response_queue_.begin()) : response_queue_.begin();
        if (oldest_it != response_queue_.end()) {
            logger_->warn("HttpServerSession " + id() +
                "::send_response: response queue is full (max " +
                std::to_string(config_.max_response_queue_size) +
                "). Discarding oldest queued response (status " +
                std::to_string((*oldest_it)->result_int()) + ").");
            response_queue_.erase(oldest_it);
        }
    }

    response_queue_.push_back(std::make_shared<http::response<http::string_body>>(std::move(*opt_res)));

    if (!write_in_progress_) {
        do_write();
    }
}
