#include "ExpirySweeper.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <stdexcept>
#include <string>

#include "../config/AppConfig.hpp"

ExpirySweeper::ExpirySweeper(net::io_context& ioc,
                             std::shared_ptr<TodoStoreInterface> store,
                             std::shared_ptr<IStatsDClient> statsd_client,
                             std::shared_ptr<ILogger> logger,
                             std::chrono::seconds interval)
    : timer_(net::make_strand(ioc)),
      store_(store),
      statsd_client_(statsd_client),
      logger_(logger),
      interval_(interval) {
    if (!store_ || !statsd_client_ || !logger_) {
        throw std::invalid_argument("ExpirySweeper dependencies cannot be null");
    }
}

void ExpirySweeper::start() {
    if (interval_.count() <= 0) {
        logger_->setup("ExpirySweeper disabled (cleanup interval is 0). Expired todos are purged on access only.");
        return;
    }
    if (running_.exchange(true)) {
        return;
    }
    logger_->setup("ExpirySweeper started, sweeping every " + std::to_string(interval_.count()) + "s.");
    arm();
}

void ExpirySweeper::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // The timer is not thread safe; cancel it from its own executor
    net::post(timer_.get_executor(), [self = shared_from_this()]() {
        self->timer_.cancel();
    });
    logger_->info("ExpirySweeper stopped.");
}

std::size_t ExpirySweeper::sweep() {
    std::size_t purged = store_->purgeExpired();
    if (purged > 0) {
        logger_->info("Cleaned up " + std::to_string(purged) + " expired todo(s)");
        statsd_client_->increment(MetricsDefinitions::TODO_EXPIRED, static_cast<int>(purged));
    }
    return purged;
}

void ExpirySweeper::arm() {
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        self->on_timer(ec);
    });
}

void ExpirySweeper::on_timer(boost::system::error_code ec) {
    if (ec == net::error::operation_aborted || !running_.load()) {
        logger_->debug("ExpirySweeper timer cancelled.");
        return;
    }
    if (ec) {
        logger_->error("ExpirySweeper timer error: " + ec.message());
    } else {
        try {
            sweep();
        } catch (const std::exception& e) {
            logger_->error("ExpirySweeper sweep failed: " + std::string(e.what()));
        }
    }
    arm();
}
