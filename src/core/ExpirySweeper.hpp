#ifndef EXPIRY_SWEEPER_HPP
#define EXPIRY_SWEEPER_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <memory>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/TodoStoreInterface.hpp"

namespace net = boost::asio;

// Purges expired todos on a fixed interval so memory is reclaimed even when
// no request touches them. Lazy purging inside TodoStore stays authoritative.
class ExpirySweeper : public std::enable_shared_from_this<ExpirySweeper> {
public:
    ExpirySweeper(net::io_context& ioc,
                  std::shared_ptr<TodoStoreInterface> store,
                  std::shared_ptr<IStatsDClient> statsd_client,
                  std::shared_ptr<ILogger> logger,
                  std::chrono::seconds interval);

    // No-op when the interval is zero
    void start();
    void stop();

    // Runs one sweep immediately. Returns the number of todos purged.
    std::size_t sweep();

    bool running() const { return running_.load(); }

private:
    void arm();
    void on_timer(boost::system::error_code ec);

    net::steady_timer timer_; // Bound to its own strand
    std::shared_ptr<TodoStoreInterface> store_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_{false};
};

#endif // EXPIRY_SWEEPER_HPP
