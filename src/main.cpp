#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/signal_set.hpp> // For graceful shutdown
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp> // For make_work_guard

#include "config/AppConfig.hpp"
#include "core/BeastHttpServer.hpp"
#include "core/ExpirySweeper.hpp"
#include "core/TodoService.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "store/SystemClock.hpp"
#include "store/TodoStore.hpp"
#include "utils/Utils.hpp"

using namespace std;

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    if (config.statsd_server.empty()) {
        logger_->setup("STATSD_SERVER not set. Metrics disabled.");
        return DummyStatsDClient::getInstance();
    }

    try {
        logger_->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
        return StatsDClient::getInstance(config, logger_);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()) + ". Creating DummyStatsDClient instance.");
    }
    return DummyStatsDClient::getInstance();
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            // Use a temporary logger instance for early errors before config is loaded
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);

        // The store lives for the whole process and is never persisted
        auto clock = std::make_shared<SystemClock>();
        auto todo_store = std::make_shared<TodoStore>(clock, std::chrono::seconds(config_.todo_ttl_seconds));
        logger_->setup("TodoStore created. Todos expire after " + std::to_string(config_.todo_ttl_seconds) + " seconds.");

        // --- Setup Boost.Asio io_context ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc); // Keep ioc.run() from returning if no work

        auto todo_service = std::make_shared<TodoService>(todo_store, clock, statsd_client, config_, logger_);

        auto const address = net::ip::make_address("0.0.0.0");
        auto const port = static_cast<unsigned short>(config_.port);
        auto beast_server = std::make_shared<BeastHttpServer>(
            ioc,
            tcp::endpoint{address, port},
            todo_service,
            logger_,
            config_);
        beast_server->run(); // Start accepting connections

        auto sweeper = std::make_shared<ExpirySweeper>(
            ioc, todo_store, statsd_client, logger_, std::chrono::seconds(config_.cleanup_interval_seconds));
        sweeper->start();

        std::vector<std::thread> ioc_threads;
        logger_->setup("Starting " + std::to_string(config_.num_io_threads) + " additional I/O threads for Boost.Asio.");
        for (unsigned int i = 0; i < config_.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in Boost.Asio I/O thread " + std::to_string(i) + ": " + e.what());
                }
                logger_->debug("Boost.Asio I/O thread " + std::to_string(i) + " exiting.");
            });
        }

        // Setup signal handling for graceful shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](beast::error_code const& ec, int signal_number) {
                if (ec) {
                    return;
                }
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
                beast_server->stop();
                sweeper->stop();

                // ioc.run() returns once the closed sessions finish their handlers
                work_guard.reset();
                logger_->setup("Work guard reset.");
            });

        logger_->setup(config_.application_name + " is running on port " + std::to_string(config_.port) +
            (config_.emissary_url.empty() ? std::string() : ", emissary " + config_.emissary_url) +
            ". Press Ctrl+C to exit.");

        try {
            ioc.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in main thread ioc.run(): " + std::string(e.what()));
        }

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger_->setup("All Boost.Asio I/O threads joined. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
