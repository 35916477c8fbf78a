#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"
#include "../utils/Utils.hpp"

// Define static members
std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

// The level passed on the first call wins; later calls return the same logger.
std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

void ConsoleLogger::write(std::ostream& out, const std::string& prefix, const std::string& message) {
    std::string timestamp = Utils::formatIsoTimestamp(std::chrono::system_clock::now());
    std::lock_guard<std::mutex> lock(out_mutex_);
    out << timestamp << " " << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) {
        write(std::cout, LogUtils::INFO_LOG_PREFIX, message);
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) {
        write(std::cout, LogUtils::DEBUG_LOG_PREFIX, message);
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) {
        write(std::cout, LogUtils::WARN_LOG_PREFIX, message);
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) {
        write(std::cerr, LogUtils::CERROR_LOG_PREFIX, message);
    }
}

// Setup messages are always printed regardless of level
void ConsoleLogger::setup(const std::string& message) {
    write(std::cout, LogUtils::SETUP_LOG_PREFIX, message);
}
