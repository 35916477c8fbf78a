#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <string>
#include <sstream>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CODE_EXCEPTION = "todoify.code_exception";

    static std::string JSON_ERROR = "todoify.json_error";

    static std::string VALIDATION_ERROR = "todoify.validation_error";

    static std::string TODO_CREATED = "todoify.todo.created";

    static std::string TODO_DELETED = "todoify.todo.deleted";

    static std::string TODO_EXPIRED = "todoify.todo.expired";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static constexpr auto APP_VERSION = "1.0.0";
    static constexpr auto CONFIG_FILE_NAME = "todoify.config";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Identification, reported by /health and /api/info
    std::string application_name;
    std::string emissary_url;

    // Server Configuration
    int port;
    unsigned int num_io_threads;
    size_t max_response_queue_size;

    // Todo lifetime
    int todo_ttl_seconds;
    int cleanup_interval_seconds; // 0 disables the periodic sweep

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    std::string statsd_server;
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        application_name = "todoify";
        emissary_url = "";
        port = 5000;
        num_io_threads = 2;
        max_response_queue_size = 16;
        todo_ttl_seconds = 300; // 5 minutes
        cleanup_interval_seconds = 30;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
        statsd_server = "";
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "application_name: " << application_name << std::endl
            << "emissary_url: " << (emissary_url.empty() ? "<unset>" : emissary_url) << std::endl
            << "port: " << port << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "max_response_queue_size: " << max_response_queue_size << std::endl
            << "// --- Todo Lifetime --- //" << std::endl
            << "todo_ttl_seconds: " << todo_ttl_seconds << std::endl
            << "cleanup_interval_seconds: " << cleanup_interval_seconds << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "statsd_server: " << (statsd_server.empty() ? "<unset>" : statsd_server) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
