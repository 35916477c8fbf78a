#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Parses a todo id path segment. Only plain positive decimal digits are accepted.
    static std::optional<std::uint64_t> parseTodoId(std::string_view segment) {
        if (segment.empty() || segment.size() > 19) {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        for (char c : segment) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<std::uint64_t>(c - '0');
        }
        if (value == 0) {
            return std::nullopt;
        }
        return value;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Accepts http:// and https:// URLs with a host and an optional port
    static bool isHttpUrl(const std::string& url) {
        static const std::regex url_regex(R"(^(https?):\/\/([^:\/?#]+)(?::(\d+))?(?:[\/?#].*)?$)");
        std::smatch match;
        if (!std::regex_match(url, match, url_regex)) {
            return false;
        }
        if (match[3].matched) {
            auto port = stringToInt(match[3].str());
            if (!port || *port <= 0 || *port > 65535) {
                return false;
            }
        }
        return true;
    }

    // Formats a time point as RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
    static std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp) {
        auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
        if (secs > tp) {
            secs -= std::chrono::seconds(1); // Round towards negative infinity for pre-epoch values
        }
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
        std::time_t tt = std::chrono::system_clock::to_time_t(secs);

        std::tm tm = {};
    #if defined(_WIN32) || defined(_WIN64)
        gmtime_s(&tm, &tt);
    #else
        gmtime_r(&tt, &tm);
    #endif
        std::ostringstream oss;
        oss << std::put_time(&tm, Constants::TIME_FORMAT)
            << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return oss.str();
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                std::string key = arg.substr(0, delimiterPos);
                std::string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies a single configuration key. Unknown keys and invalid values are reported and ignored.
    // Returns true when the value was applied.
    static bool applyConfigValue(AppConfig& config, const std::string& key, const std::string& value, const std::string& source) {
        auto warnInvalid = [&](const std::string& expected) {
            std::cerr << "Warning: Invalid " << expected << " for " << key << " in " << source << ": " << value << std::endl;
            return false;
        };

        if (key == "port") {
            auto val = stringToInt(value);
            if (!val || *val <= 0 || *val > 65535) return warnInvalid("port");
            config.port = *val;
        } else if (key == "num_io_threads") {
            auto val = stringToInt(value);
            if (!val || *val < 0) return warnInvalid("non-negative integer");
            config.num_io_threads = static_cast<unsigned int>(*val);
        } else if (key == "max_response_queue_size") {
            auto val = stringToInt(value);
            if (!val || *val <= 0) return warnInvalid("positive integer");
            config.max_response_queue_size = static_cast<size_t>(*val);
        } else if (key == "todo_ttl_seconds") {
            auto val = stringToInt(value);
            if (!val || *val <= 0) return warnInvalid("positive integer");
            config.todo_ttl_seconds = *val;
        } else if (key == "cleanup_interval_seconds") {
            auto val = stringToInt(value);
            if (!val || *val < 0) return warnInvalid("non-negative integer");
            config.cleanup_interval_seconds = *val;
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument&) {
                return warnInvalid("log level");
            }
        } else if (key == "application_name") {
            if (value.empty()) return warnInvalid("name");
            config.application_name = value;
        } else if (key == "emissary_url") {
            if (!value.empty() && !isHttpUrl(value)) return warnInvalid("URL");
            config.emissary_url = value;
        } else if (key == "statsd_server") {
            config.statsd_server = value;
        } else if (key == "metrics_batch_size") {
            auto val = stringToInt(value);
            if (!val || *val <= 0) return warnInvalid("positive integer");
            config.metrics_batch_size = *val;
        } else if (key == "metrics_send_interval") {
            // value provided in millis
            auto val = stringToInt(value);
            if (!val || *val <= 0) return warnInvalid("positive integer");
            config.metrics_send_interval_in_millis = *val;
        } else {
            std::cerr << "Warning: Unknown configuration key '" << key << "' in " << source << std::endl;
            return false;
        }
        return true;
    }

    // Reads "key = value" lines, skipping blanks and '#' comments
    static void loadConfigurationFile(std::istream& in, AppConfig& config, const std::string& source) {
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                applyConfigValue(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)), source);
            } else {
                std::cerr << "Warning: Ignoring malformed line in " << source << ": '" << line << "'" << std::endl;
            }
        }
    }

    static std::optional<std::string> readEnv(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    // Load configuration: defaults, then the config file, then environment, then command-line arguments
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments) {
        AppConfig config;

        // --- Load from Config File ---
        // Try multiple config file locations
        std::vector<std::string> config_paths = {
            std::string(Constants::CONFIG_FILE_NAME),           // Current directory
            "../" + std::string(Constants::CONFIG_FILE_NAME),   // Parent directory
            "/app/" + std::string(Constants::CONFIG_FILE_NAME), // Docker container path
            "../../" + std::string(Constants::CONFIG_FILE_NAME) // Development path
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                std::cout << "Reading configuration from " << config_path << "..." << std::endl;
                config_found = true;
                loadConfigurationFile(configFile, config, config_path);
                break;
            }
        }

        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults, environment and command-line arguments." << std::endl;
        }

        // --- Environment ---
        if (auto val = readEnv("APPLICATION_NAME")) {
            applyConfigValue(config, "application_name", *val, "environment");
        }
        if (auto val = readEnv("EMISSARY_URL")) {
            applyConfigValue(config, "emissary_url", *val, "environment");
        }
        if (auto val = readEnv("STATSD_SERVER")) {
            applyConfigValue(config, "statsd_server", *val, "environment");
        }

        // --- Command-line arguments take precedence ---
        for (const auto& [key, value] : startupArguments) {
            applyConfigValue(config, key, value, "command line");
        }

        return config;
    }
};

#endif // UTILS_HPP
