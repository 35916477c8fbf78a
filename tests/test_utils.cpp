// tests/test_utils.cpp
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp"

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"key1=value1", "key2=value2"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at("key1"), "value1");
    EXPECT_EQ(result->at("key2"), "value2");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    std::vector<std::string> args = {"keyvalue"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    std::vector<std::string> args = {"=value"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    // The current implementation returns nullopt if *any* arg is invalid
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

// --- Tests for applyConfigValue / loadConfigurationFile ---

namespace {
    // Silences configuration warnings for the lifetime of the guard
    class CerrCapture {
    public:
        CerrCapture() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
        ~CerrCapture() { std::cerr.rdbuf(old_); }
        std::string str() const { return captured_.str(); }

    private:
        std::ostringstream captured_;
        std::streambuf* old_;
    };
}

TEST(UtilsTest, AppConfigDefaults) {
    AppConfig config;
    EXPECT_EQ(config.application_name, "todoify");
    EXPECT_EQ(config.port, 5000);
    EXPECT_EQ(config.todo_ttl_seconds, 300);
    EXPECT_EQ(config.cleanup_interval_seconds, 30);
    EXPECT_TRUE(config.emissary_url.empty());
    EXPECT_TRUE(config.statsd_server.empty());
}

TEST(UtilsTest, ApplyConfigValueAcceptsKnownKeys) {
    AppConfig config;
    EXPECT_TRUE(Utils::applyConfigValue(config, "port", "8081", "test"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "todo_ttl_seconds", "60", "test"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "cleanup_interval_seconds", "0", "test"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "log_level", "DEBUG", "test"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "emissary_url", "https://emissary.example.com:8443/hook", "test"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "statsd_server", "localhost:8125", "test"));

    EXPECT_EQ(config.port, 8081);
    EXPECT_EQ(config.todo_ttl_seconds, 60);
    EXPECT_EQ(config.cleanup_interval_seconds, 0);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(config.emissary_url, "https://emissary.example.com:8443/hook");
    EXPECT_EQ(config.statsd_server, "localhost:8125");
}

TEST(UtilsTest, ApplyConfigValueRejectsInvalidValues) {
    CerrCapture capture;
    AppConfig config;

    EXPECT_FALSE(Utils::applyConfigValue(config, "port", "abc", "test"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "port", "70000", "test"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "todo_ttl_seconds", "0", "test"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "cleanup_interval_seconds", "-5", "test"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "log_level", "LOUD", "test"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "emissary_url", "ftp://nope", "test"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "application_name", "", "test"));

    AppConfig defaults;
    EXPECT_EQ(config.port, defaults.port);
    EXPECT_EQ(config.todo_ttl_seconds, defaults.todo_ttl_seconds);
    EXPECT_EQ(config.cleanup_interval_seconds, defaults.cleanup_interval_seconds);
    EXPECT_EQ(config.log_level, defaults.log_level);
    EXPECT_EQ(config.emissary_url, defaults.emissary_url);
    EXPECT_EQ(config.application_name, defaults.application_name);
    EXPECT_NE(capture.str().find("Invalid port"), std::string::npos);
}

TEST(UtilsTest, ApplyConfigValueWarnsOnUnknownKey) {
    CerrCapture capture;
    AppConfig config;
    EXPECT_FALSE(Utils::applyConfigValue(config, "frontend_port", "9000", "test"));
    EXPECT_NE(capture.str().find("Unknown configuration key 'frontend_port'"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationFileParsesKeyValueLines) {
    CerrCapture capture;
    std::istringstream file(
        "# comment line\n"
        "\n"
        "port = 7000\n"
        "  application_name=todo-demo  \n"
        "this line is malformed\n"
        "todo_ttl_seconds = 120\n");

    AppConfig config;
    Utils::loadConfigurationFile(file, config, "inline");

    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.application_name, "todo-demo");
    EXPECT_EQ(config.todo_ttl_seconds, 120);
    EXPECT_NE(capture.str().find("malformed"), std::string::npos);
}

TEST(UtilsTest, LoadConfigurationCommandLineOverridesEnvironment) {
    CerrCapture capture;
    ::setenv("APPLICATION_NAME", "from-env", 1);
    ::setenv("EMISSARY_URL", "http://emissary.env:9000", 1);

    AppConfig env_only = Utils::loadConfiguration({{"port", "6123"}});
    EXPECT_EQ(env_only.application_name, "from-env");
    EXPECT_EQ(env_only.emissary_url, "http://emissary.env:9000");
    EXPECT_EQ(env_only.port, 6123);

    AppConfig overridden = Utils::loadConfiguration({{"application_name", "from-cli"}});
    EXPECT_EQ(overridden.application_name, "from-cli");

    ::unsetenv("APPLICATION_NAME");
    ::unsetenv("EMISSARY_URL");
}

TEST(UtilsTest, LoadConfigurationIgnoresInvalidOverride) {
    CerrCapture capture;
    AppConfig baseline = Utils::loadConfiguration({});
    AppConfig config = Utils::loadConfiguration({{"port", "abc"}});
    EXPECT_EQ(config.port, baseline.port);
}

// --- Tests for string helpers ---

TEST(UtilsTest, TrimStripsSurroundingWhitespace) {
    EXPECT_EQ(Utils::trim("  hello \t\n"), "hello");
    EXPECT_EQ(Utils::trim("inner  space"), "inner  space");
    EXPECT_EQ(Utils::trim(""), "");
    EXPECT_EQ(Utils::trim(" \t\r\n "), "");
}

TEST(UtilsTest, StringToInt) {
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_EQ(Utils::stringToInt("-7"), -7);
    EXPECT_FALSE(Utils::stringToInt("42abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999999999999").has_value());
}

TEST(UtilsTest, StringToLogLevel) {
    EXPECT_EQ(Utils::stringToLogLevel("DEBUG"), LogUtils::LogLevel::DEBUG);
    EXPECT_EQ(Utils::stringToLogLevel("INFO"), LogUtils::LogLevel::INFO);
    EXPECT_EQ(Utils::stringToLogLevel("WARNING"), LogUtils::LogLevel::WARN);
    EXPECT_EQ(Utils::stringToLogLevel("CERROR"), LogUtils::LogLevel::CERROR);
    EXPECT_THROW(Utils::stringToLogLevel("debug"), std::invalid_argument);
}

TEST(UtilsTest, ParseTodoId) {
    EXPECT_EQ(Utils::parseTodoId("1"), 1u);
    EXPECT_EQ(Utils::parseTodoId("007"), 7u);
    EXPECT_EQ(Utils::parseTodoId("9999999999999999999"), 9999999999999999999ull);
    EXPECT_FALSE(Utils::parseTodoId("").has_value());
    EXPECT_FALSE(Utils::parseTodoId("0").has_value());
    EXPECT_FALSE(Utils::parseTodoId("-1").has_value());
    EXPECT_FALSE(Utils::parseTodoId("+1").has_value());
    EXPECT_FALSE(Utils::parseTodoId("12a").has_value());
    EXPECT_FALSE(Utils::parseTodoId("12345678901234567890").has_value());
}

TEST(UtilsTest, IsHttpUrl) {
    EXPECT_TRUE(Utils::isHttpUrl("http://localhost"));
    EXPECT_TRUE(Utils::isHttpUrl("https://emissary.example.com:8443/path?x=1"));
    EXPECT_FALSE(Utils::isHttpUrl("localhost:8080"));
    EXPECT_FALSE(Utils::isHttpUrl("ftp://example.com"));
    EXPECT_FALSE(Utils::isHttpUrl("http://example.com:0"));
    EXPECT_FALSE(Utils::isHttpUrl("http://example.com:65536"));
}

TEST(UtilsTest, FormatIsoTimestamp) {
    using namespace std::chrono;
    system_clock::time_point tp{seconds(1714564800)};
    EXPECT_EQ(Utils::formatIsoTimestamp(tp), "2024-05-01T12:00:00.000Z");
    EXPECT_EQ(Utils::formatIsoTimestamp(tp + minutes(5) + milliseconds(42)), "2024-05-01T12:05:00.042Z");
    EXPECT_EQ(Utils::formatIsoTimestamp(system_clock::time_point{}), "1970-01-01T00:00:00.000Z");
}
