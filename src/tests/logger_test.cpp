#include <gtest/gtest.h>
#include <boost/log/core.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include "logger/logger.hpp"

using namespace pneumatic::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = std::filesystem::temp_directory_path() / "pneumatic_logger_test.log";
        std::filesystem::remove(log_path);

        // Initialize logging
        init_logging(log_path.string(), severity_level::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove(log_path);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();

        std::ifstream file(log_path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }

    std::filesystem::path log_path;
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(severity_level::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

// Test that a fresh init truncates the previous run's log
TEST_F(LoggerTest, ReinitTruncates) {
    BOOST_LOG_TRIVIAL(info) << "First run";
    ASSERT_TRUE(log_contains("First run"));

    init_logging(log_path.string(), severity_level::info);
    BOOST_LOG_TRIVIAL(info) << "Second run";

    EXPECT_FALSE(log_contains("First run"));
    EXPECT_TRUE(log_contains("Second run"));
}

// Test that every name Boost.Log prints parses back to its level
TEST_F(LoggerTest, SeverityNames) {
    EXPECT_EQ(parse_severity("trace"), severity_level::trace);
    EXPECT_EQ(parse_severity("warning"), severity_level::warning);
    EXPECT_EQ(parse_severity(boost::log::trivial::to_string(severity_level::fatal)), severity_level::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}

TEST_F(LoggerTest, ConsoleLoggingReplacesFileSink) {
    init_console_logging(severity_level::error);

    BOOST_LOG_TRIVIAL(error) << "Console only";
    EXPECT_FALSE(log_contains("Console only"));
}
