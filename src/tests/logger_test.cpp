#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace pwv::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        test_dir = make_test_dir("logger_test");
        log_file = test_dir / "test.log";

        // Initialize logging
        init_logging(log_file.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        enable_logging();
        quiet_logging();

        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        return read_file(log_file).find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, SeverityLevels) {
    BOOST_LOG_TRIVIAL(trace) << "Trace message";
    BOOST_LOG_TRIVIAL(debug) << "Debug message";
    BOOST_LOG_TRIVIAL(info) << "Info message";
    BOOST_LOG_TRIVIAL(warning) << "Warning message";
    BOOST_LOG_TRIVIAL(error) << "Error message";
    BOOST_LOG_TRIVIAL(fatal) << "Fatal message";

    EXPECT_TRUE(log_contains("Trace message"));
    EXPECT_TRUE(log_contains("Debug message"));
    EXPECT_TRUE(log_contains("Info message"));
    EXPECT_TRUE(log_contains("Warning message"));
    EXPECT_TRUE(log_contains("Error message"));
    EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
    disable_logging();
    BOOST_LOG_TRIVIAL(info) << "Should not appear";

    enable_logging();
    BOOST_LOG_TRIVIAL(info) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

// Re-initializing starts a fresh file
TEST_F(LoggerTest, InitTruncatesLogFile) {
    BOOST_LOG_TRIVIAL(info) << "Before re-init";
    EXPECT_TRUE(log_contains("Before re-init"));

    init_logging(log_file.string(), boost::log::trivial::trace);
    EXPECT_FALSE(log_contains("Before re-init"));
    EXPECT_TRUE(log_contains("Logging system initialized"));
}
