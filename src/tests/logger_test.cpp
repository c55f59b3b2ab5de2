#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace dagsync::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = dagsync::test::unique_temp_dir("logger_test");
        std::filesystem::create_directories(log_dir);
        log_file = log_dir / "dagsync-test.log";
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        dagsync::test::init_logging();

        if (std::filesystem::exists(log_dir)) {
            std::filesystem::remove_all(log_dir);
        }
    }

    std::string log_contents() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }
};

TEST_F(LoggerTest, BasicLogging) {
    init_logging(log_file.string(), severity_level::trace);
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    std::string content = log_contents();
    EXPECT_NE(content.find("Test info message"), std::string::npos);
    EXPECT_NE(content.find("Test error message"), std::string::npos);
    EXPECT_NE(content.find("[error]"), std::string::npos);
    EXPECT_NE(content.find("[Thread "), std::string::npos);
}

TEST_F(LoggerTest, MinimumLevelFilters) {
    init_logging(log_file.string(), severity_level::warning);
    BOOST_LOG_TRIVIAL(debug) << "hidden debug line";
    BOOST_LOG_TRIVIAL(warning) << "visible warning line";

    std::string content = log_contents();
    EXPECT_EQ(content.find("hidden debug line"), std::string::npos);
    EXPECT_NE(content.find("visible warning line"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossInitializations) {
    init_logging(log_file.string(), severity_level::info);
    BOOST_LOG_TRIVIAL(info) << "first session";
    init_logging(log_file.string(), severity_level::info);
    BOOST_LOG_TRIVIAL(info) << "second session";

    std::string content = log_contents();
    EXPECT_NE(content.find("first session"), std::string::npos);
    EXPECT_NE(content.find("second session"), std::string::npos);
}

TEST_F(LoggerTest, ParsesSeverityNames) {
    EXPECT_EQ(severity_from_string("trace"), severity_level::trace);
    EXPECT_EQ(severity_from_string("debug"), severity_level::debug);
    EXPECT_EQ(severity_from_string("warning"), severity_level::warning);
    EXPECT_EQ(severity_from_string("fatal"), severity_level::fatal);
    EXPECT_THROW(severity_from_string("loud"), std::invalid_argument);
    EXPECT_THROW(severity_from_string(""), std::invalid_argument);
}
