/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Logger tests
 */

#include "util/logger.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using mailrlm::util::LogConfig;
using mailrlm::util::LogLevel;
using mailrlm::util::Logger;

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("err"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("fatal"), LogLevel::Critical);
    EXPECT_EQ(Logger::parse_level("none"), LogLevel::Off);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
}

TEST(LoggerTest, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(Logger::parse_level(Logger::level_to_string(level)), level);
    }
}

TEST(LoggerTest, WritesComponentTaggedLinesToFile) {
    mailrlm::testing::TempDir dir;
    auto log_file = dir / "mailrlm.log";

    LogConfig config;
    config.level = LogLevel::Info;
    config.file_path = log_file.string();
    config.enable_console = false;
    Logger::init(config);

    MAILRLM_LOG_INFO(mailrlm::util::log_component::Checkpoint, "saved {} of {}", 10, 25);
    MAILRLM_LOG_DEBUG(mailrlm::util::log_component::Checkpoint, "filtered out");
    Logger::instance().flush();

    auto content = mailrlm::testing::read_text(log_file);
    EXPECT_NE(content.find("[checkpoint] saved 10 of 25"), std::string::npos);
    EXPECT_EQ(content.find("filtered out"), std::string::npos);

    mailrlm::testing::quiet_logging();
}

TEST(LoggerTest, SetLevelChangesFiltering) {
    mailrlm::testing::quiet_logging();
    auto& logger = Logger::instance();

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.get_level(), LogLevel::Debug);

    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.get_level(), LogLevel::Error);
}
