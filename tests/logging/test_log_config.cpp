/**
 * @file test_log_config.cpp
 * @brief Unit tests for the shared spdlog setup
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "logging/log_config.hpp"

namespace lexitrie::logging::test {

namespace fs = std::filesystem;

class LogConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig::shutdown();
        tempDir_ = fs::temp_directory_path() / "lexitrie_logging_test";
        fs::create_directories(tempDir_);
    }

    void TearDown() override {
        LogConfig::shutdown();
        fs::remove_all(tempDir_);
    }

    auto fileConfig(LogLevel level = LogLevel::DEBUG) const -> LoggerConfig {
        LoggerConfig config;
        config.level = level;
        config.console_output = false;
        config.file_output = true;
        config.log_file_path = (tempDir_ / "lexitrie.log").string();
        return config;
    }

    auto readLog() const -> std::string {
        LogConfig::flushAll();
        std::ifstream file(tempDir_ / "lexitrie.log");
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    fs::path tempDir_;
};

TEST_F(LogConfigTest, LevelNames) {
    EXPECT_EQ(logLevelToString(LogLevel::WARN), "warn");
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("err"), LogLevel::ERROR);
    EXPECT_EQ(logLevelFromString("none"), LogLevel::OFF);
    EXPECT_EQ(logLevelFromString("bogus"), LogLevel::INFO);
    EXPECT_EQ(LogConfig::convertLevel(LogLevel::CRITICAL),
              spdlog::level::critical);
    EXPECT_EQ(LogConfig::convertLevel(spdlog::level::trace), LogLevel::TRACE);
}

TEST_F(LogConfigTest, InitializeAndShutdown) {
    EXPECT_FALSE(LogConfig::isInitialized());
    LogConfig::initialize(fileConfig());
    EXPECT_TRUE(LogConfig::isInitialized());
    EXPECT_EQ(spdlog::default_logger()->name(), "lexitrie");

    LogConfig::shutdown();
    EXPECT_FALSE(LogConfig::isInitialized());
    ASSERT_NE(spdlog::default_logger(), nullptr);
}

TEST_F(LogConfigTest, GetLoggerReturnsSharedInstance) {
    auto first = LogConfig::getLogger("lexitrie.test");
    auto second = LogConfig::getLogger("lexitrie.test");
    EXPECT_EQ(first, second);
    EXPECT_NE(first, LogConfig::getLogger("lexitrie.other"));

    auto const metrics = LogConfig::getMetrics();
    EXPECT_EQ(metrics["registered_loggers"], 2);
}

TEST_F(LogConfigTest, ComponentLoggersWriteToFile) {
    LogConfig::initialize(fileConfig());
    auto logger = LogConfig::getLogger("lexitrie.test");
    LEXITRIE_LOG_INFO(logger, "stored {} keys", 42);
    LEXITRIE_LOG_TRACE(logger, "below the configured level");

    auto const contents = readLog();
    EXPECT_NE(contents.find("stored 42 keys"), std::string::npos);
    EXPECT_NE(contents.find("[lexitrie.test]"), std::string::npos);
    EXPECT_EQ(contents.find("below the configured level"), std::string::npos);
}

TEST_F(LogConfigTest, LoggersCreatedEarlyAreRebound) {
    auto early = LogConfig::getLogger("lexitrie.early");
    LogConfig::initialize(fileConfig());

    early->info("after initialization");
    EXPECT_NE(readLog().find("after initialization"), std::string::npos);
}

TEST_F(LogConfigTest, GlobalLevelAppliesToExistingLoggers) {
    LogConfig::initialize(fileConfig(LogLevel::INFO));
    auto logger = LogConfig::getLogger("lexitrie.test");

    LogConfig::setGlobalLevel(LogLevel::ERROR);
    EXPECT_EQ(LogConfig::globalLevel(), LogLevel::ERROR);
    logger->warn("suppressed warning");
    logger->error("reported error");

    auto const contents = readLog();
    EXPECT_EQ(contents.find("suppressed warning"), std::string::npos);
    EXPECT_NE(contents.find("reported error"), std::string::npos);
}

TEST_F(LogConfigTest, MetricsCountMessages) {
    LogConfig::initialize(fileConfig());
    auto logger = LogConfig::getLogger("lexitrie.test");

    auto const before = LogConfig::getMetrics();
    logger->info("one");
    logger->error("two");
    auto const after = LogConfig::getMetrics();

    EXPECT_EQ(after["total_logs"].get<std::uint64_t>(),
              before["total_logs"].get<std::uint64_t>() + 2);
    EXPECT_EQ(after["error_count"].get<std::uint64_t>(),
              before["error_count"].get<std::uint64_t>() + 1);
    EXPECT_EQ(after["global_level"], "debug");
    EXPECT_TRUE(after["initialized"].get<bool>());
}

TEST_F(LogConfigTest, MacrosIgnoreMissingLogger) {
    std::shared_ptr<spdlog::logger> none;
    LEXITRIE_LOG_ERROR(none, "nothing to write to");
    SUCCEED();
}

TEST_F(LogConfigTest, MacrosBindAsSingleStatements) {
    LogConfig::initialize(fileConfig());
    auto logger = LogConfig::getLogger("lexitrie.test");

    bool elseTaken = false;
    bool const condition = false;
    if (condition)
        LEXITRIE_LOG_INFO(logger, "condition held");
    else
        elseTaken = true;
    EXPECT_TRUE(elseTaken);

    std::shared_ptr<spdlog::logger> none;
    elseTaken = false;
    if (condition)
        LEXITRIE_LOG_WARN(none, "condition held");
    else
        elseTaken = true;
    EXPECT_TRUE(elseTaken);

    elseTaken = false;
    if (!condition)
        LEXITRIE_LOG_INFO(logger, "branch taken");
    else
        elseTaken = true;
    EXPECT_FALSE(elseTaken);

    auto const contents = readLog();
    EXPECT_NE(contents.find("branch taken"), std::string::npos);
    EXPECT_EQ(contents.find("condition held"), std::string::npos);
}

}  // namespace lexitrie::logging::test
