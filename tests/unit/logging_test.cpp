#include "core/logging.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace sweep_recon::logging;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        LoggerFactory::shutdown();
        LoggerFactory::configure(LogConfig{});
        std::filesystem::remove_all(std::filesystem::temp_directory_path() / "logging_test");
    }
};

TEST_F(LoggingTest, LevelFromString) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("info"), LogLevel::Info);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("critical"), LogLevel::Critical);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::Off);
}

TEST_F(LoggingTest, UnknownLevelRejected) {
    EXPECT_FALSE(logLevelFromString("verbose").has_value());
    EXPECT_FALSE(logLevelFromString("INFO").has_value());
    EXPECT_FALSE(logLevelFromString("").has_value());
}

TEST_F(LoggingTest, LevelStringRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warning, LogLevel::Error, LogLevel::Critical,
                       LogLevel::Off}) {
        EXPECT_EQ(logLevelFromString(toString(level)), level);
    }
}

TEST_F(LoggingTest, CreateReturnsRegisteredLogger) {
    auto first = LoggerFactory::create("LoggingTestStage");
    auto second = LoggerFactory::create("LoggingTestStage");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "LoggingTestStage");
}

TEST_F(LoggingTest, ConfigureAppliesLevel) {
    LogConfig config;
    config.level = LogLevel::Error;
    LoggerFactory::configure(config);
    EXPECT_TRUE(LoggerFactory::isConfigured());
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);

    auto logger = LoggerFactory::create("LoggingTestConfigured");
    EXPECT_EQ(logger->level(), spdlog::level::err);
}

TEST_F(LoggingTest, SetGlobalLevelUpdatesExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingTestExisting");
    LoggerFactory::setGlobalLevel(LogLevel::Debug);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Debug);
}

TEST_F(LoggingTest, FileLoggingWritesRunLog) {
    auto dir = std::filesystem::temp_directory_path() / "logging_test";
    LogConfig config;
    config.enableFileLogging = true;
    config.logDirectory = dir;
    LoggerFactory::configure(config);

    auto logger = LoggerFactory::create("LoggingTestFile");
    logger->info("written to file");
    logger->flush();

    EXPECT_TRUE(std::filesystem::exists(dir / "sweep_recon.log"));
    EXPECT_GT(std::filesystem::file_size(dir / "sweep_recon.log"), 0u);
}

TEST_F(LoggingTest, ShutdownClearsConfiguration) {
    LoggerFactory::configure(LogConfig{});
    LoggerFactory::shutdown();
    EXPECT_FALSE(LoggerFactory::isConfigured());
}
