/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog wrapper
 */

#include "logging/logger.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unistd.h>

using namespace voxcap::logging;
namespace fs = std::filesystem;

TEST(Logger, ParsesLevelNames) {
    EXPECT_EQ(stringToLevel("info"), LogLevel::Info);
    EXPECT_EQ(stringToLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(stringToLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("err"), LogLevel::Error);
    EXPECT_EQ(stringToLevel("fatal"), LogLevel::Critical);
    EXPECT_EQ(stringToLevel("none"), LogLevel::Off);
    EXPECT_EQ(stringToLevel("unknown"), LogLevel::Info);
    EXPECT_EQ(levelToString(LogLevel::Debug), "debug");
}

TEST(Logger, ParseLogConfigKeepsDefaultsForMissingKeys) {
    auto section = nlohmann::json::parse(R"({ "level": "warn", "maxBackups": 2 })");
    LogConfig config = parseLogConfig(section);

    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.maxBackups, 2u);
    EXPECT_TRUE(config.consoleOutput);
    EXPECT_TRUE(config.filePath.empty());
}

TEST(Logger, ParseLogConfigThrowsOnTypeMismatch) {
    auto section = nlohmann::json::parse(R"({ "consoleOutput": "yes" })");
    EXPECT_THROW(parseLogConfig(section), nlohmann::json::exception);
}

TEST(Logger, HonorsConfiguredLevel) {
    ASSERT_TRUE(initializeEarly());
    setLevel(LogLevel::Warn);
    EXPECT_EQ(getLevel(), LogLevel::Warn);

    setLevel(LogLevel::Debug);
    EXPECT_EQ(getLevel(), LogLevel::Debug);

    setLevel(LogLevel::Info);  // reset for other tests
}

TEST(Logger, WritesToConfiguredFile) {
    fs::path logPath =
        fs::temp_directory_path() / ("voxcap_logger_test_" + std::to_string(getpid()) + ".log");
    fs::remove(logPath);

    LogConfig config;
    config.consoleOutput = false;
    config.filePath = logPath.string();
    ASSERT_TRUE(initialize(config));

    LOG_INFO("capture started on {}", "hw:Test");
    LOG_DEBUG("below the configured level");
    flush();

    std::ifstream file(logPath);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_NE(contents.str().find("capture started on hw:Test"), std::string::npos);
    EXPECT_EQ(contents.str().find("below the configured level"), std::string::npos);

    // Back to console logging for the remaining suites
    ASSERT_TRUE(initialize(LogConfig{}));
    fs::remove(logPath);
}

TEST(Logger, DumpRecentReplaysSuppressedMessages) {
    fs::path logPath =
        fs::temp_directory_path() / ("voxcap_logger_dump_" + std::to_string(getpid()) + ".log");
    fs::remove(logPath);

    LogConfig config;
    config.consoleOutput = false;
    config.level = LogLevel::Warn;
    config.filePath = logPath.string();
    ASSERT_TRUE(initialize(config));

    LOG_INFO("period size negotiated to {}", 480);
    flush();
    {
        std::ifstream file(logPath);
        std::stringstream contents;
        contents << file.rdbuf();
        EXPECT_EQ(contents.str().find("period size negotiated to 480"), std::string::npos);
    }

    dumpRecent();
    std::ifstream file(logPath);
    std::stringstream contents;
    contents << file.rdbuf();
    EXPECT_NE(contents.str().find("period size negotiated to 480"), std::string::npos);

    ASSERT_TRUE(initialize(LogConfig{}));
    fs::remove(logPath);
}

TEST(Logger, InitializeFromConfigReadsLoggingSection) {
    fs::path configPath =
        fs::temp_directory_path() / ("voxcap_logger_cfg_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream file(configPath);
        file << R"({ "logging": { "level": "error", "coloredOutput": false } })";
    }

    ASSERT_TRUE(initializeFromConfig(configPath.string()));
    EXPECT_EQ(getLevel(), LogLevel::Error);

    ASSERT_TRUE(initialize(LogConfig{}));
    EXPECT_EQ(getLevel(), LogLevel::Info);
    fs::remove(configPath);
}

TEST(Logger, RateLimitedMacrosCompileInHotPaths) {
    ASSERT_TRUE(initializeEarly());
    for (int i = 0; i < 10; ++i) {
        LOG_EVERY_N(WARN, 5, "xrun {}", i);
        LOG_ONCE(INFO, "first callback");
        LOG_IF(DEBUG, i == 3, "i is {}", i);
    }
    SUCCEED();
}
