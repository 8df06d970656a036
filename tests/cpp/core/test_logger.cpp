/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog wrapper
 */

#include "logging/logger.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace voice_inject::logging;

class LoggerTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        shutdown();
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info ? std::string(info->name()) : "unknown_test";
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("voice_inject_logger_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        shutdown();
        fs::remove_all(tempDir);
    }
};

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    EXPECT_EQ(levelToString(LogLevel::Warn), "warn");
    EXPECT_EQ(stringToLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(stringToLevel("error"), LogLevel::Error);
}

TEST_F(LoggerTest, UnknownLevelNameMapsToInfo) {
    EXPECT_EQ(stringToLevel("chatty"), LogLevel::Info);
}

TEST_F(LoggerTest, GetLoggerInitializesLazily) {
    auto logger = getLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "voice_inject");
}

TEST_F(LoggerTest, SetLevelIsVisible) {
    ASSERT_TRUE(initializeEarly());
    setLevel(LogLevel::Error);
    EXPECT_EQ(getLevel(), LogLevel::Error);
    setLevel(LogLevel::Debug);
    EXPECT_EQ(getLevel(), LogLevel::Debug);
}

TEST_F(LoggerTest, FileSinkReceivesMessages) {
    LogConfig config;
    config.consoleOutput = false;
    config.filePath = (tempDir / "playback.log").string();
    config.level = LogLevel::Info;
    ASSERT_TRUE(initialize(config));

    LOG_WARN("pause requested for {} ms", 1500);
    flush();

    std::ifstream in(config.filePath);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("pause requested for 1500 ms"), std::string::npos);
}

TEST_F(LoggerTest, InitializeFromConfigReadsLevel) {
    const fs::path configPath = tempDir / "config.json";
    {
        std::ofstream out(configPath);
        out << R"({"logging": {"level": "warn", "consoleOutput": true}})";
    }
    ASSERT_TRUE(initializeFromConfig(configPath.string()));
    EXPECT_EQ(getLevel(), LogLevel::Warn);
}

TEST_F(LoggerTest, InitializeFromMissingConfigUsesDefaults) {
    ASSERT_TRUE(initializeFromConfig((tempDir / "missing.json").string()));
    EXPECT_EQ(getLevel(), LogLevel::Info);
}
