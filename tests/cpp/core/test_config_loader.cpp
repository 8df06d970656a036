/**
 * @file test_config_loader.cpp
 * @brief Unit tests for config loader (JSON configuration)
 */

#include "core/config_loader.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace voice_inject;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        // Unique per test and process so parallel ctest runs never share a directory.
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("voice_inject_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        testConfigPath = tempDir / "test_config.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// Missing / malformed files
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    AppConfig config;
    EXPECT_FALSE(loadAppConfig("/nonexistent/path/config.json", config, false));
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    AppConfig config;
    config.playback.outputSampleRate = 1;
    loadAppConfig("/nonexistent/path/config.json", config, false);

    EXPECT_EQ(config.playback.outputSampleRate, 16000);
    EXPECT_DOUBLE_EQ(config.playback.interChunkDelayMultiplier, 0.9);
    EXPECT_TRUE(config.autoPause.enabled);
    EXPECT_DOUBLE_EQ(config.autoPause.durationSeconds, 1.0);
    EXPECT_FALSE(config.autoPause.pauseThreshold.has_value());
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeConfig("{}");
    AppConfig config;
    EXPECT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playback.outputSampleRate, 16000);
}

TEST_F(ConfigLoaderTest, InvalidJsonFallsBackToDefaults) {
    writeConfig("{ \"playback\": { \"outputSampleRate\": 48000, ");
    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playback.outputSampleRate, 16000);
}

TEST_F(ConfigLoaderTest, NonObjectRootIsRejected) {
    writeConfig("[1, 2, 3]");
    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
}

// ============================================================
// Sections
// ============================================================

TEST_F(ConfigLoaderTest, LoadPlaybackSection) {
    writeConfig(R"({
        "playback": {
            "outputSampleRate": 24000,
            "interChunkDelayMultiplier": 0.75
        }
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playback.outputSampleRate, 24000);
    EXPECT_DOUBLE_EQ(config.playback.interChunkDelayMultiplier, 0.75);
}

TEST_F(ConfigLoaderTest, InvalidPlaybackFieldsKeepDefaults) {
    writeConfig(R"({
        "playback": {
            "outputSampleRate": -8000,
            "interChunkDelayMultiplier": "fast"
        }
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playback.outputSampleRate, 16000);
    EXPECT_DOUBLE_EQ(config.playback.interChunkDelayMultiplier, 0.9);
}

TEST_F(ConfigLoaderTest, LoadAutoPauseSection) {
    writeConfig(R"({
        "autoPause": { "enabled": false, "durationSeconds": 2.5 }
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_FALSE(config.autoPause.enabled);
    EXPECT_DOUBLE_EQ(config.autoPause.durationSeconds, 2.5);
}

TEST_F(ConfigLoaderTest, LoadWebsocketPauseThreshold) {
    writeConfig(R"({
        "websocket_settings": { "audio": { "pause_threshold": 1500 } }
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    ASSERT_TRUE(config.autoPause.pauseThreshold.has_value());
    EXPECT_DOUBLE_EQ(*config.autoPause.pauseThreshold, 1500.0);
}

TEST_F(ConfigLoaderTest, NullOrInvalidPauseThresholdIsUnset) {
    writeConfig(R"({
        "websocket_settings": { "audio": { "pause_threshold": null } }
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_FALSE(config.autoPause.pauseThreshold.has_value());

    writeConfig(R"({
        "websocket_settings": { "audio": { "pause_threshold": 0 } }
    })");
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_FALSE(config.autoPause.pauseThreshold.has_value());
}

TEST_F(ConfigLoaderTest, UnknownKeysAreIgnored) {
    writeConfig(R"({
        "logging": { "level": "debug" },
        "somethingElse": 42,
        "playback": { "outputSampleRate": 48000 }
    })");
    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.playback.outputSampleRate, 48000);
}
