/**
 * @file logger.cpp
 * @brief spdlog-backed implementation of voice_inject::logging
 */

#include "logging/logger.h"

#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <type_traits>
#include <vector>

namespace voice_inject {
namespace logging {

namespace {

constexpr const char* kLoggerName = "voice_inject";

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
    std::string_view alias;  // accepted by stringToLevel only
};

constexpr std::array<LevelEntry, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace", ""},
    {LogLevel::Debug, spdlog::level::debug, "debug", ""},
    {LogLevel::Info, spdlog::level::info, "info", ""},
    {LogLevel::Warn, spdlog::level::warn, "warn", "warning"},
    {LogLevel::Error, spdlog::level::err, "error", "err"},
    {LogLevel::Critical, spdlog::level::critical, "critical", "fatal"},
    {LogLevel::Off, spdlog::level::off, "off", "none"},
}};

constexpr const LevelEntry& kInfoEntry = kLevels[2];

const LevelEntry& entryFor(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kInfoEntry;
}

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

std::vector<spdlog::sink_ptr> makeSinks(const LogConfig& config) {
    const auto level = entryFor(config.level).spdlogLevel;
    std::vector<spdlog::sink_ptr> sinks;

    if (config.consoleOutput) {
        // stderr: hosts may stream PCM over stdout
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    for (auto& sink : sinks) {
        sink->set_level(level);
    }
    return sinks;
}

template <typename T>
void readField(const nlohmann::json& section, const char* key, T& out) {
    if (!section.contains(key)) {
        return;
    }
    const auto& v = section[key];
    if constexpr (std::is_same_v<T, bool>) {
        if (v.is_boolean()) {
            out = v.get<bool>();
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (v.is_string()) {
            out = v.get<std::string>();
        }
    } else {
        if (v.is_number_unsigned()) {
            out = v.get<T>();
        }
    }
}

LogConfig configFromSection(const nlohmann::json& section) {
    LogConfig config;
    std::string level;
    readField(section, "level", level);
    if (!level.empty()) {
        config.level = stringToLevel(level);
    }
    readField(section, "filePath", config.filePath);
    readField(section, "maxFileSize", config.maxFileSize);
    readField(section, "maxBackups", config.maxBackups);
    readField(section, "consoleOutput", config.consoleOutput);
    readField(section, "coloredOutput", config.coloredOutput);
    readField(section, "pattern", config.pattern);
    return config;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    const auto level = entryFor(config.level).spdlogLevel;

    if (g_initialized.load(std::memory_order_acquire)) {
        g_logger->set_level(level);
        g_logger->set_pattern(config.pattern);
        return true;
    }

    try {
        auto sinks = makeSinks(config);
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);
        g_logger = std::move(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "voice_inject: logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
    g_initialized.store(true, std::memory_order_release);

    if (!config.filePath.empty()) {
        LOG_INFO("Logging to {} ({} bytes x {} backups, level {})", config.filePath,
                 config.maxFileSize, config.maxBackups, levelToString(config.level));
    }
    return true;
}

bool initializeEarly() {
    return initialize(LogConfig{});
}

bool initializeFromConfig(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return initialize(LogConfig{});
    }

    nlohmann::json root = nlohmann::json::parse(file, nullptr, false);
    if (root.is_discarded()) {
        std::cerr << "voice_inject: " << configPath << " is not valid JSON, default logging"
                  << std::endl;
        return initialize(LogConfig{});
    }
    if (!root.is_object() || !root.contains("logging") || !root["logging"].is_object()) {
        return initialize(LogConfig{});
    }
    return initialize(configFromSection(root["logging"]));
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!g_logger) {
        return;
    }
    g_logger->flush();
    g_initialized.store(false, std::memory_order_release);
    spdlog::drop(kLoggerName);
    g_logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (!logger) {
        return;
    }
    const auto spdlogLevel = entryFor(level).spdlogLevel;
    logger->set_level(spdlogLevel);
    for (auto& sink : logger->sinks()) {
        sink->set_level(spdlogLevel);
    }
}

LogLevel getLevel() {
    auto logger = getLogger();
    if (!logger) {
        return LogLevel::Info;
    }
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == logger->level()) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

void flush() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!g_initialized.load(std::memory_order_acquire)) {
        initialize();
    }
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str.size(), '\0');
    for (std::size_t i = 0; i < str.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    }
    for (const auto& entry : kLevels) {
        if (lower == entry.name || (!entry.alias.empty() && lower == entry.alias)) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace voice_inject
