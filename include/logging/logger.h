/**
 * @file logger.h
 * @brief Process-wide logging for the voice_inject playback core
 *
 * Thin wrapper around a single spdlog logger shared by the accumulator,
 * the playback worker and the control-message handlers. Library code only
 * uses the LOG_* macros below; the host process decides sinks and level.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace voice_inject {
namespace logging {

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Sink and format settings
 *
 * Console output goes to stderr so that a host piping PCM through stdout
 * is never corrupted by log lines.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;                                        // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);  // 5 MB
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Create (or reconfigure) the shared logger
 *
 * Calling it again after a successful initialization only updates the
 * level and pattern; sinks are kept.
 *
 * @return false if spdlog refused to create a sink (e.g. unwritable file)
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Console-only logger for use before any config file is read
 */
bool initializeEarly();

/**
 * @brief Initialize from the "logging" section of a JSON config file
 *
 * Missing file or missing section means defaults.
 */
bool initializeFromConfig(const std::string& configPath);

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Shared logger, created with defaults on first use
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive); unknown names map to Info
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace voice_inject

#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                    \
    do {                                                  \
        auto logger = voice_inject::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_DEBUG(...)                                    \
    do {                                                  \
        auto logger = voice_inject::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_INFO(...)                                     \
    do {                                                  \
        auto logger = voice_inject::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);      \
    } while (0)

#define LOG_WARN(...)                                     \
    do {                                                  \
        auto logger = voice_inject::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);      \
    } while (0)

#define LOG_ERROR(...)                                    \
    do {                                                  \
        auto logger = voice_inject::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_CRITICAL(...)                                 \
    do {                                                  \
        auto logger = voice_inject::logging::getLogger(); \
        if (logger)                                       \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__);  \
    } while (0)

// Rate-limited logging for per-frame paths (the worker runs at 10 frames/s).
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)
