#ifndef VOICE_INJECT_CONFIG_LOADER_H
#define VOICE_INJECT_CONFIG_LOADER_H

#include "core/playback_constants.h"

#include <filesystem>
#include <optional>
#include <string>

namespace voice_inject {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    struct PlaybackConfig {
        int outputSampleRate = PlaybackConstants::DEFAULT_OUTPUT_SAMPLE_RATE;
        double interChunkDelayMultiplier = PlaybackConstants::DEFAULT_INTER_CHUNK_DELAY_MULTIPLIER;
    } playback;

    struct AutoPauseConfig {
        bool enabled = true;
        double durationSeconds = PlaybackConstants::DEFAULT_AUTOPAUSE_DURATION_SECONDS;
        // websocket_settings.audio.pause_threshold; unset = env override / default
        std::optional<double> pauseThreshold;
    } autoPause;
};

/**
 * @brief Load AppConfig from JSON
 *
 * `outConfig` is reset to defaults first. Invalid individual fields are
 * warned about and keep their defaults.
 *
 * @return false if the file is missing or is not valid JSON
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

}  // namespace voice_inject

#endif  // VOICE_INJECT_CONFIG_LOADER_H
