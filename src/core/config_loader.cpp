#include "core/config_loader.h"

#include "logging/logger.h"

#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>

namespace voice_inject {

namespace {

void loadPlaybackSection(const nlohmann::json& playback, AppConfig::PlaybackConfig& out,
                         bool verbose) {
    if (playback.contains("outputSampleRate")) {
        const auto& v = playback["outputSampleRate"];
        if (v.is_number_integer() && v.get<int>() > 0) {
            out.outputSampleRate = v.get<int>();
        } else if (verbose) {
            LOG_WARN("Config: playback.outputSampleRate must be a positive integer, using {}",
                     out.outputSampleRate);
        }
    }
    if (playback.contains("interChunkDelayMultiplier")) {
        const auto& v = playback["interChunkDelayMultiplier"];
        if (v.is_number() && v.get<double>() >= 0.0 && std::isfinite(v.get<double>())) {
            out.interChunkDelayMultiplier = v.get<double>();
        } else if (verbose) {
            LOG_WARN("Config: playback.interChunkDelayMultiplier must be >= 0, using {}",
                     out.interChunkDelayMultiplier);
        }
    }
}

void loadAutoPauseSection(const nlohmann::json& autoPause, AppConfig::AutoPauseConfig& out,
                          bool verbose) {
    if (autoPause.contains("enabled") && autoPause["enabled"].is_boolean()) {
        out.enabled = autoPause["enabled"].get<bool>();
    }
    if (autoPause.contains("durationSeconds")) {
        const auto& v = autoPause["durationSeconds"];
        if (v.is_number() && v.get<double>() > 0.0) {
            out.durationSeconds = v.get<double>();
        } else if (verbose) {
            LOG_WARN("Config: autoPause.durationSeconds must be > 0, using {}",
                     out.durationSeconds);
        }
    }
}

// websocket_settings.audio.pause_threshold, as stored in the bot's settings.
void loadWebsocketSettings(const nlohmann::json& ws, AppConfig::AutoPauseConfig& out,
                           bool verbose) {
    if (!ws.contains("audio") || !ws["audio"].is_object()) {
        return;
    }
    const auto& audio = ws["audio"];
    if (!audio.contains("pause_threshold") || audio["pause_threshold"].is_null()) {
        return;
    }
    const auto& v = audio["pause_threshold"];
    if (v.is_number() && v.get<double>() > 0.0) {
        out.pauseThreshold = v.get<double>();
    } else if (verbose) {
        LOG_WARN("Config: websocket_settings.audio.pause_threshold must be > 0, ignoring");
    }
}

}  // namespace

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            if (verbose) {
                LOG_WARN("Config: {} is not a JSON object, using defaults", configPath.string());
            }
            return false;
        }

        if (j.contains("playback") && j["playback"].is_object()) {
            loadPlaybackSection(j["playback"], outConfig.playback, verbose);
        }
        if (j.contains("autoPause") && j["autoPause"].is_object()) {
            loadAutoPauseSection(j["autoPause"], outConfig.autoPause, verbose);
        }
        if (j.contains("websocket_settings") && j["websocket_settings"].is_object()) {
            loadWebsocketSettings(j["websocket_settings"], outConfig.autoPause, verbose);
        }
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AppConfig{};
        return false;
    }

    return true;
}

}  // namespace voice_inject
