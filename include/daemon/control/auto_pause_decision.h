#pragma once

#include "audio/pcm.h"
#include "core/playback_constants.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace voice_inject {
namespace control {

enum class ThresholdSource { Instance, Environment, Default };

const char* thresholdSourceToString(ThresholdSource source);

struct ResolvedThreshold {
    double value = PlaybackConstants::DEFAULT_AUTOPAUSE_THRESHOLD;
    ThresholdSource source = ThresholdSource::Default;
};

/**
 * @brief Pick the loudness threshold
 *
 * Precedence: per-instance setting, then the environment value, then
 * DEFAULT_AUTOPAUSE_THRESHOLD. Non-positive or unparseable values fall
 * through to the next source.
 *
 * @param instanceSetting Value from the bot's websocket audio settings
 * @param envValue Raw environment string (nullptr when unset)
 */
ResolvedThreshold resolveAutoPauseThreshold(std::optional<double> instanceSetting,
                                            const char* envValue);

struct AutoPauseConfig {
    bool enabled = true;
    std::optional<double> instanceThreshold;
    double pauseDurationSeconds = PlaybackConstants::DEFAULT_AUTOPAUSE_DURATION_SECONDS;
};

/**
 * @brief Pauses bot speech while other participants are talking
 *
 * Measures the RMS of each inbound mixed-audio chunk and, when it meets the
 * threshold, requests a fixed pause window through `pauseFor`. Re-triggers
 * extend the pause through the gate's max rule. The threshold is resolved
 * once, at construction.
 */
class AutoPauseDecision {
   public:
    using PauseFn = std::function<void(double seconds)>;

    // Reads AUTOPAUSE_THRESHOLD_ENV_VAR from the process environment.
    AutoPauseDecision(const AutoPauseConfig& config, PauseFn pauseFor);

    // Returns true if a pause was requested.
    bool onMixedAudio(const uint8_t* data, std::size_t bytes);
    bool onMixedAudio(const audio::PcmBytes& chunk) {
        return onMixedAudio(chunk.data(), chunk.size());
    }

    double threshold() const {
        return threshold_.value;
    }
    ThresholdSource thresholdSource() const {
        return threshold_.source;
    }
    double pauseDurationSeconds() const {
        return pauseDurationSeconds_;
    }
    uint64_t triggerCount() const {
        return triggers_;
    }

   private:
    bool enabled_;
    ResolvedThreshold threshold_;
    double pauseDurationSeconds_;
    PauseFn pauseFor_;
    uint64_t triggers_{0};
};

}  // namespace control
}  // namespace voice_inject
