#include "daemon/control/auto_pause_decision.h"

#include "logging/logger.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace voice_inject {
namespace control {

namespace {

std::optional<double> parseThreshold(const char* raw) {
    if (!raw || *raw == '\0') {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const std::string text(raw);
        const double value = std::stod(text, &consumed);
        while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed]))) {
            ++consumed;
        }
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

bool usable(double value) {
    return std::isfinite(value) && value > 0.0;
}

}  // namespace

const char* thresholdSourceToString(ThresholdSource source) {
    switch (source) {
    case ThresholdSource::Instance:
        return "instance";
    case ThresholdSource::Environment:
        return "environment";
    case ThresholdSource::Default:
    default:
        return "default";
    }
}

ResolvedThreshold resolveAutoPauseThreshold(std::optional<double> instanceSetting,
                                            const char* envValue) {
    ResolvedThreshold resolved;

    if (instanceSetting) {
        if (usable(*instanceSetting)) {
            resolved.value = *instanceSetting;
            resolved.source = ThresholdSource::Instance;
            return resolved;
        }
        LOG_WARN("Ignoring invalid per-instance pause threshold {}", *instanceSetting);
    }

    if (envValue) {
        auto parsed = parseThreshold(envValue);
        if (parsed && usable(*parsed)) {
            resolved.value = *parsed;
            resolved.source = ThresholdSource::Environment;
            return resolved;
        }
        LOG_WARN("Ignoring invalid {}='{}'", PlaybackConstants::AUTOPAUSE_THRESHOLD_ENV_VAR,
                 envValue);
    }

    return resolved;
}

AutoPauseDecision::AutoPauseDecision(const AutoPauseConfig& config, PauseFn pauseFor)
    : enabled_(config.enabled),
      threshold_(resolveAutoPauseThreshold(
          config.instanceThreshold, std::getenv(PlaybackConstants::AUTOPAUSE_THRESHOLD_ENV_VAR))),
      pauseDurationSeconds_(config.pauseDurationSeconds),
      pauseFor_(std::move(pauseFor)) {
    if (!(pauseDurationSeconds_ > 0.0)) {
        LOG_WARN("Auto-pause duration {} is not positive, using {}", pauseDurationSeconds_,
                 PlaybackConstants::DEFAULT_AUTOPAUSE_DURATION_SECONDS);
        pauseDurationSeconds_ = PlaybackConstants::DEFAULT_AUTOPAUSE_DURATION_SECONDS;
    }
    LOG_DEBUG("Auto-pause {} (threshold {} from {}, window {:.2f}s)",
              enabled_ ? "enabled" : "disabled", threshold_.value,
              thresholdSourceToString(threshold_.source), pauseDurationSeconds_);
}

bool AutoPauseDecision::onMixedAudio(const uint8_t* data, std::size_t bytes) {
    if (!enabled_ || !data || bytes < PlaybackConstants::BYTES_PER_SAMPLE) {
        return false;
    }
    const double level = audio::rms(data, bytes);
    if (level < threshold_.value) {
        return false;
    }

    ++triggers_;
    LOG_EVERY_N(DEBUG, 20, "Mixed audio level {:.0f} >= {:.0f}, pausing output for {:.2f}s", level,
                threshold_.value, pauseDurationSeconds_);
    if (pauseFor_) {
        pauseFor_(pauseDurationSeconds_);
    }
    return true;
}

}  // namespace control
}  // namespace voice_inject
