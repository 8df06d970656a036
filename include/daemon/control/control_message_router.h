#pragma once

#include "audio/pcm.h"
#include "core/error_codes.h"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace voice_inject {
namespace control {

// Trigger codes carried in {"trigger": ..., "data": {...}} messages.
namespace Triggers {
constexpr const char* PAUSE = "realtime_audio.pause";
constexpr const char* BOT_OUTPUT = "realtime_audio.bot_output";
constexpr const char* MIXED_AUDIO = "realtime_audio.mixed";
}  // namespace Triggers

// Callbacks into the playback side. Unset handlers make the matching
// trigger a no-op that still validates its payload.
struct ControlHandlers {
    std::function<void(double seconds)> pauseFor;
    std::function<void(const audio::PcmBytes& pcm, int sampleRate)> addChunk;
    std::function<void(const audio::PcmBytes& pcm)> mixedAudio;
};

/**
 * @brief Dispatches signalling-layer messages to the playback core
 *
 * - realtime_audio.pause:      data.duration (ms)            -> pauseFor(ms / 1000)
 * - realtime_audio.bot_output: data.chunk (base64), data.sample_rate -> addChunk
 * - realtime_audio.mixed:      data.chunk (base64)           -> mixedAudio
 *
 * Never throws; every rejection is logged and reported as an ErrorCode.
 */
class ControlMessageRouter {
   public:
    explicit ControlMessageRouter(ControlHandlers handlers);

    ErrorCode handleMessage(const std::string& text);
    ErrorCode handleJson(const nlohmann::json& message);

   private:
    ErrorCode handlePause(const nlohmann::json& data);
    ErrorCode handleBotOutput(const nlohmann::json& data);
    ErrorCode handleMixedAudio(const nlohmann::json& data);

    ControlHandlers handlers_;
};

}  // namespace control
}  // namespace voice_inject
