#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "daemon/control/auto_pause_decision.h"
#include "daemon/control/control_message_router.h"
#include "daemon/output/realtime_audio_output_manager.h"

#include <memory>
#include <string>

namespace voice_inject {
namespace app {

// Wires one bot's playback manager, auto-pause controller and control
// message router from an AppConfig. Owns all three.
class RealtimeAudioSession {
   public:
    RealtimeAudioSession(const AppConfig& config, output::SinkCallback sink);
    ~RealtimeAudioSession();

    RealtimeAudioSession(const RealtimeAudioSession&) = delete;
    RealtimeAudioSession& operator=(const RealtimeAudioSession&) = delete;

    // Text frame from the signalling websocket.
    ErrorCode onControlMessage(const std::string& text);

    // Mixed audio of the other participants, straight from the call.
    bool onMixedAudio(const audio::PcmBytes& pcm);

    void shutdown();

    output::RealtimeAudioOutputManager& output() {
        return *output_;
    }
    const control::AutoPauseDecision& autoPause() const {
        return *autoPause_;
    }

   private:
    std::unique_ptr<output::RealtimeAudioOutputManager> output_;
    std::unique_ptr<control::AutoPauseDecision> autoPause_;
    std::unique_ptr<control::ControlMessageRouter> router_;
};

}  // namespace app
}  // namespace voice_inject
