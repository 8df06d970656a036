#include "daemon/app/realtime_audio_session.h"

#include "logging/logger.h"

#include <utility>

namespace voice_inject {
namespace app {

RealtimeAudioSession::RealtimeAudioSession(const AppConfig& config, output::SinkCallback sink) {
    output::RealtimeAudioOutputOptions options;
    options.sink = std::move(sink);
    options.outputSampleRate = config.playback.outputSampleRate;
    options.interChunkDelayMultiplier = config.playback.interChunkDelayMultiplier;
    output_ = std::make_unique<output::RealtimeAudioOutputManager>(std::move(options));

    control::AutoPauseConfig autoPauseConfig;
    autoPauseConfig.enabled = config.autoPause.enabled;
    autoPauseConfig.instanceThreshold = config.autoPause.pauseThreshold;
    autoPauseConfig.pauseDurationSeconds = config.autoPause.durationSeconds;
    auto* manager = output_.get();
    autoPause_ = std::make_unique<control::AutoPauseDecision>(
        autoPauseConfig, [manager](double seconds) { manager->pauseFor(seconds); });

    control::ControlHandlers handlers;
    handlers.pauseFor = [manager](double seconds) { manager->pauseFor(seconds); };
    handlers.addChunk = [manager](const audio::PcmBytes& pcm, int sampleRate) {
        // Rejections are logged by the accumulator.
        (void)manager->addChunk(pcm, sampleRate);
    };
    auto* autoPause = autoPause_.get();
    handlers.mixedAudio = [autoPause](const audio::PcmBytes& pcm) {
        autoPause->onMixedAudio(pcm);
    };
    router_ = std::make_unique<control::ControlMessageRouter>(std::move(handlers));

    LOG_INFO("Realtime audio session ready (output {} Hz, pacing x{:.2f}, auto-pause {} @ {} [{}])",
             output_->outputSampleRate(), config.playback.interChunkDelayMultiplier,
             config.autoPause.enabled ? "on" : "off", autoPause_->threshold(),
             control::thresholdSourceToString(autoPause_->thresholdSource()));
}

RealtimeAudioSession::~RealtimeAudioSession() {
    shutdown();
}

ErrorCode RealtimeAudioSession::onControlMessage(const std::string& text) {
    return router_->handleMessage(text);
}

bool RealtimeAudioSession::onMixedAudio(const audio::PcmBytes& pcm) {
    return autoPause_->onMixedAudio(pcm);
}

void RealtimeAudioSession::shutdown() {
    if (output_) {
        output_->cleanup();
    }
}

}  // namespace app
}  // namespace voice_inject
