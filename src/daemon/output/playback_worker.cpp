#include "daemon/output/playback_worker.h"

#include "audio/sample_rate_converter.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <exception>
#include <utility>

namespace voice_inject {
namespace output {

PlaybackWorker::PlaybackWorker(PlaybackWorkerContext context) : context_(std::move(context)) {}

PlaybackWorker::~PlaybackWorker() {
    stopAndJoin();
}

void PlaybackWorker::start() {
    if (thread_.joinable()) {
        LOG_WARN("Playback worker already started");
        return;
    }
    stop_.store(false, std::memory_order_release);
    thread_ = std::thread(&PlaybackWorker::run, this);
}

void PlaybackWorker::requestStop() {
    stop_.store(true, std::memory_order_release);
    if (context_.queue) {
        context_.queue->wakeAll();
    }
    if (context_.pauseGate) {
        context_.pauseGate->wakeAll();
    }
}

void PlaybackWorker::stopAndJoin() {
    requestStop();
    join();
}

void PlaybackWorker::join() {
    if (thread_.joinable() && !isCurrentThread()) {
        thread_.join();
    }
}

bool PlaybackWorker::isCurrentThread() const {
    return thread_.get_id() == std::this_thread::get_id();
}

void PlaybackWorker::run() {
    LOG_INFO("Playback worker started (output {} Hz)", context_.outputSampleRate);

    bool idleExit = false;
    while (!stop_.load(std::memory_order_acquire)) {
        audio::AudioFrame frame;
        if (!context_.queue->popWait(frame, PlaybackConstants::QUEUE_POP_WAIT, stop_,
                                     PlaybackConstants::POLL_SLICE)) {
            if (stop_.load(std::memory_order_acquire)) {
                break;
            }
            const auto idleFor =
                std::chrono::steady_clock::now() -
                (context_.lastActivity ? context_.lastActivity()
                                       : std::chrono::steady_clock::time_point{});
            if (idleFor > context_.idleTimeout &&
                (!context_.tryRetire || context_.tryRetire(this))) {
                idleExit = true;
                break;
            }
            continue;
        }
        playFrame(frame);
    }

    if (idleExit) {
        if (context_.counters) {
            context_.counters->workerIdleExits.fetch_add(1, std::memory_order_relaxed);
        }
        LOG_INFO("Playback worker exiting after {}s idle",
                 std::chrono::duration_cast<std::chrono::seconds>(context_.idleTimeout).count());
    } else {
        LOG_INFO("Playback worker stopped");
    }
}

void PlaybackWorker::playFrame(const audio::AudioFrame& frame) {
    audio::PcmBytes converted;
    const ErrorCode rc = audio::convertSampleRate(frame.pcm, frame.sampleRate,
                                                  context_.outputSampleRate, converted);
    if (rc != ErrorCode::OK) {
        if (context_.counters) {
            context_.counters->conversionFailures.fetch_add(1, std::memory_order_relaxed);
        }
        LOG_WARN("Dropping frame ({} bytes @ {} Hz): {} ({})", frame.pcm.size(), frame.sampleRate,
                 errorCodeToString(rc), errorCodeToHex(rc));
        return;
    }

    if (!context_.pauseGate->waitUntilClear(stop_) || stop_.load(std::memory_order_acquire)) {
        // Popped but never played.
        if (context_.counters) {
            context_.counters->framesDropped.fetch_add(1, std::memory_order_relaxed);
        }
        return;
    }

    try {
        if (context_.sink) {
            context_.sink(converted, context_.outputSampleRate);
        }
        if (context_.counters) {
            context_.counters->framesPlayed.fetch_add(1, std::memory_order_relaxed);
        }
    } catch (const std::exception& e) {
        if (context_.counters) {
            context_.counters->sinkFailures.fetch_add(1, std::memory_order_relaxed);
        }
        LOG_ERROR("Sink callback failed: {} ({})", e.what(),
                  errorCodeToString(ErrorCode::PLAYBACK_SINK_FAILED));
    } catch (...) {
        if (context_.counters) {
            context_.counters->sinkFailures.fetch_add(1, std::memory_order_relaxed);
        }
        LOG_ERROR("Sink callback failed: unknown exception ({})",
                  errorCodeToString(ErrorCode::PLAYBACK_SINK_FAILED));
    }

    const double delaySeconds =
        context_.interChunkDelayMultiplier * PlaybackConstants::FRAME_DURATION_SECONDS;
    if (delaySeconds > 0.0) {
        context_.pauseGate->sleepUnlessPaused(
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(delaySeconds)),
            stop_);
    }
}

}  // namespace output
}  // namespace voice_inject
