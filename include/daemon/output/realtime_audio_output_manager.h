// Real-time speech output: buffering, rate conversion, pacing and pause.
#pragma once

#include "audio/chunk_accumulator.h"
#include "audio/pcm.h"
#include "core/error_codes.h"
#include "core/playback_constants.h"
#include "daemon/output/pause_gate.h"
#include "daemon/output/playback_queue.h"
#include "daemon/output/playback_worker.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace voice_inject {
namespace output {

struct RealtimeAudioOutputOptions {
    SinkCallback sink;
    // Pacing sleep after each frame = multiplier x frame duration
    double interChunkDelayMultiplier = PlaybackConstants::DEFAULT_INTER_CHUNK_DELAY_MULTIPLIER;
    int outputSampleRate = PlaybackConstants::DEFAULT_OUTPUT_SAMPLE_RATE;
    std::chrono::steady_clock::duration idleTimeout = PlaybackConstants::IDLE_WORKER_TIMEOUT;
};

// Stopping: cleanup() has stopped the worker but its thread may still be
// inside the sink. No new worker is started until it has been joined.
enum class WorkerState { Idle, Running, Stopping };

const char* workerStateToString(WorkerState state);

struct PlaybackStats {
    uint64_t framesEnqueued{0};
    uint64_t framesPlayed{0};
    uint64_t framesDropped{0};
    uint64_t conversionFailures{0};
    uint64_t sinkFailures{0};
    uint64_t workerStarts{0};
    uint64_t workerIdleExits{0};
    uint64_t staleBufferResets{0};
};

/**
 * @brief Entry point used by the meeting bot to play synthesized speech
 *
 * - addChunk(): producer thread; chunks of any size at any rate
 * - pauseFor(): any thread; cumulative via max
 * - cleanup(): any thread, idempotent; stops the worker and drops
 *   unplayed frames
 *
 * At most one PlaybackWorker is alive at a time. It is started lazily by
 * the first frame and retires itself after idleTimeout without input; the
 * next frame starts a new one. Frames queued while cleanup() waits for the
 * old worker start a fresh worker once it has exited.
 */
class RealtimeAudioOutputManager {
   public:
    explicit RealtimeAudioOutputManager(RealtimeAudioOutputOptions options);
    ~RealtimeAudioOutputManager();

    RealtimeAudioOutputManager(const RealtimeAudioOutputManager&) = delete;
    RealtimeAudioOutputManager& operator=(const RealtimeAudioOutputManager&) = delete;

    // Producer calls must be serialized by the caller.
    ErrorCode addChunk(const uint8_t* data, std::size_t bytes, int sampleRate);
    ErrorCode addChunk(const audio::PcmBytes& chunk, int sampleRate) {
        return addChunk(chunk.data(), chunk.size(), sampleRate);
    }

    // Queue an already framed buffer, bypassing the accumulator.
    void enqueueFrame(audio::AudioFrame frame);

    void pauseFor(double seconds);
    double remainingPauseSeconds() const {
        return pauseGate_.remainingSeconds();
    }

    void cleanup();

    WorkerState workerState() const {
        return state_.load(std::memory_order_seq_cst);
    }
    bool isWorkerRunning() const {
        return workerState() == WorkerState::Running;
    }

    std::size_t queuedFrames() const {
        return queue_.size();
    }
    int outputSampleRate() const {
        return options_.outputSampleRate;
    }
    PlaybackStats stats() const;

   private:
    void ensureWorker();
    bool startWorkerLocked();
    bool tryRetire(const PlaybackWorker* worker);
    void touch();
    std::chrono::steady_clock::time_point lastActivity() const;
    PlaybackWorkerContext makeWorkerContext();

    RealtimeAudioOutputOptions options_;

    PlaybackQueue queue_;
    PauseGate pauseGate_;
    PlaybackCounters counters_;
    audio::ChunkAccumulator accumulator_;

    std::atomic<std::chrono::steady_clock::rep> lastActivityTicks_{0};

    // Guards worker_, stopping_ and transitions of state_.
    std::mutex lifecycleMutex_;
    std::atomic<WorkerState> state_{WorkerState::Idle};
    std::unique_ptr<PlaybackWorker> worker_;
    // Stopped from inside its own sink callback; joined by the next
    // producer or cleanup() on another thread.
    std::unique_ptr<PlaybackWorker> stopping_;
};

}  // namespace output
}  // namespace voice_inject
