// Background consumer that paces frames from the PlaybackQueue into the sink.
#pragma once

#include "audio/pcm.h"
#include "core/playback_constants.h"
#include "daemon/output/pause_gate.h"
#include "daemon/output/playback_queue.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace voice_inject {
namespace output {

using SinkCallback = std::function<void(const audio::PcmBytes& pcm, int sampleRate)>;

// Shared between the manager and each worker it spawns.
struct PlaybackCounters {
    std::atomic<uint64_t> framesEnqueued{0};
    std::atomic<uint64_t> framesPlayed{0};
    std::atomic<uint64_t> framesDropped{0};
    std::atomic<uint64_t> conversionFailures{0};
    std::atomic<uint64_t> sinkFailures{0};
    std::atomic<uint64_t> workerStarts{0};
    std::atomic<uint64_t> workerIdleExits{0};
};

class PlaybackWorker;

struct PlaybackWorkerContext {
    PlaybackQueue* queue = nullptr;
    PauseGate* pauseGate = nullptr;
    PlaybackCounters* counters = nullptr;
    SinkCallback sink;
    int outputSampleRate = PlaybackConstants::DEFAULT_OUTPUT_SAMPLE_RATE;
    double interChunkDelayMultiplier = PlaybackConstants::DEFAULT_INTER_CHUNK_DELAY_MULTIPLIER;
    std::chrono::steady_clock::duration idleTimeout = PlaybackConstants::IDLE_WORKER_TIMEOUT;

    // Time of the most recent producer activity.
    std::function<std::chrono::steady_clock::time_point()> lastActivity;
    // Asked once the idle timeout has elapsed; returning true lets the
    // worker exit. The owner uses it to flip its lifecycle state atomically.
    std::function<bool(const PlaybackWorker*)> tryRetire;
};

/**
 * @brief One playback thread
 *
 * Loop: pop (bounded wait) -> convert to output rate -> wait out any pause
 * -> sink -> pacing sleep. Per-frame failures, including anything the sink
 * throws, are logged and skipped.
 * The stop flag belongs to this worker only, so a replacement worker can
 * start while an old one is still winding down.
 */
class PlaybackWorker {
   public:
    explicit PlaybackWorker(PlaybackWorkerContext context);
    ~PlaybackWorker();

    PlaybackWorker(const PlaybackWorker&) = delete;
    PlaybackWorker& operator=(const PlaybackWorker&) = delete;

    void start();

    // Ask the thread to stop; returns immediately.
    void requestStop();

    // requestStop() + join. After it returns the sink is never called again
    // by this worker.
    void stopAndJoin();

    // Join a thread that already left its loop (idle exit).
    void join();

    // True when called from inside run(), e.g. by a sink callback.
    bool isCurrentThread() const;

   private:
    void run();
    void playFrame(const audio::AudioFrame& frame);

    PlaybackWorkerContext context_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

}  // namespace output
}  // namespace voice_inject
