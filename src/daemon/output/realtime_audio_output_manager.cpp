#include "daemon/output/realtime_audio_output_manager.h"

#include "logging/logger.h"

#include <system_error>
#include <utility>

namespace voice_inject {
namespace output {

namespace {

RealtimeAudioOutputOptions sanitizeOptions(RealtimeAudioOutputOptions options) {
    if (options.outputSampleRate <= 0) {
        LOG_ERROR("Invalid output sample rate {} ({}), using {}", options.outputSampleRate,
                  errorCodeToString(ErrorCode::VALIDATION_INVALID_CONFIG),
                  PlaybackConstants::DEFAULT_OUTPUT_SAMPLE_RATE);
        options.outputSampleRate = PlaybackConstants::DEFAULT_OUTPUT_SAMPLE_RATE;
    }
    if (options.interChunkDelayMultiplier < 0.0) {
        LOG_WARN("Negative inter-chunk delay multiplier {}, using 0",
                 options.interChunkDelayMultiplier);
        options.interChunkDelayMultiplier = 0.0;
    }
    if (!options.sink) {
        LOG_WARN("No sink callback configured; frames will be consumed silently");
    }
    return options;
}

}  // namespace

const char* workerStateToString(WorkerState state) {
    switch (state) {
    case WorkerState::Running:
        return "running";
    case WorkerState::Stopping:
        return "stopping";
    case WorkerState::Idle:
    default:
        return "idle";
    }
}

RealtimeAudioOutputManager::RealtimeAudioOutputManager(RealtimeAudioOutputOptions options)
    : options_(sanitizeOptions(std::move(options))),
      accumulator_([this](audio::AudioFrame&& frame) { enqueueFrame(std::move(frame)); }) {
    touch();
}

RealtimeAudioOutputManager::~RealtimeAudioOutputManager() {
    cleanup();
}

ErrorCode RealtimeAudioOutputManager::addChunk(const uint8_t* data, std::size_t bytes,
                                               int sampleRate) {
    touch();
    return accumulator_.addChunk(data, bytes, sampleRate);
}

void RealtimeAudioOutputManager::enqueueFrame(audio::AudioFrame frame) {
    counters_.framesEnqueued.fetch_add(1, std::memory_order_relaxed);
    touch();
    queue_.push(std::move(frame));
    ensureWorker();
}

void RealtimeAudioOutputManager::pauseFor(double seconds) {
    pauseGate_.pauseFor(seconds);
}

void RealtimeAudioOutputManager::ensureWorker() {
    // Pairs with the Idle store + queue check in tryRetire() and cleanup():
    // either they see our frame, or we see Idle.
    if (state_.load(std::memory_order_seq_cst) == WorkerState::Running) {
        return;
    }

    std::unique_ptr<PlaybackWorker> previous;
    bool joinedStopping = false;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        switch (state_.load(std::memory_order_seq_cst)) {
        case WorkerState::Running:
            return;
        case WorkerState::Stopping:
            // A cleanup() still joining will respawn for us.
            if (!stopping_ || stopping_->isCurrentThread()) {
                return;
            }
            previous = std::move(stopping_);
            joinedStopping = true;
            break;
        case WorkerState::Idle:
            previous = std::move(worker_);
            startWorkerLocked();
            break;
        }
    }

    // An idle-retired predecessor has already left its loop; a stopping one
    // leaves it once its sink call returns.
    if (previous) {
        previous->join();
    }
    if (joinedStopping) {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (state_.load(std::memory_order_seq_cst) == WorkerState::Stopping) {
            startWorkerLocked();
        }
    }
}

bool RealtimeAudioOutputManager::startWorkerLocked() {
    std::unique_ptr<PlaybackWorker> worker;
    try {
        worker = std::make_unique<PlaybackWorker>(makeWorkerContext());
        worker->start();
    } catch (const std::system_error& e) {
        state_.store(WorkerState::Idle, std::memory_order_seq_cst);
        LOG_ERROR("Failed to spawn playback worker: {} ({})", e.what(),
                  errorCodeToString(ErrorCode::PLAYBACK_WORKER_START_FAILED));
        return false;
    }
    worker_ = std::move(worker);
    state_.store(WorkerState::Running, std::memory_order_seq_cst);
    counters_.workerStarts.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Playback worker spawned");
    return true;
}

bool RealtimeAudioOutputManager::tryRetire(const PlaybackWorker* worker) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (worker_.get() != worker) {
        return true;
    }
    state_.store(WorkerState::Idle, std::memory_order_seq_cst);
    if (!queue_.empty()) {
        state_.store(WorkerState::Running, std::memory_order_seq_cst);
        return false;
    }
    return true;
}

void RealtimeAudioOutputManager::cleanup() {
    std::unique_ptr<PlaybackWorker> worker;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        worker = worker_ ? std::move(worker_) : std::move(stopping_);
        if (worker) {
            state_.store(WorkerState::Stopping, std::memory_order_seq_cst);
        }
    }

    const bool stopped = worker != nullptr;
    if (worker) {
        worker->requestStop();
    }
    const std::size_t dropped = queue_.clear();

    if (worker && worker->isCurrentThread()) {
        // Called from the sink: run() is still on this stack.
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        stopping_ = std::move(worker);
    } else if (worker) {
        worker->join();
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        state_.store(WorkerState::Idle, std::memory_order_seq_cst);
        if (!queue_.empty()) {
            startWorkerLocked();
        }
    }

    pauseGate_.reset();

    if (dropped > 0) {
        counters_.framesDropped.fetch_add(dropped, std::memory_order_relaxed);
    }
    if (stopped || dropped > 0) {
        LOG_INFO("Playback cleanup: worker stopped, {} unplayed frame(s) dropped", dropped);
    }
}

PlaybackStats RealtimeAudioOutputManager::stats() const {
    PlaybackStats s;
    s.framesEnqueued = counters_.framesEnqueued.load(std::memory_order_relaxed);
    s.framesPlayed = counters_.framesPlayed.load(std::memory_order_relaxed);
    s.framesDropped = counters_.framesDropped.load(std::memory_order_relaxed);
    s.conversionFailures = counters_.conversionFailures.load(std::memory_order_relaxed);
    s.sinkFailures = counters_.sinkFailures.load(std::memory_order_relaxed);
    s.workerStarts = counters_.workerStarts.load(std::memory_order_relaxed);
    s.workerIdleExits = counters_.workerIdleExits.load(std::memory_order_relaxed);
    s.staleBufferResets = accumulator_.staleResets();
    return s;
}

void RealtimeAudioOutputManager::touch() {
    lastActivityTicks_.store(std::chrono::steady_clock::now().time_since_epoch().count(),
                             std::memory_order_release);
}

std::chrono::steady_clock::time_point RealtimeAudioOutputManager::lastActivity() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(lastActivityTicks_.load(std::memory_order_acquire)));
}

PlaybackWorkerContext RealtimeAudioOutputManager::makeWorkerContext() {
    PlaybackWorkerContext ctx;
    ctx.queue = &queue_;
    ctx.pauseGate = &pauseGate_;
    ctx.counters = &counters_;
    ctx.sink = options_.sink;
    ctx.outputSampleRate = options_.outputSampleRate;
    ctx.interChunkDelayMultiplier = options_.interChunkDelayMultiplier;
    ctx.idleTimeout = options_.idleTimeout;
    ctx.lastActivity = [this]() { return lastActivity(); };
    ctx.tryRetire = [this](const PlaybackWorker* worker) { return tryRetire(worker); };
    return ctx;
}

}  // namespace output
}  // namespace voice_inject
