#include "daemon/output/pause_gate.h"

#include "logging/logger.h"

#include <algorithm>

namespace voice_inject {
namespace output {

void PauseGate::pauseFor(double seconds) {
    if (!(seconds > 0.0)) {
        return;
    }
    pauseFor(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds)));
}

void PauseGate::pauseFor(Clock::duration duration) {
    if (duration <= Clock::duration::zero()) {
        return;
    }
    const auto requested = Clock::now() + duration;
    bool extended = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested > pausedUntil_) {
            pausedUntil_ = requested;
            extended = true;
        }
    }
    if (extended) {
        LOG_DEBUG("Playback paused for {:.3f}s",
                  std::chrono::duration<double>(duration).count());
        cv_.notify_all();
    }
}

PauseGate::Clock::duration PauseGate::remainingLocked(Clock::time_point now) const {
    if (pausedUntil_ <= now) {
        return Clock::duration::zero();
    }
    return pausedUntil_ - now;
}

PauseGate::Clock::duration PauseGate::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remainingLocked(Clock::now());
}

double PauseGate::remainingSeconds() const {
    return std::chrono::duration<double>(remaining()).count();
}

PauseGate::Clock::time_point PauseGate::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pausedUntil_;
}

void PauseGate::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pausedUntil_ = Clock::time_point{};
    }
    cv_.notify_all();
}

bool PauseGate::waitUntilClear(const std::atomic<bool>& stop, std::chrono::milliseconds slice) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.load(std::memory_order_acquire)) {
        const auto left = remainingLocked(Clock::now());
        if (left <= Clock::duration::zero()) {
            return true;
        }
        cv_.wait_for(lock, std::min<Clock::duration>(left, slice));
    }
    return false;
}

void PauseGate::sleepUnlessPaused(Clock::duration duration, const std::atomic<bool>& stop,
                                  std::chrono::milliseconds slice) {
    if (duration <= Clock::duration::zero()) {
        return;
    }
    const auto end = Clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.load(std::memory_order_acquire)) {
        const auto now = Clock::now();
        if (remainingLocked(now) > Clock::duration::zero()) {
            return;
        }
        if (now >= end) {
            return;
        }
        cv_.wait_for(lock, std::min<Clock::duration>(end - now, slice));
    }
}

void PauseGate::wakeAll() {
    { std::lock_guard<std::mutex> lock(mutex_); }
    cv_.notify_all();
}

}  // namespace output
}  // namespace voice_inject
