// Shared "paused until" deadline consulted by the playback worker.
#pragma once

#include "core/playback_constants.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace voice_inject {
namespace output {

/**
 * @brief Monotonic pause deadline with blocking waits
 *
 * Thread safety model:
 * - pauseFor()/reset() may be called from any thread (control handlers,
 *   auto-pause logic, cleanup)
 * - waitUntilClear()/sleepUnlessPaused() are called by the playback worker
 * - The deadline only grows; concurrent requests combine via max, never
 *   add. reset() is the only way back to "not paused".
 * - The internal mutex is never held while calling out, and never nested
 *   with the manager's lifecycle lock.
 */
class PauseGate {
   public:
    using Clock = std::chrono::steady_clock;

    PauseGate() = default;
    PauseGate(const PauseGate&) = delete;
    PauseGate& operator=(const PauseGate&) = delete;

    // No-op for non-positive durations.
    void pauseFor(double seconds);
    void pauseFor(Clock::duration duration);

    // max(deadline - now, 0)
    Clock::duration remaining() const;
    double remainingSeconds() const;
    bool isPaused() const {
        return remaining() > Clock::duration::zero();
    }

    Clock::time_point deadline() const;

    void reset();

    /**
     * @brief Block until no pause is active or `stop` is set
     *
     * Wakes on pauseFor()/reset()/wakeAll() and at least every `slice`.
     * @return false if it returned because of `stop`
     */
    bool waitUntilClear(const std::atomic<bool>& stop,
                        std::chrono::milliseconds slice = PlaybackConstants::POLL_SLICE);

    /**
     * @brief Pacing sleep that gives way to pauses and stop requests
     *
     * Returns early as soon as a pause becomes active or `stop` is set.
     */
    void sleepUnlessPaused(Clock::duration duration, const std::atomic<bool>& stop,
                           std::chrono::milliseconds slice = PlaybackConstants::POLL_SLICE);

    void wakeAll();

   private:
    Clock::duration remainingLocked(Clock::time_point now) const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Clock::time_point pausedUntil_{};
};

}  // namespace output
}  // namespace voice_inject
