// FIFO hand-off between producer threads and the playback worker.
#pragma once

#include "audio/pcm.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace voice_inject {
namespace output {

class PlaybackQueue {
   public:
    PlaybackQueue() = default;
    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    // Producer API
    void push(audio::AudioFrame frame);

    // Consumer API. Waits up to `timeout` for a frame, waking at least every
    // `slice` to re-check `stop`. Returns false on timeout or stop.
    bool popWait(audio::AudioFrame& out, std::chrono::milliseconds timeout,
                 const std::atomic<bool>& stop, std::chrono::milliseconds slice);

    // Drop everything queued; returns the number of frames discarded.
    std::size_t clear();

    // Wake a consumer blocked in popWait (used with a stop request).
    void wakeAll();

    // Lock-free view of the size; pairs with the worker's retire check.
    std::size_t size() const {
        return size_.load(std::memory_order_seq_cst);
    }
    bool empty() const {
        return size() == 0;
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<audio::AudioFrame> frames_;
    std::atomic<std::size_t> size_{0};
};

}  // namespace output
}  // namespace voice_inject
