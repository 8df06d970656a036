#include "daemon/output/playback_queue.h"

#include <algorithm>
#include <utility>

namespace voice_inject {
namespace output {

void PlaybackQueue::push(audio::AudioFrame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(std::move(frame));
        size_.fetch_add(1, std::memory_order_seq_cst);
    }
    cv_.notify_one();
}

bool PlaybackQueue::popWait(audio::AudioFrame& out, std::chrono::milliseconds timeout,
                            const std::atomic<bool>& stop, std::chrono::milliseconds slice) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (frames_.empty()) {
        if (stop.load(std::memory_order_acquire)) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto wait = std::min<std::chrono::steady_clock::duration>(deadline - now, slice);
        cv_.wait_for(lock, wait, [&]() {
            return !frames_.empty() || stop.load(std::memory_order_acquire);
        });
    }
    if (stop.load(std::memory_order_acquire)) {
        return false;
    }
    out = std::move(frames_.front());
    frames_.pop_front();
    size_.fetch_sub(1, std::memory_order_seq_cst);
    return true;
}

std::size_t PlaybackQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t dropped = frames_.size();
    frames_.clear();
    size_.store(0, std::memory_order_seq_cst);
    return dropped;
}

void PlaybackQueue::wakeAll() {
    // Taking the lock orders the notify after any waiter's predicate check.
    { std::lock_guard<std::mutex> lock(mutex_); }
    cv_.notify_all();
}

}  // namespace output
}  // namespace voice_inject
