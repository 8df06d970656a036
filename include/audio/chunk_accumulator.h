#ifndef VOICE_INJECT_AUDIO_CHUNK_ACCUMULATOR_H
#define VOICE_INJECT_AUDIO_CHUNK_ACCUMULATOR_H

#include "audio/input_stall_detector.h"
#include "audio/pcm.h"
#include "core/error_codes.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace voice_inject {
namespace audio {

// Coalesces arbitrarily sized inbound PCM chunks into fixed-duration frames.
//
// Not internally synchronized: the producer serializes its own calls.
// Frames are forwarded synchronously from addChunk() in append order.
class ChunkAccumulator {
   public:
    using FrameHandler = std::function<void(AudioFrame&&)>;

    explicit ChunkAccumulator(FrameHandler onFrame);

    // Append a chunk and emit every complete frame it produces.
    // Returns AUDIO_INVALID_SAMPLE_RATE (and appends nothing) when the rate
    // cannot yield a non-empty frame.
    ErrorCode addChunk(const uint8_t* data, std::size_t bytes, int sampleRate);
    ErrorCode addChunk(const uint8_t* data, std::size_t bytes, int sampleRate,
                       SteadyClock::time_point now);
    ErrorCode addChunk(const PcmBytes& chunk, int sampleRate) {
        return addChunk(chunk.data(), chunk.size(), sampleRate);
    }

    void clear();

    std::size_t bufferedBytes() const {
        return buffer_.size();
    }
    SteadyClock::time_point lastActivity() const {
        return lastActivity_;
    }
    // Safe to read from any thread.
    uint64_t staleResets() const {
        return staleResets_.load(std::memory_order_relaxed);
    }

   private:
    FrameHandler onFrame_;
    PcmBytes buffer_;
    int bufferRate_{0};
    SteadyClock::time_point lastActivity_{};
    std::atomic<uint64_t> staleResets_{0};
};

}  // namespace audio
}  // namespace voice_inject

#endif  // VOICE_INJECT_AUDIO_CHUNK_ACCUMULATOR_H
