#include "audio/chunk_accumulator.h"

#include "logging/logger.h"

#include <utility>

namespace voice_inject {
namespace audio {

ChunkAccumulator::ChunkAccumulator(FrameHandler onFrame) : onFrame_(std::move(onFrame)) {}

ErrorCode ChunkAccumulator::addChunk(const uint8_t* data, std::size_t bytes, int sampleRate) {
    return addChunk(data, bytes, sampleRate, SteadyClock::now());
}

ErrorCode ChunkAccumulator::addChunk(const uint8_t* data, std::size_t bytes, int sampleRate,
                                     SteadyClock::time_point now) {
    if (!buffer_.empty() && shouldResetAfterStall(lastActivity_, now)) {
        LOG_DEBUG("Dropping {} stale buffered bytes after input gap", buffer_.size());
        buffer_.clear();
        staleResets_.fetch_add(1, std::memory_order_relaxed);
    }
    lastActivity_ = now;

    const std::size_t frameBytes = frameSizeBytes(sampleRate);
    if (frameBytes == 0) {
        LOG_WARN("Rejecting chunk: sample rate {} yields an empty frame", sampleRate);
        return ErrorCode::AUDIO_INVALID_SAMPLE_RATE;
    }

    // Residue captured at another rate cannot be spliced into this frame.
    if (!buffer_.empty() && bufferRate_ != sampleRate) {
        LOG_DEBUG("Sample rate changed {} -> {}, dropping {} buffered bytes", bufferRate_,
                  sampleRate, buffer_.size());
        buffer_.clear();
    }
    bufferRate_ = sampleRate;

    if (data && bytes > 0) {
        buffer_.insert(buffer_.end(), data, data + bytes);
    }

    std::size_t offset = 0;
    while (buffer_.size() - offset >= frameBytes) {
        AudioFrame frame;
        frame.sampleRate = sampleRate;
        frame.pcm.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(offset),
                         buffer_.begin() + static_cast<std::ptrdiff_t>(offset + frameBytes));
        offset += frameBytes;
        if (onFrame_) {
            onFrame_(std::move(frame));
        }
    }
    if (offset > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return ErrorCode::OK;
}

void ChunkAccumulator::clear() {
    buffer_.clear();
    bufferRate_ = 0;
}

}  // namespace audio
}  // namespace voice_inject
