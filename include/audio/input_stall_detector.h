#ifndef AUDIO_INPUT_STALL_DETECTOR_H
#define AUDIO_INPUT_STALL_DETECTOR_H

#include "core/playback_constants.h"

#include <chrono>

namespace voice_inject {
namespace audio {

using SteadyClock = std::chrono::steady_clock;

// True when the producer went quiet long enough that whatever is still
// buffered is the tail of an earlier utterance. A default-constructed
// previous timestamp means "never seen a chunk" and never triggers.
inline bool shouldResetAfterStall(
    SteadyClock::time_point previous, SteadyClock::time_point current,
    SteadyClock::duration threshold = PlaybackConstants::STALE_BUFFER_THRESHOLD) {
    if (previous == SteadyClock::time_point{} || current <= previous) {
        return false;
    }
    return (current - previous) > threshold;
}

}  // namespace audio
}  // namespace voice_inject

#endif  // AUDIO_INPUT_STALL_DETECTOR_H
