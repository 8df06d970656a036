#ifndef PLAYBACK_CONSTANTS_H
#define PLAYBACK_CONSTANTS_H

#include <chrono>
#include <cstddef>

// Constants shared by the accumulator, worker and auto-pause controller.

namespace PlaybackConstants {

// PCM format: 16-bit signed little-endian mono, everywhere
constexpr std::size_t BYTES_PER_SAMPLE = 2;

// Every frame handed to the sink covers this much audio
constexpr int FRAME_DURATION_MS = 100;
constexpr double FRAME_DURATION_SECONDS = FRAME_DURATION_MS / 1000.0;

constexpr int DEFAULT_OUTPUT_SAMPLE_RATE = 16000;
constexpr double DEFAULT_INTER_CHUNK_DELAY_MULTIPLIER = 0.9;

// Residue older than this is dropped before appending a new chunk
constexpr std::chrono::milliseconds STALE_BUFFER_THRESHOLD{150};

// Worker lifecycle
constexpr std::chrono::seconds IDLE_WORKER_TIMEOUT{10};
constexpr std::chrono::milliseconds QUEUE_POP_WAIT{1000};

// Upper bound on how long any worker suspension point goes without
// re-checking the stop flag and the pause deadline
constexpr std::chrono::milliseconds POLL_SLICE{50};

// Auto-pause (loudness of other participants)
constexpr double DEFAULT_AUTOPAUSE_THRESHOLD = 1500.0;
constexpr double DEFAULT_AUTOPAUSE_DURATION_SECONDS = 1.0;
constexpr const char* AUTOPAUSE_THRESHOLD_ENV_VAR = "REALTIME_AUDIO_AUTOPAUSE_THRESHOLD";

}  // namespace PlaybackConstants

#endif  // PLAYBACK_CONSTANTS_H
