#ifndef VOICE_INJECT_AUDIO_PCM_H
#define VOICE_INJECT_AUDIO_PCM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voice_inject {
namespace audio {

using PcmBytes = std::vector<uint8_t>;

// A fixed-duration slice of 16-bit LE mono PCM and the rate it was captured at.
struct AudioFrame {
    PcmBytes pcm;
    int sampleRate{0};
};

// Bytes in one FRAME_DURATION_MS frame at the given rate, rounded down to
// whole samples. Returns 0 for rates too small to hold a single sample.
std::size_t frameSizeBytes(int sampleRate);

// Decode little-endian 16-bit samples. A trailing odd byte is ignored.
std::vector<int16_t> samplesFromBytes(const uint8_t* data, std::size_t bytes);
std::vector<int16_t> samplesFromBytes(const PcmBytes& bytes);

PcmBytes bytesFromSamples(const std::vector<int16_t>& samples);

// Loudness over 16-bit samples. Both return 0.0 for an empty buffer.
double rms(const uint8_t* data, std::size_t bytes);
double peak(const uint8_t* data, std::size_t bytes);

inline bool isSampleAligned(std::size_t bytes) {
    return bytes % 2 == 0;
}

}  // namespace audio
}  // namespace voice_inject

#endif  // VOICE_INJECT_AUDIO_PCM_H
