#include "audio/pcm.h"

#include "core/playback_constants.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace voice_inject {
namespace audio {

namespace {

inline int16_t readSample(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                (static_cast<uint16_t>(p[1]) << 8));
}

}  // namespace

std::size_t frameSizeBytes(int sampleRate) {
    if (sampleRate <= 0) {
        return 0;
    }
    const long long samples =
        static_cast<long long>(sampleRate) * PlaybackConstants::FRAME_DURATION_MS / 1000;
    if (samples <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(samples) * PlaybackConstants::BYTES_PER_SAMPLE;
}

std::vector<int16_t> samplesFromBytes(const uint8_t* data, std::size_t bytes) {
    std::vector<int16_t> samples;
    if (!data) {
        return samples;
    }
    const std::size_t count = bytes / PlaybackConstants::BYTES_PER_SAMPLE;
    samples.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        samples.push_back(readSample(data + i * PlaybackConstants::BYTES_PER_SAMPLE));
    }
    return samples;
}

std::vector<int16_t> samplesFromBytes(const PcmBytes& bytes) {
    return samplesFromBytes(bytes.data(), bytes.size());
}

PcmBytes bytesFromSamples(const std::vector<int16_t>& samples) {
    PcmBytes bytes;
    bytes.reserve(samples.size() * PlaybackConstants::BYTES_PER_SAMPLE);
    for (int16_t s : samples) {
        const auto u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xFF));
        bytes.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
    }
    return bytes;
}

double rms(const uint8_t* data, std::size_t bytes) {
    const std::size_t count = bytes / PlaybackConstants::BYTES_PER_SAMPLE;
    if (!data || count == 0) {
        return 0.0;
    }
    double sumSquares = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double s = readSample(data + i * PlaybackConstants::BYTES_PER_SAMPLE);
        sumSquares += s * s;
    }
    return std::sqrt(sumSquares / static_cast<double>(count));
}

double peak(const uint8_t* data, std::size_t bytes) {
    const std::size_t count = bytes / PlaybackConstants::BYTES_PER_SAMPLE;
    if (!data || count == 0) {
        return 0.0;
    }
    int maxAbs = 0;
    for (std::size_t i = 0; i < count; ++i) {
        // int promotion keeps |-32768| representable
        const int s = readSample(data + i * PlaybackConstants::BYTES_PER_SAMPLE);
        maxAbs = std::max(maxAbs, std::abs(s));
    }
    return static_cast<double>(maxAbs);
}

}  // namespace audio
}  // namespace voice_inject
