#include "audio/sample_rate_converter.h"

#include "core/playback_constants.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace voice_inject {
namespace audio {

int calculateUpsampleRatio(int inputRate, int outputRate) {
    if (inputRate <= 0 || outputRate <= 0) {
        return 0;
    }
    if (outputRate % inputRate != 0) {
        return 0;
    }
    return outputRate / inputRate;
}

ConversionMethod selectConversionMethod(int inputRate, int outputRate) {
    if (inputRate == outputRate) {
        return ConversionMethod::Passthrough;
    }
    if (calculateUpsampleRatio(inputRate, outputRate) > 1) {
        return ConversionMethod::Repeat;
    }
    return ConversionMethod::Interpolate;
}

const char* conversionMethodToString(ConversionMethod method) {
    switch (method) {
    case ConversionMethod::Passthrough:
        return "passthrough";
    case ConversionMethod::Repeat:
        return "repeat";
    case ConversionMethod::Interpolate:
    default:
        return "interpolate";
    }
}

PcmBytes repeatSamples(const PcmBytes& pcm, int ratio) {
    if (ratio <= 1) {
        return pcm;
    }
    const std::size_t sampleCount = pcm.size() / PlaybackConstants::BYTES_PER_SAMPLE;
    PcmBytes out;
    out.reserve(sampleCount * PlaybackConstants::BYTES_PER_SAMPLE * static_cast<std::size_t>(ratio));
    for (std::size_t i = 0; i < sampleCount; ++i) {
        const uint8_t lo = pcm[i * 2];
        const uint8_t hi = pcm[i * 2 + 1];
        for (int r = 0; r < ratio; ++r) {
            out.push_back(lo);
            out.push_back(hi);
        }
    }
    return out;
}

PcmBytes interpolateLinear(const PcmBytes& pcm, int inputRate, int outputRate) {
    const std::vector<int16_t> in = samplesFromBytes(pcm);
    if (in.empty() || inputRate <= 0 || outputRate <= 0) {
        return {};
    }

    const std::size_t outCount = static_cast<std::size_t>(
        static_cast<long long>(in.size()) * outputRate / inputRate);
    const double step = static_cast<double>(inputRate) / static_cast<double>(outputRate);

    std::vector<int16_t> out;
    out.reserve(outCount);
    for (std::size_t i = 0; i < outCount; ++i) {
        const double pos = static_cast<double>(i) * step;
        const std::size_t i0 = std::min(static_cast<std::size_t>(pos), in.size() - 1);
        const std::size_t i1 = std::min(i0 + 1, in.size() - 1);
        const double frac = pos - static_cast<double>(i0);
        const double s0 = in[i0];
        const double s1 = in[i1];
        double value = std::round(s0 + (s1 - s0) * frac);
        value = std::clamp(value, static_cast<double>(std::numeric_limits<int16_t>::min()),
                           static_cast<double>(std::numeric_limits<int16_t>::max()));
        out.push_back(static_cast<int16_t>(value));
    }
    return bytesFromSamples(out);
}

ErrorCode convertSampleRate(const PcmBytes& pcm, int inputRate, int outputRate, PcmBytes& out) {
    if (inputRate <= 0 || outputRate <= 0) {
        return ErrorCode::AUDIO_INVALID_SAMPLE_RATE;
    }
    if (!isSampleAligned(pcm.size())) {
        return ErrorCode::AUDIO_MALFORMED_FRAME;
    }

    switch (selectConversionMethod(inputRate, outputRate)) {
    case ConversionMethod::Passthrough:
        out = pcm;
        break;
    case ConversionMethod::Repeat:
        out = repeatSamples(pcm, calculateUpsampleRatio(inputRate, outputRate));
        break;
    case ConversionMethod::Interpolate:
        out = interpolateLinear(pcm, inputRate, outputRate);
        break;
    }
    return ErrorCode::OK;
}

}  // namespace audio
}  // namespace voice_inject
