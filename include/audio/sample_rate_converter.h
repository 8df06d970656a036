#ifndef VOICE_INJECT_AUDIO_SAMPLE_RATE_CONVERTER_H
#define VOICE_INJECT_AUDIO_SAMPLE_RATE_CONVERTER_H

#include "audio/pcm.h"
#include "core/error_codes.h"

namespace voice_inject {
namespace audio {

enum class ConversionMethod {
    Passthrough,  // rates equal
    Repeat,       // dst is an exact integer multiple (>1) of src
    Interpolate   // anything else, including downsampling
};

// Output/input ratio when it is an exact integer, 0 otherwise.
int calculateUpsampleRatio(int inputRate, int outputRate);

ConversionMethod selectConversionMethod(int inputRate, int outputRate);

const char* conversionMethodToString(ConversionMethod method);

// Duplicate each 16-bit sample `ratio` times, order preserved.
PcmBytes repeatSamples(const PcmBytes& pcm, int ratio);

// Linear interpolation between neighbouring samples. No filter state is
// carried between calls, so every chunk starts fresh.
PcmBytes interpolateLinear(const PcmBytes& pcm, int inputRate, int outputRate);

/**
 * @brief Convert 16-bit mono PCM from inputRate to outputRate
 *
 * @return OK, AUDIO_INVALID_SAMPLE_RATE for non-positive rates, or
 *         AUDIO_MALFORMED_FRAME when the byte count is odd. `out` is only
 *         written on success.
 */
ErrorCode convertSampleRate(const PcmBytes& pcm, int inputRate, int outputRate, PcmBytes& out);

}  // namespace audio
}  // namespace voice_inject

#endif  // VOICE_INJECT_AUDIO_SAMPLE_RATE_CONVERTER_H
