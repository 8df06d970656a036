#ifndef VOICE_INJECT_ERROR_CODES_H
#define VOICE_INJECT_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace voice_inject {

/**
 * @brief Error codes for the playback core.
 *
 * Categories use the upper nibble of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Audio / PCM input
 * - 0x2xxx: Playback pipeline (worker, sink)
 * - 0x3xxx: Control messages from the signalling layer
 * - 0x5xxx: Validation / configuration
 * - 0xFxxx: Internal (reserved)
 *
 * Idle worker exit is a lifecycle transition and has no code.
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio / PCM (0x1000)
    AUDIO_INVALID_SAMPLE_RATE = 0x1001,  // frame size would be zero or negative
    AUDIO_MALFORMED_FRAME = 0x1002,      // byte length not a multiple of the sample width

    // Playback pipeline (0x2000)
    PLAYBACK_SINK_FAILED = 0x2001,
    PLAYBACK_WORKER_START_FAILED = 0x2002,  // thread creation refused

    // Control messages (0x3000)
    CONTROL_INVALID_MESSAGE = 0x3001,
    CONTROL_UNKNOWN_TRIGGER = 0x3002,
    CONTROL_INVALID_PAYLOAD = 0x3003,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_FILE_NOT_FOUND = 0x5002,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to its enumerator name.
 * @return e.g. "AUDIO_MALFORMED_FRAME", or "UNKNOWN_ERROR" for unmapped values
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name ("audio", "playback", "control", "validation", "internal", "ok").
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Hex form used in log lines, e.g. "0x1002".
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Reverse of errorCodeToString; INTERNAL_UNKNOWN if not found.
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isAudioError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isPlaybackError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isControlError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

}  // namespace voice_inject

#endif  // VOICE_INJECT_ERROR_CODES_H
