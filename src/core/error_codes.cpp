#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace voice_inject {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    {ErrorCode::AUDIO_INVALID_SAMPLE_RATE, "AUDIO_INVALID_SAMPLE_RATE"},
    {ErrorCode::AUDIO_MALFORMED_FRAME, "AUDIO_MALFORMED_FRAME"},

    {ErrorCode::PLAYBACK_SINK_FAILED, "PLAYBACK_SINK_FAILED"},
    {ErrorCode::PLAYBACK_WORKER_START_FAILED, "PLAYBACK_WORKER_START_FAILED"},

    {ErrorCode::CONTROL_INVALID_MESSAGE, "CONTROL_INVALID_MESSAGE"},
    {ErrorCode::CONTROL_UNKNOWN_TRIGGER, "CONTROL_UNKNOWN_TRIGGER"},
    {ErrorCode::CONTROL_INVALID_PAYLOAD, "CONTROL_INVALID_PAYLOAD"},

    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},

    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (kErrorCodeStrings.find(code) == kErrorCodeStrings.end()) {
        return "internal";
    }
    switch (static_cast<uint32_t>(code) & 0xF000) {
    case 0x1000:
        return "audio";
    case 0x2000:
        return "playback";
    case 0x3000:
        return "control";
    case 0x5000:
        return "validation";
    default:
        return "internal";
    }
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
        << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    for (const auto& entry : kErrorCodeStrings) {
        if (str == entry.second) {
            return entry.first;
        }
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace voice_inject
