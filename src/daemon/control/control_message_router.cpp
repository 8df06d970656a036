#include "daemon/control/control_message_router.h"

#include "core/base64.h"
#include "logging/logger.h"

#include <cstdint>
#include <limits>
#include <utility>

namespace voice_inject {
namespace control {

namespace {

bool decodeChunk(const nlohmann::json& data, audio::PcmBytes& out) {
    if (!data.contains("chunk") || !data["chunk"].is_string()) {
        return false;
    }
    return Base64::decode(data["chunk"].get<std::string>(), out);
}

}  // namespace

ControlMessageRouter::ControlMessageRouter(ControlHandlers handlers)
    : handlers_(std::move(handlers)) {}

ErrorCode ControlMessageRouter::handleMessage(const std::string& text) {
    nlohmann::json message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded()) {
        LOG_WARN("Control message is not valid JSON ({} bytes)", text.size());
        return ErrorCode::CONTROL_INVALID_MESSAGE;
    }
    return handleJson(message);
}

ErrorCode ControlMessageRouter::handleJson(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("trigger") || !message["trigger"].is_string()) {
        LOG_WARN("Control message without a trigger");
        return ErrorCode::CONTROL_INVALID_MESSAGE;
    }
    const std::string trigger = message["trigger"].get<std::string>();

    static const nlohmann::json kEmpty = nlohmann::json::object();
    const nlohmann::json& data =
        (message.contains("data") && message["data"].is_object()) ? message["data"] : kEmpty;

    ErrorCode rc = ErrorCode::CONTROL_UNKNOWN_TRIGGER;
    try {
        if (trigger == Triggers::PAUSE) {
            rc = handlePause(data);
        } else if (trigger == Triggers::BOT_OUTPUT) {
            rc = handleBotOutput(data);
        } else if (trigger == Triggers::MIXED_AUDIO) {
            rc = handleMixedAudio(data);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Control message '{}' has a malformed payload: {}", trigger, e.what());
        rc = ErrorCode::CONTROL_INVALID_PAYLOAD;
    }

    if (rc == ErrorCode::CONTROL_UNKNOWN_TRIGGER) {
        LOG_DEBUG("Ignoring control message with unknown trigger '{}'", trigger);
    } else if (rc != ErrorCode::OK) {
        LOG_WARN("Control message '{}' rejected: {} ({})", trigger, errorCodeToString(rc),
                 errorCodeToHex(rc));
    }
    return rc;
}

ErrorCode ControlMessageRouter::handlePause(const nlohmann::json& data) {
    if (!data.contains("duration") || !data["duration"].is_number()) {
        return ErrorCode::CONTROL_INVALID_PAYLOAD;
    }
    const double durationMs = data["duration"].get<double>();
    if (durationMs < 0.0) {
        return ErrorCode::CONTROL_INVALID_PAYLOAD;
    }
    LOG_INFO("Pause requested for {:.0f} ms", durationMs);
    if (handlers_.pauseFor) {
        handlers_.pauseFor(durationMs / 1000.0);
    }
    return ErrorCode::OK;
}

ErrorCode ControlMessageRouter::handleBotOutput(const nlohmann::json& data) {
    if (!data.contains("sample_rate") || !data["sample_rate"].is_number_integer()) {
        return ErrorCode::CONTROL_INVALID_PAYLOAD;
    }
    const auto& rate = data["sample_rate"];
    const bool fitsInt =
        rate.is_number_unsigned()
            ? rate.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
            : (rate.get<int64_t>() >= std::numeric_limits<int>::min() &&
               rate.get<int64_t>() <= std::numeric_limits<int>::max());
    if (!fitsInt) {
        return ErrorCode::CONTROL_INVALID_PAYLOAD;
    }
    const int sampleRate = rate.get<int>();
    audio::PcmBytes pcm;
    if (!decodeChunk(data, pcm)) {
        return ErrorCode::CONTROL_INVALID_PAYLOAD;
    }
    if (handlers_.addChunk) {
        handlers_.addChunk(pcm, sampleRate);
    }
    return ErrorCode::OK;
}

ErrorCode ControlMessageRouter::handleMixedAudio(const nlohmann::json& data) {
    audio::PcmBytes pcm;
    if (!decodeChunk(data, pcm)) {
        return ErrorCode::CONTROL_INVALID_PAYLOAD;
    }
    if (handlers_.mixedAudio) {
        handlers_.mixedAudio(pcm);
    }
    return ErrorCode::OK;
}

}  // namespace control
}  // namespace voice_inject
