/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error code helpers
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace voice_inject;

// ============================================================
// errorCodeToString
// ============================================================

TEST(ErrorCodesTest, ToStringKnownCodes) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::AUDIO_INVALID_SAMPLE_RATE),
                 "AUDIO_INVALID_SAMPLE_RATE");
    EXPECT_STREQ(errorCodeToString(ErrorCode::PLAYBACK_SINK_FAILED), "PLAYBACK_SINK_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::CONTROL_UNKNOWN_TRIGGER),
                 "CONTROL_UNKNOWN_TRIGGER");
}

TEST(ErrorCodesTest, ToStringUnmappedValue) {
    EXPECT_STREQ(errorCodeToString(static_cast<ErrorCode>(0x7777)), "UNKNOWN_ERROR");
    // 0x1003 is unassigned
    EXPECT_STREQ(errorCodeToString(static_cast<ErrorCode>(0x1003)), "UNKNOWN_ERROR");
}

// ============================================================
// Categories
// ============================================================

TEST(ErrorCodesTest, CategoryFromHighNibble) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::AUDIO_MALFORMED_FRAME), "audio");
    EXPECT_STREQ(getErrorCategory(ErrorCode::PLAYBACK_WORKER_START_FAILED), "playback");
    EXPECT_STREQ(getErrorCategory(ErrorCode::CONTROL_INVALID_PAYLOAD), "control");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_CONFIG), "validation");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INTERNAL_UNKNOWN), "internal");
}

TEST(ErrorCodesTest, CategoryPredicates) {
    EXPECT_TRUE(isAudioError(ErrorCode::AUDIO_MALFORMED_FRAME));
    EXPECT_FALSE(isAudioError(ErrorCode::PLAYBACK_SINK_FAILED));
    EXPECT_TRUE(isPlaybackError(ErrorCode::PLAYBACK_SINK_FAILED));
    EXPECT_TRUE(isControlError(ErrorCode::CONTROL_INVALID_MESSAGE));
    EXPECT_TRUE(isValidationError(ErrorCode::VALIDATION_FILE_NOT_FOUND));
    EXPECT_TRUE(isInternalError(ErrorCode::INTERNAL_UNKNOWN));
    EXPECT_FALSE(isInternalError(ErrorCode::OK));
}

// ============================================================
// Hex / parse
// ============================================================

TEST(ErrorCodesTest, HexIsUppercaseFourDigits) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::AUDIO_MALFORMED_FRAME), "0x1002");
    EXPECT_EQ(errorCodeToHex(ErrorCode::INTERNAL_UNKNOWN), "0xF001");
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
}

TEST(ErrorCodesTest, StringToErrorCodeRoundTripsNames) {
    const ErrorCode codes[] = {ErrorCode::AUDIO_INVALID_SAMPLE_RATE,
                               ErrorCode::PLAYBACK_WORKER_START_FAILED,
                               ErrorCode::CONTROL_INVALID_PAYLOAD,
                               ErrorCode::VALIDATION_INVALID_CONFIG};
    for (ErrorCode code : codes) {
        EXPECT_EQ(stringToErrorCode(errorCodeToString(code)), code);
    }
}

TEST(ErrorCodesTest, StringToErrorCodeUnknownName) {
    EXPECT_EQ(stringToErrorCode("NOT_A_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}
