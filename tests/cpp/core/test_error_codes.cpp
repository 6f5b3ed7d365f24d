/**
 * @file test_error_codes.cpp
 * @brief Unit tests for cast engine error codes.
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace CastEngine;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::DEVICE_UNREACHABLE), "DEVICE_UNREACHABLE");
    EXPECT_STREQ(errorCodeToString(ErrorCode::IPC_TIMEOUT), "IPC_TIMEOUT");
    EXPECT_STREQ(errorCodeToString(ErrorCode::STREAM_SESSION_NOT_FOUND),
                 "STREAM_SESSION_NOT_FOUND");
    EXPECT_STREQ(errorCodeToString(ErrorCode::BLACKOUT_PARTIAL_FAILURE),
                 "BLACKOUT_PARTIAL_FAILURE");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

TEST(ErrorCodes, StringRoundTripsThroughEnum) {
    EXPECT_EQ(stringToErrorCode("DEVICE_HELD"), ErrorCode::DEVICE_HELD);
    EXPECT_EQ(stringToErrorCode("VALIDATION_INVALID_BRIGHTNESS"),
              ErrorCode::VALIDATION_INVALID_BRIGHTNESS);
    EXPECT_EQ(stringToErrorCode("NOT_A_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}

// ============================================================
// Error Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::DISCOVERY_MALFORMED_RESPONSE), "discovery");
    EXPECT_STREQ(getErrorCategory(ErrorCode::DEVICE_NOT_FOUND), "device_control");
    EXPECT_STREQ(getErrorCategory(ErrorCode::IPC_CONNECTION_FAILED), "ipc_zeromq");
    EXPECT_STREQ(getErrorCategory(ErrorCode::STREAM_BIND_FAILED), "streaming");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_CONFIG), "validation");
    EXPECT_STREQ(getErrorCategory(ErrorCode::BLACKOUT_CLIP_MISSING), "blackout");
}

TEST(ErrorCodes, UnknownCategoryReturnsInternal) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(getErrorCategory(unknownCode), "internal");
}

TEST(ErrorCodes, CategoryCheckers) {
    EXPECT_TRUE(isDiscoveryError(ErrorCode::DISCOVERY_SOCKET_ERROR));
    EXPECT_FALSE(isDiscoveryError(ErrorCode::DEVICE_UNREACHABLE));

    EXPECT_TRUE(isDeviceError(ErrorCode::DEVICE_PROTOCOL_REJECTED));
    EXPECT_TRUE(isIpcError(ErrorCode::IPC_PROTOCOL_ERROR));
    EXPECT_TRUE(isStreamingError(ErrorCode::STREAM_STALE_SESSION));
    EXPECT_TRUE(isValidationError(ErrorCode::VALIDATION_FILE_NOT_FOUND));
    EXPECT_TRUE(isBlackoutError(ErrorCode::BLACKOUT_NOT_ACTIVE));
    EXPECT_TRUE(isInternalError(ErrorCode::INTERNAL_UNKNOWN));
}

// ============================================================
// HTTP Status Mapping Tests
// ============================================================

TEST(ErrorCodes, ToHttpStatus) {
    EXPECT_EQ(toHttpStatus(ErrorCode::OK), 200);
    EXPECT_EQ(toHttpStatus(ErrorCode::DEVICE_NOT_FOUND), 404);
    EXPECT_EQ(toHttpStatus(ErrorCode::DEVICE_UNREACHABLE), 504);
    EXPECT_EQ(toHttpStatus(ErrorCode::STREAM_SESSION_NOT_FOUND), 404);
    EXPECT_EQ(toHttpStatus(ErrorCode::STREAM_RANGE_NOT_SATISFIABLE), 416);
    EXPECT_EQ(toHttpStatus(ErrorCode::BLACKOUT_PARTIAL_FAILURE), 207);
    EXPECT_EQ(toHttpStatus(ErrorCode::IPC_INVALID_PARAMS), 400);
}

TEST(ErrorCodes, UnknownErrorReturns500) {
    EXPECT_EQ(toHttpStatus(static_cast<ErrorCode>(0xFFFF)), 500);
}

TEST(ErrorCodes, ErrorCodeToHex) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::DEVICE_UNREACHABLE), "0x2002");
    EXPECT_EQ(errorCodeToHex(ErrorCode::BLACKOUT_PARTIAL_FAILURE), "0x6001");
}

TEST(ErrorCodes, OnlyTransientFailuresAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::DEVICE_UNREACHABLE));
    EXPECT_TRUE(isRetryable(ErrorCode::IPC_TIMEOUT));
    EXPECT_FALSE(isRetryable(ErrorCode::DEVICE_PROTOCOL_REJECTED));
    EXPECT_FALSE(isRetryable(ErrorCode::STREAM_SESSION_NOT_FOUND));
}

// ============================================================
// InnerError Tests
// ============================================================

TEST(ErrorCodes, InnerErrorConstruction) {
    InnerError err(ErrorCode::DEVICE_UNREACHABLE, "Connection refused");
    EXPECT_EQ(err.cpp_code, "0x2002");
    EXPECT_EQ(err.cpp_message, "Connection refused");
    EXPECT_FALSE(err.curl_code.has_value());
    EXPECT_FALSE(err.http_status.has_value());
}
