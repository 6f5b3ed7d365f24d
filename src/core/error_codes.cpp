#include "core/error_codes.h"

#include <array>
#include <cstdio>

namespace CastEngine {
namespace {

struct ErrorInfo {
    ErrorCode code;
    const char* name;
    int httpStatus;
};

#define CASTGRID_ERROR(code, status) ErrorInfo{ErrorCode::code, #code, status}

// One row per code; name and HTTP status stay next to each other
constexpr std::array kErrorTable = {
    CASTGRID_ERROR(OK, 200),

    CASTGRID_ERROR(DISCOVERY_SOCKET_ERROR, 503),
    CASTGRID_ERROR(DISCOVERY_MALFORMED_RESPONSE, 502),
    CASTGRID_ERROR(DISCOVERY_DESCRIPTION_FAILED, 502),
    CASTGRID_ERROR(DISCOVERY_NOT_RENDERER, 422),

    CASTGRID_ERROR(DEVICE_NOT_FOUND, 404),
    CASTGRID_ERROR(DEVICE_UNREACHABLE, 504),
    CASTGRID_ERROR(DEVICE_PROTOCOL_REJECTED, 502),
    CASTGRID_ERROR(DEVICE_INVALID_RESPONSE, 502),
    CASTGRID_ERROR(DEVICE_UNSUPPORTED_ACTION, 501),
    CASTGRID_ERROR(DEVICE_NOT_CONNECTED, 409),
    CASTGRID_ERROR(DEVICE_HELD, 409),

    CASTGRID_ERROR(IPC_CONNECTION_FAILED, 503),
    CASTGRID_ERROR(IPC_TIMEOUT, 504),
    CASTGRID_ERROR(IPC_INVALID_COMMAND, 400),
    CASTGRID_ERROR(IPC_INVALID_PARAMS, 400),
    CASTGRID_ERROR(IPC_DAEMON_NOT_RUNNING, 503),
    CASTGRID_ERROR(IPC_PROTOCOL_ERROR, 500),

    CASTGRID_ERROR(STREAM_SESSION_NOT_FOUND, 404),
    CASTGRID_ERROR(STREAM_FILE_NOT_FOUND, 404),
    CASTGRID_ERROR(STREAM_RANGE_NOT_SATISFIABLE, 416),
    CASTGRID_ERROR(STREAM_BIND_FAILED, 500),
    CASTGRID_ERROR(STREAM_STALE_SESSION, 410),

    CASTGRID_ERROR(VALIDATION_INVALID_CONFIG, 400),
    CASTGRID_ERROR(VALIDATION_INVALID_DEVICE_CONFIG, 400),
    CASTGRID_ERROR(VALIDATION_FILE_NOT_FOUND, 404),
    CASTGRID_ERROR(VALIDATION_INVALID_BRIGHTNESS, 400),
    CASTGRID_ERROR(VALIDATION_INVALID_USER_CONTROL, 400),

    // Some devices failed; the batch itself completed
    CASTGRID_ERROR(BLACKOUT_PARTIAL_FAILURE, 207),
    CASTGRID_ERROR(BLACKOUT_NOT_ACTIVE, 409),
    CASTGRID_ERROR(BLACKOUT_CLIP_MISSING, 404),

    CASTGRID_ERROR(INTERNAL_UNKNOWN, 500),
};

#undef CASTGRID_ERROR

const ErrorInfo* findInfo(ErrorCode code) {
    for (const auto& info : kErrorTable) {
        if (info.code == code) {
            return &info;
        }
    }
    return nullptr;
}

}  // namespace

InnerError::InnerError(ErrorCode code, const std::string& message)
    : cpp_code(errorCodeToHex(code)), cpp_message(message) {}

const char* errorCodeToString(ErrorCode code) {
    const ErrorInfo* info = findInfo(code);
    return info ? info->name : "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    switch (static_cast<uint32_t>(code) & 0xF000) {
        case 0x1000:
            return "discovery";
        case 0x2000:
            return "device_control";
        case 0x3000:
            return "ipc_zeromq";
        case 0x4000:
            return "streaming";
        case 0x5000:
            return "validation";
        case 0x6000:
            return "blackout";
        default:
            return "internal";
    }
}

int toHttpStatus(ErrorCode code) {
    const ErrorInfo* info = findInfo(code);
    return info ? info->httpStatus : 500;
}

std::string errorCodeToHex(ErrorCode code) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%04x", static_cast<unsigned>(code));
    return buffer;
}

ErrorCode stringToErrorCode(const std::string& str) {
    for (const auto& info : kErrorTable) {
        if (str == info.name) {
            return info.code;
        }
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace CastEngine
