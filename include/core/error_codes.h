#ifndef CASTGRID_ERROR_CODES_H
#define CASTGRID_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>

namespace CastEngine {

/**
 * @brief Error codes for the cast engine.
 *
 * Categories use upper bits (0xF000 mask):
 * - 0x1xxx: Discovery (SSDP / device description)
 * - 0x2xxx: Device control (DLNA / Transcreen)
 * - 0x3xxx: IPC/ZeroMQ
 * - 0x4xxx: Streaming
 * - 0x5xxx: Validation
 * - 0x6xxx: Blackout
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Discovery (0x1000)
    DISCOVERY_SOCKET_ERROR = 0x1001,
    DISCOVERY_MALFORMED_RESPONSE = 0x1002,
    DISCOVERY_DESCRIPTION_FAILED = 0x1003,
    DISCOVERY_NOT_RENDERER = 0x1004,

    // Device control (0x2000)
    DEVICE_NOT_FOUND = 0x2001,
    DEVICE_UNREACHABLE = 0x2002,
    DEVICE_PROTOCOL_REJECTED = 0x2003,
    DEVICE_INVALID_RESPONSE = 0x2004,
    DEVICE_UNSUPPORTED_ACTION = 0x2005,
    DEVICE_NOT_CONNECTED = 0x2006,
    DEVICE_HELD = 0x2007,

    // IPC/ZeroMQ (0x3000)
    IPC_CONNECTION_FAILED = 0x3001,
    IPC_TIMEOUT = 0x3002,
    IPC_INVALID_COMMAND = 0x3003,
    IPC_INVALID_PARAMS = 0x3004,
    IPC_DAEMON_NOT_RUNNING = 0x3005,
    IPC_PROTOCOL_ERROR = 0x3006,

    // Streaming (0x4000)
    STREAM_SESSION_NOT_FOUND = 0x4001,
    STREAM_FILE_NOT_FOUND = 0x4002,
    STREAM_RANGE_NOT_SATISFIABLE = 0x4003,
    STREAM_BIND_FAILED = 0x4004,
    STREAM_STALE_SESSION = 0x4005,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_DEVICE_CONFIG = 0x5002,
    VALIDATION_FILE_NOT_FOUND = 0x5003,
    VALIDATION_INVALID_BRIGHTNESS = 0x5004,
    VALIDATION_INVALID_USER_CONTROL = 0x5005,

    // Blackout (0x6000)
    BLACKOUT_PARTIAL_FAILURE = 0x6001,
    BLACKOUT_NOT_ACTIVE = 0x6002,
    BLACKOUT_CLIP_MISSING = 0x6003,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Inner error details from lower layers.
 *
 * Used to propagate detailed error information from libcurl, sockets, etc.
 */
struct InnerError {
    std::string cpp_code;                  // Error code as hex string (e.g., "0x2002")
    std::string cpp_message;               // Detailed C++ error message
    std::optional<int> curl_code;          // CURLcode of a failed transfer
    std::optional<long> http_status;       // HTTP status returned by the device
    std::optional<int> sys_errno;          // errno of a failed socket call

    InnerError() = default;

    InnerError(ErrorCode code, const std::string& message);
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "DEVICE_UNREACHABLE"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "device_control"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to HTTP status code.
 * @param code The error code
 * @return HTTP status code (e.g., 400, 404, 500), or 500 for unknown codes
 */
int toHttpStatus(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x2002")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "DEVICE_NOT_FOUND")
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isDiscoveryError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isDeviceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isStreamingError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isBlackoutError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x6000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if error is retryable.
 * @param code Error code
 * @return true if operation can be retried
 *
 * Retryable errors (503/504 HTTP status):
 * - DEVICE_UNREACHABLE
 * - IPC_DAEMON_NOT_RUNNING
 * - IPC_TIMEOUT
 * - IPC_CONNECTION_FAILED
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::DEVICE_UNREACHABLE || code == ErrorCode::IPC_DAEMON_NOT_RUNNING ||
           code == ErrorCode::IPC_TIMEOUT || code == ErrorCode::IPC_CONNECTION_FAILED;
}

}  // namespace CastEngine

#endif  // CASTGRID_ERROR_CODES_H
