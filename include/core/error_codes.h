#ifndef VOXCAP_CORE_ERROR_CODES_H
#define VOXCAP_CORE_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace voxcap::core {

/**
 * @brief Error codes surfaced by the capture pipeline and the recording lifecycle.
 *
 * Categories use the upper 4 bits of the 16-bit code (0xF000 mask):
 * - 0x1xxx: Capture device
 * - 0x2xxx: Pipeline stages
 * - 0x3xxx: Recording lifecycle
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Capture device (0x1000)
    CAPTURE_DEVICE_UNAVAILABLE = 0x1001,
    CAPTURE_DEVICE_DISCONNECTED = 0x1002,
    CAPTURE_STOP_TIMEOUT = 0x1003,
    CAPTURE_UNSUPPORTED_FORMAT = 0x1004,

    // Pipeline stages (0x2000)
    PIPELINE_STAGE_ERROR = 0x2001,
    PIPELINE_BUFFER_FULL = 0x2002,
    PIPELINE_INFERENCE_FAILED = 0x2003,

    // Recording lifecycle (0x3000)
    LIFECYCLE_INVALID_TRANSITION = 0x3001,
    LIFECYCLE_LOCK_FAILURE = 0x3002,
    LIFECYCLE_SINK_FAILED = 0x3003,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_FILE_NOT_FOUND = 0x5002,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "CAPTURE_DEVICE_UNAVAILABLE"), or "UNKNOWN_ERROR"
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name for an error code ("capture", "pipeline", "lifecycle", ...).
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x3001").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isCaptureError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isPipelineError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isLifecycleError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if the failed request may succeed when repeated.
 *
 * Retryable: CAPTURE_DEVICE_DISCONNECTED (reconnect), LIFECYCLE_LOCK_FAILURE
 * (another transition was in flight), CAPTURE_STOP_TIMEOUT.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::CAPTURE_DEVICE_DISCONNECTED ||
           code == ErrorCode::LIFECYCLE_LOCK_FAILURE || code == ErrorCode::CAPTURE_STOP_TIMEOUT;
}

}  // namespace voxcap::core

#endif  // VOXCAP_CORE_ERROR_CODES_H
