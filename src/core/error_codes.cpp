#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace voxcap::core {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    {ErrorCode::CAPTURE_DEVICE_UNAVAILABLE, "CAPTURE_DEVICE_UNAVAILABLE"},
    {ErrorCode::CAPTURE_DEVICE_DISCONNECTED, "CAPTURE_DEVICE_DISCONNECTED"},
    {ErrorCode::CAPTURE_STOP_TIMEOUT, "CAPTURE_STOP_TIMEOUT"},
    {ErrorCode::CAPTURE_UNSUPPORTED_FORMAT, "CAPTURE_UNSUPPORTED_FORMAT"},

    {ErrorCode::PIPELINE_STAGE_ERROR, "PIPELINE_STAGE_ERROR"},
    {ErrorCode::PIPELINE_BUFFER_FULL, "PIPELINE_BUFFER_FULL"},
    {ErrorCode::PIPELINE_INFERENCE_FAILED, "PIPELINE_INFERENCE_FAILED"},

    {ErrorCode::LIFECYCLE_INVALID_TRANSITION, "LIFECYCLE_INVALID_TRANSITION"},
    {ErrorCode::LIFECYCLE_LOCK_FAILURE, "LIFECYCLE_LOCK_FAILURE"},
    {ErrorCode::LIFECYCLE_SINK_FAILED, "LIFECYCLE_SINK_FAILED"},

    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},

    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// Reverse lookup, built once from kErrorCodeStrings
static const std::unordered_map<std::string, ErrorCode>& stringTable() {
    static const std::unordered_map<std::string, ErrorCode> table = [] {
        std::unordered_map<std::string, ErrorCode> t;
        for (const auto& [code, name] : kErrorCodeStrings) {
            t.emplace(name, code);
        }
        return t;
    }();
    return table;
}

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
    if (isCaptureError(code)) {
        return "capture";
    }
    if (isPipelineError(code)) {
        return "pipeline";
    }
    if (isLifecycleError(code)) {
        return "lifecycle";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    const auto& table = stringTable();
    auto it = table.find(str);
    if (it != table.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace voxcap::core
