#include "recording/lifecycle_events.h"

namespace voxcap::recording {

const char* lifecycleEventTypeToString(LifecycleEventType type) {
    switch (type) {
    case LifecycleEventType::Started:
        return "started";
    case LifecycleEventType::Stopped:
        return "stopped";
    case LifecycleEventType::Cancelled:
        return "cancelled";
    case LifecycleEventType::Error:
        return "error";
    default:
        return "unknown";
    }
}

nlohmann::json toJson(const LifecycleEvent& event) {
    nlohmann::json j;
    j["type"] = lifecycleEventTypeToString(event.type);
    j["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                            event.timestamp.time_since_epoch())
                            .count();
    if (event.metadata) {
        j["metadata"] = toJson(*event.metadata);
    }
    if (event.errorCode != core::ErrorCode::OK) {
        j["error"] = {{"code", core::errorCodeToString(event.errorCode)},
                      {"category", core::getErrorCategory(event.errorCode)},
                      {"hex", core::errorCodeToHex(event.errorCode)}};
    }
    if (!event.message.empty()) {
        j["message"] = event.message;
    }
    return j;
}

}  // namespace voxcap::recording
