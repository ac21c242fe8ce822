#include "recording/recording_types.h"

namespace voxcap::recording {

const char* recordingStateToString(RecordingState state) {
    switch (state) {
    case RecordingState::Idle:
        return "idle";
    case RecordingState::Listening:
        return "listening";
    case RecordingState::Recording:
        return "recording";
    case RecordingState::Processing:
        return "processing";
    default:
        return "unknown";
    }
}

bool isValidTransition(RecordingState from, RecordingState to) {
    using S = RecordingState;
    switch (from) {
    case S::Idle:
        return to == S::Listening || to == S::Recording;
    case S::Listening:
        return to == S::Idle || to == S::Recording;
    case S::Recording:
        return to == S::Processing || to == S::Idle || to == S::Listening;
    case S::Processing:
        return to == S::Idle || to == S::Listening;
    default:
        return false;
    }
}

const char* stopReasonToString(StopReason reason) {
    switch (reason) {
    case StopReason::User:
        return "user";
    case StopReason::BufferFull:
        return "buffer_full";
    case StopReason::DeviceDisconnected:
        return "device_disconnected";
    default:
        return "unknown";
    }
}

nlohmann::json toJson(const RecordingMetadata& metadata) {
    nlohmann::json j;
    j["duration_secs"] = metadata.durationSeconds;
    j["sample_count"] = metadata.sampleCount;
    j["sample_rate"] = metadata.sampleRate;
    j["stop_reason"] = stopReasonToString(metadata.stopReason);
    return j;
}

}  // namespace voxcap::recording
