#pragma once

#include "core/error_codes.h"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace voxcap::recording {

enum class RecordingState {
    Idle,
    Listening,
    Recording,
    Processing,
};

const char* recordingStateToString(RecordingState state);

/**
 * @brief Direct transitions allowed by the lifecycle.
 *
 * Idle <-> Listening, Idle/Listening -> Recording, Recording -> Processing,
 * Recording -> Idle/Listening (cancel or device loss), Processing -> Idle/Listening.
 */
bool isValidTransition(RecordingState from, RecordingState to);

enum class StopReason {
    User,                // stop request from a trigger source
    BufferFull,          // maximum recording length reached
    DeviceDisconnected,  // device lost and reconnect failed
};

const char* stopReasonToString(StopReason reason);

struct RecordingMetadata {
    double durationSeconds = 0.0;
    std::size_t sampleCount = 0;
    uint32_t sampleRate = 0;
    StopReason stopReason = StopReason::User;
};

// Finished session audio at the target rate, retained for transcription
struct CompletedRecording {
    std::vector<float> samples;
    RecordingMetadata metadata;
};

struct RecordingResult {
    core::ErrorCode code = core::ErrorCode::OK;
    std::string message;
    std::optional<RecordingMetadata> metadata;

    bool ok() const {
        return code == core::ErrorCode::OK;
    }

    static RecordingResult success(std::optional<RecordingMetadata> metadata = std::nullopt) {
        RecordingResult r;
        r.metadata = std::move(metadata);
        return r;
    }

    static RecordingResult failure(core::ErrorCode code, std::string message) {
        RecordingResult r;
        r.code = code;
        r.message = std::move(message);
        return r;
    }
};

/**
 * @brief Consumer of finished recordings (encoder, transcription hand-off).
 *
 * Called on the control path while the coordinator is in Processing. Implementations may
 * block; they are never called with coordinator locks held.
 */
class RecordingSink {
   public:
    virtual ~RecordingSink() = default;
    virtual const char* name() const = 0;
    // Returns false on failure; the recording is still retained
    virtual bool onRecordingComplete(const CompletedRecording& recording) = 0;
};

nlohmann::json toJson(const RecordingMetadata& metadata);

}  // namespace voxcap::recording
