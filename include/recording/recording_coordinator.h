#pragma once

#include "capture/capture_source.h"
#include "core/config_loader.h"
#include "metrics/session_diagnostics.h"
#include "pipeline/capture_pipeline.h"
#include "recording/lifecycle_events.h"
#include "recording/recording_types.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxcap::recording {

/**
 * @brief Owns the Idle/Listening/Recording/Processing lifecycle of one capture session.
 *
 * Every transition follows the same shape: validate and mark the coordinator busy under
 * the primary lock, release it, talk to the capture source / pipeline / sinks, then
 * re-take the lock to commit the resulting state. Events are published after the commit
 * with no lock held. A second request arriving while a transition is in flight is
 * rejected as an invalid transition.
 *
 * The pipeline and source must outlive the coordinator.
 */
class RecordingCoordinator {
   public:
    RecordingCoordinator(const core::AppConfig& config, capture::CaptureSource& source,
                         pipeline::CapturePipeline& pipeline);
    ~RecordingCoordinator();

    RecordingCoordinator(const RecordingCoordinator&) = delete;
    RecordingCoordinator& operator=(const RecordingCoordinator&) = delete;

    RecordingResult start();
    RecordingResult stop(StopReason reason = StopReason::User);
    RecordingResult cancel();

    // Idle <-> Listening. While a recording is active, enabling is rejected with
    // LIFECYCLE_INVALID_TRANSITION and disabling makes the session end in Idle.
    RecordingResult setListeningMode(bool enabled);

    // Device lost while recording: bounded reconnect, otherwise finalize to Idle
    RecordingResult handleDeviceLost(const std::string& reason);

    // Capture buffer exhausted: stop with StopReason::BufferFull
    RecordingResult handleBufferFull();

    void addSink(std::shared_ptr<RecordingSink> sink);

    EventDispatcher& events() {
        return events_;
    }

    RecordingState state() const;
    bool listeningMode() const;

    std::shared_ptr<const CompletedRecording> lastRecording() const;
    void clearLastRecording();

    metrics::DiagnosticsSnapshot diagnostics() const {
        return pipeline_.diagnostics().snapshot();
    }

   private:
    using Lock = std::unique_lock<std::timed_mutex>;

    bool acquire(Lock& lock, const char* operation);
    RecordingState restingState() const;  // requires lock
    void commit(RecordingState from, RecordingState to);
    void release();  // clears busy_ without a state change
    void markSourceQuiescent(bool quiescent);

    capture::CaptureStartResult startSource();
    std::shared_ptr<CompletedRecording> collectRecording(StopReason reason, bool flushTail);
    bool deliverToSinks(const CompletedRecording& recording);

    void publishEvent(LifecycleEventType type, std::optional<RecordingMetadata> metadata = {},
                      core::ErrorCode code = core::ErrorCode::OK, std::string message = {});

    core::AppConfig config_;
    capture::CaptureSource& source_;
    pipeline::CapturePipeline& pipeline_;
    EventDispatcher events_;

    std::chrono::milliseconds lockTimeout_;
    std::chrono::milliseconds stopTimeout_;

    mutable std::timed_mutex mutex_;
    RecordingState state_ = RecordingState::Idle;
    bool busy_ = false;
    bool listeningMode_ = false;
    bool sourceQuiescent_ = true;  // last source stop was confirmed
    std::shared_ptr<const CompletedRecording> lastRecording_;

    std::mutex sinksMutex_;
    std::vector<std::shared_ptr<RecordingSink>> sinks_;
};

}  // namespace voxcap::recording
