#include "recording/recording_coordinator.h"

#include "logging/logger.h"

#include <exception>
#include <thread>

namespace voxcap::recording {

RecordingCoordinator::RecordingCoordinator(const core::AppConfig& config,
                                           capture::CaptureSource& source,
                                           pipeline::CapturePipeline& pipeline)
    : config_(config),
      source_(source),
      pipeline_(pipeline),
      lockTimeout_(config.recording.lockTimeoutMs),
      stopTimeout_(config.recording.stopTimeoutMs),
      listeningMode_(config.recording.listeningMode) {
    state_ = listeningMode_ ? RecordingState::Listening : RecordingState::Idle;
}

RecordingCoordinator::~RecordingCoordinator() {
    if (source_.isRunning()) {
        if (!source_.stop(stopTimeout_)) {
            LOG_WARN("RecordingCoordinator: capture source did not stop within {} ms",
                     stopTimeout_.count());
        }
    }
}

bool RecordingCoordinator::acquire(Lock& lock, const char* operation) {
    if (lock.try_lock_for(lockTimeout_)) {
        return true;
    }
    LOG_WARN("RecordingCoordinator: {} could not acquire state lock within {} ms", operation,
             lockTimeout_.count());
    return false;
}

RecordingState RecordingCoordinator::restingState() const {
    return listeningMode_ ? RecordingState::Listening : RecordingState::Idle;
}

void RecordingCoordinator::commit(RecordingState from, RecordingState to) {
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        state_ = to;
        busy_ = false;
    }
    if (from != to) {
        LOG_DEBUG("RecordingCoordinator: {} -> {}", recordingStateToString(from),
                  recordingStateToString(to));
        events_.publish(StateChanged{from, to});
    }
}

void RecordingCoordinator::release() {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    busy_ = false;
}

void RecordingCoordinator::markSourceQuiescent(bool quiescent) {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    sourceQuiescent_ = quiescent;
}

RecordingState RecordingCoordinator::state() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return state_;
}

bool RecordingCoordinator::listeningMode() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return listeningMode_;
}

std::shared_ptr<const CompletedRecording> RecordingCoordinator::lastRecording() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return lastRecording_;
}

void RecordingCoordinator::clearLastRecording() {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    lastRecording_.reset();
}

void RecordingCoordinator::addSink(std::shared_ptr<RecordingSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void RecordingCoordinator::publishEvent(LifecycleEventType type,
                                        std::optional<RecordingMetadata> metadata,
                                        core::ErrorCode code, std::string message) {
    LifecycleEvent event;
    event.type = type;
    event.timestamp = std::chrono::system_clock::now();
    event.metadata = std::move(metadata);
    event.errorCode = code;
    event.message = std::move(message);
    events_.publish(event);
}

capture::CaptureStartResult RecordingCoordinator::startSource() {
    capture::CaptureRequest request;
    request.device = config_.capture.device;
    request.preferredSampleRate = config_.capture.sampleRate;
    request.preferredChannels = config_.capture.channels;
    request.periodFrames = config_.capture.periodFrames;

    pipeline::CapturePipeline* pipeline = &pipeline_;
    return source_.start(request, [pipeline](const float* samples, std::size_t sampleCount,
                                             std::size_t channelCount, uint32_t nativeRate) {
        pipeline->onAudio(samples, sampleCount, channelCount, nativeRate);
    });
}

RecordingResult RecordingCoordinator::start() {
    RecordingState from;
    bool unconfirmedStop = false;
    {
        Lock lock(mutex_, std::defer_lock);
        if (!acquire(lock, "start")) {
            return RecordingResult::failure(core::ErrorCode::LIFECYCLE_LOCK_FAILURE,
                                            "state lock timeout");
        }
        if (busy_) {
            return RecordingResult::failure(core::ErrorCode::LIFECYCLE_INVALID_TRANSITION,
                                            "another transition is in progress");
        }
        if (!isValidTransition(state_, RecordingState::Recording)) {
            return RecordingResult::failure(
                core::ErrorCode::LIFECYCLE_INVALID_TRANSITION,
                std::string("cannot start while ") + recordingStateToString(state_));
        }
        busy_ = true;
        from = state_;
        unconfirmedStop = !sourceQuiescent_;
    }

    // Stage state is callback-owned; it may only be reset once the last session's
    // capture thread is confirmed idle
    if (unconfirmedStop) {
        if (!source_.stop(stopTimeout_)) {
            LOG_WARN("RecordingCoordinator: previous capture still active, refusing to start");
            release();
            publishEvent(LifecycleEventType::Error, std::nullopt,
                         core::ErrorCode::CAPTURE_STOP_TIMEOUT,
                         "previous capture session has not stopped");
            return RecordingResult::failure(core::ErrorCode::CAPTURE_STOP_TIMEOUT,
                                            "previous capture session has not stopped");
        }
        markSourceQuiescent(true);
    }

    try {
        pipeline_.prepare(config_.capture.sampleRate);
    } catch (const std::exception& e) {
        LOG_ERROR("RecordingCoordinator: pipeline preparation failed: {}", e.what());
        commit(from, RecordingState::Idle);
        publishEvent(LifecycleEventType::Error, std::nullopt,
                     core::ErrorCode::PIPELINE_STAGE_ERROR, e.what());
        return RecordingResult::failure(core::ErrorCode::PIPELINE_STAGE_ERROR, e.what());
    }

    auto started = startSource();
    if (!started.ok()) {
        LOG_ERROR("RecordingCoordinator: capture source '{}' failed to start: {}",
                  source_.name(), started.message);
        release();
        publishEvent(LifecycleEventType::Error, std::nullopt,
                     core::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE, started.message);
        return RecordingResult::failure(core::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE,
                                        started.message);
    }

    LOG_INFO("RecordingCoordinator: recording started ({} Hz, {} ch via {})", started.sampleRate,
             started.channels, source_.name());
    commit(from, RecordingState::Recording);
    publishEvent(LifecycleEventType::Started);
    return RecordingResult::success();
}

std::shared_ptr<CompletedRecording> RecordingCoordinator::collectRecording(StopReason reason,
                                                                           bool flushTail) {
    if (flushTail) {
        pipeline_.flush();
    }
    auto recording = std::make_shared<CompletedRecording>();
    recording->samples = pipeline_.drain();

    RecordingMetadata& meta = recording->metadata;
    meta.sampleCount = recording->samples.size();
    meta.sampleRate = pipeline_.targetSampleRate();
    meta.durationSeconds =
        meta.sampleRate > 0 ? static_cast<double>(meta.sampleCount) / meta.sampleRate : 0.0;
    meta.stopReason = reason;
    return recording;
}

bool RecordingCoordinator::deliverToSinks(const CompletedRecording& recording) {
    std::vector<std::shared_ptr<RecordingSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    bool allOk = true;
    for (const auto& sink : sinks) {
        bool ok = false;
        try {
            ok = sink->onRecordingComplete(recording);
        } catch (const std::exception& e) {
            LOG_ERROR("RecordingCoordinator: sink '{}' threw: {}", sink->name(), e.what());
        }
        if (!ok) {
            LOG_ERROR("RecordingCoordinator: sink '{}' failed", sink->name());
            allOk = false;
        }
    }
    return allOk;
}

RecordingResult RecordingCoordinator::stop(StopReason reason) {
    {
        Lock lock(mutex_, std::defer_lock);
        if (!acquire(lock, "stop")) {
            return RecordingResult::failure(core::ErrorCode::LIFECYCLE_LOCK_FAILURE,
                                            "state lock timeout");
        }
        if (busy_ || state_ != RecordingState::Recording) {
            return RecordingResult::failure(
                core::ErrorCode::LIFECYCLE_INVALID_TRANSITION,
                busy_ ? "another transition is in progress"
                      : std::string("cannot stop while ") + recordingStateToString(state_));
        }
        busy_ = true;
        state_ = RecordingState::Processing;
    }
    events_.publish(StateChanged{RecordingState::Recording, RecordingState::Processing});

    bool quiescent = source_.stop(stopTimeout_);
    markSourceQuiescent(quiescent);
    if (!quiescent) {
        LOG_WARN("RecordingCoordinator: capture did not quiesce within {} ms, skipping tail flush",
                 stopTimeout_.count());
    }

    std::shared_ptr<CompletedRecording> recording;
    try {
        // flush touches callback-owned stage state, so it needs confirmed quiescence
        recording = collectRecording(reason, quiescent);
    } catch (const std::exception& e) {
        LOG_ERROR("RecordingCoordinator: finalizing recording failed: {}", e.what());
        pipeline_.clearBuffer();
        commit(RecordingState::Processing, RecordingState::Idle);
        publishEvent(LifecycleEventType::Error, std::nullopt,
                     core::ErrorCode::PIPELINE_STAGE_ERROR, e.what());
        return RecordingResult::failure(core::ErrorCode::PIPELINE_STAGE_ERROR, e.what());
    }

    const RecordingMetadata metadata = recording->metadata;
    LOG_INFO("RecordingCoordinator: recording stopped ({}): {:.2f} s, {} samples",
             stopReasonToString(reason), metadata.durationSeconds, metadata.sampleCount);

    bool sinksOk = deliverToSinks(*recording);

    RecordingState resting;
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        lastRecording_ = recording;
        resting = restingState();
    }
    commit(RecordingState::Processing, resting);

    if (!sinksOk) {
        publishEvent(LifecycleEventType::Error, metadata, core::ErrorCode::LIFECYCLE_SINK_FAILED,
                     "recording sink failed");
    }
    publishEvent(LifecycleEventType::Stopped, metadata);

    RecordingResult result = RecordingResult::success(metadata);
    if (!quiescent) {
        result.code = core::ErrorCode::CAPTURE_STOP_TIMEOUT;
        result.message = "capture did not quiesce in time; tail was not flushed";
    }
    return result;
}

RecordingResult RecordingCoordinator::cancel() {
    {
        Lock lock(mutex_, std::defer_lock);
        if (!acquire(lock, "cancel")) {
            return RecordingResult::failure(core::ErrorCode::LIFECYCLE_LOCK_FAILURE,
                                            "state lock timeout");
        }
        if (busy_ || state_ != RecordingState::Recording) {
            return RecordingResult::failure(
                core::ErrorCode::LIFECYCLE_INVALID_TRANSITION,
                busy_ ? "another transition is in progress"
                      : std::string("cannot cancel while ") + recordingStateToString(state_));
        }
        busy_ = true;
    }

    bool quiescent = source_.stop(stopTimeout_);
    markSourceQuiescent(quiescent);
    if (quiescent) {
        pipeline_.clearBuffer();
    } else {
        // Producer may still be running; only the consumer side is safe to touch
        LOG_WARN("RecordingCoordinator: capture did not quiesce within {} ms during cancel",
                 stopTimeout_.count());
        pipeline_.drain();
    }
    LOG_INFO("RecordingCoordinator: recording cancelled");

    RecordingState resting;
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        resting = restingState();
    }
    commit(RecordingState::Recording, resting);
    publishEvent(LifecycleEventType::Cancelled);

    if (!quiescent) {
        return RecordingResult::failure(core::ErrorCode::CAPTURE_STOP_TIMEOUT,
                                        "capture did not quiesce in time");
    }
    return RecordingResult::success();
}

RecordingResult RecordingCoordinator::setListeningMode(bool enabled) {
    RecordingState from;
    RecordingState to;
    {
        Lock lock(mutex_, std::defer_lock);
        if (!acquire(lock, "setListeningMode")) {
            return RecordingResult::failure(core::ErrorCode::LIFECYCLE_LOCK_FAILURE,
                                            "state lock timeout");
        }
        if (busy_ || state_ == RecordingState::Recording ||
            state_ == RecordingState::Processing) {
            if (enabled) {
                return RecordingResult::failure(core::ErrorCode::LIFECYCLE_INVALID_TRANSITION,
                                                "cannot enable listening while recording");
            }
            // Disabling is always honoured; the session then ends in Idle
            listeningMode_ = false;
            return RecordingResult::success();
        }
        listeningMode_ = enabled;
        from = state_;
        to = restingState();
        state_ = to;
    }
    if (from != to) {
        LOG_INFO("RecordingCoordinator: listening mode {}", enabled ? "on" : "off");
        events_.publish(StateChanged{from, to});
    }
    return RecordingResult::success();
}

RecordingResult RecordingCoordinator::handleBufferFull() {
    return stop(StopReason::BufferFull);
}

RecordingResult RecordingCoordinator::handleDeviceLost(const std::string& reason) {
    {
        Lock lock(mutex_, std::defer_lock);
        if (!acquire(lock, "handleDeviceLost")) {
            return RecordingResult::failure(core::ErrorCode::LIFECYCLE_LOCK_FAILURE,
                                            "state lock timeout");
        }
        if (busy_ || state_ != RecordingState::Recording) {
            return RecordingResult::failure(core::ErrorCode::LIFECYCLE_INVALID_TRANSITION,
                                            "device loss outside of an active recording");
        }
        busy_ = true;
    }

    LOG_WARN("RecordingCoordinator: capture device lost: {}", reason);
    bool quiescent = source_.stop(stopTimeout_);
    markSourceQuiescent(quiescent);

    const int attempts = config_.recording.reconnectAttempts;
    const std::chrono::milliseconds delay(config_.recording.reconnectDelayMs);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::this_thread::sleep_for(delay);
        auto started = startSource();
        if (started.ok()) {
            LOG_INFO("RecordingCoordinator: reconnected on attempt {}/{}", attempt, attempts);
            markSourceQuiescent(true);
            release();
            return RecordingResult::success();
        }
        LOG_WARN("RecordingCoordinator: reconnect attempt {}/{} failed: {}", attempt, attempts,
                 started.message);
    }

    std::shared_ptr<CompletedRecording> recording;
    try {
        recording = collectRecording(StopReason::DeviceDisconnected, quiescent);
    } catch (const std::exception& e) {
        LOG_ERROR("RecordingCoordinator: finalizing after device loss failed: {}", e.what());
        recording = std::make_shared<CompletedRecording>();
        recording->metadata.sampleRate = pipeline_.targetSampleRate();
        recording->metadata.stopReason = StopReason::DeviceDisconnected;
    }
    const RecordingMetadata metadata = recording->metadata;
    LOG_ERROR("RecordingCoordinator: device did not come back, kept {:.2f} s of audio",
              metadata.durationSeconds);

    deliverToSinks(*recording);
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        lastRecording_ = recording;
    }
    commit(RecordingState::Recording, RecordingState::Idle);

    std::string message = "capture device disconnected: " + reason;
    publishEvent(LifecycleEventType::Error, metadata,
                 core::ErrorCode::CAPTURE_DEVICE_DISCONNECTED, message);

    RecordingResult result =
        RecordingResult::failure(core::ErrorCode::CAPTURE_DEVICE_DISCONNECTED, message);
    result.metadata = metadata;
    return result;
}

}  // namespace voxcap::recording
