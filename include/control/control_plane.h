#pragma once

#include "capture/capture_source.h"
#include "hotkey/cancel_tap_handler.h"
#include "pipeline/capture_pipeline.h"
#include "recording/recording_coordinator.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace voxcap::control {

enum class Intent {
    Start,
    Stop,
    Cancel,
    Toggle,          // Start from Idle/Listening, Stop from Recording
    CancelKeyPress,  // one press of the cancel key; two within the window cancel
    BufferFull,      // internal, raised from the capture thread
    DeviceLost,      // internal, raised from the capture thread
};

const char* intentToString(Intent intent);
bool parseIntent(const std::string& str, Intent& out);

/**
 * @brief Serializes trigger-source intents onto one worker thread that drives the
 *        RecordingCoordinator.
 *
 * post() never blocks on a transition, so it is safe from the capture thread and from
 * input handlers. execute() runs an intent synchronously on the caller's thread.
 * The constructor installs the buffer-full and device-error hooks on the pipeline and
 * source; both must outlive the control plane.
 */
class ControlPlane {
   public:
    using Clock = hotkey::DoubleTapDetector::Clock;
    using ResultHandler = std::function<void(Intent, const recording::RecordingResult&)>;

    ControlPlane(recording::RecordingCoordinator& coordinator, capture::CaptureSource& source,
                 pipeline::CapturePipeline& pipeline, std::chrono::milliseconds doubleTapWindow);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();
    bool isRunning() const;

    // Queues an intent; false when the worker is not running
    bool post(Intent intent, std::string detail = {});
    bool post(Intent intent, Clock::time_point pressedAt);

    recording::RecordingResult execute(Intent intent, Clock::time_point pressedAt = Clock::now(),
                                       const std::string& detail = {});

    // Waits until every queued intent has been handled
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    void setResultHandler(ResultHandler handler);

   private:
    struct QueuedIntent {
        Intent intent = Intent::Start;
        Clock::time_point pressedAt;
        std::string detail;
    };

    bool enqueue(QueuedIntent item);
    void workerLoop();

    recording::RecordingCoordinator& coordinator_;
    capture::CaptureSource& source_;
    pipeline::CapturePipeline& pipeline_;
    hotkey::CancelTapHandler cancelTap_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<QueuedIntent> queue_;
    bool running_ = false;
    bool handling_ = false;
    std::thread worker_;

    std::mutex handlerMutex_;
    ResultHandler resultHandler_;
};

}  // namespace voxcap::control
