#include "control/control_plane.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <exception>

namespace voxcap::control {

const char* intentToString(Intent intent) {
    switch (intent) {
    case Intent::Start:
        return "start";
    case Intent::Stop:
        return "stop";
    case Intent::Cancel:
        return "cancel";
    case Intent::Toggle:
        return "toggle";
    case Intent::CancelKeyPress:
        return "cancel_key_press";
    case Intent::BufferFull:
        return "buffer_full";
    case Intent::DeviceLost:
        return "device_lost";
    default:
        return "unknown";
    }
}

bool parseIntent(const std::string& str, Intent& out) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "start") {
        out = Intent::Start;
    } else if (lower == "stop") {
        out = Intent::Stop;
    } else if (lower == "cancel") {
        out = Intent::Cancel;
    } else if (lower == "toggle") {
        out = Intent::Toggle;
    } else if (lower == "tap" || lower == "cancel_key_press") {
        out = Intent::CancelKeyPress;
    } else {
        return false;
    }
    return true;
}

ControlPlane::ControlPlane(recording::RecordingCoordinator& coordinator,
                           capture::CaptureSource& source, pipeline::CapturePipeline& pipeline,
                           std::chrono::milliseconds doubleTapWindow)
    : coordinator_(coordinator), source_(source), pipeline_(pipeline), cancelTap_(doubleTapWindow) {
    pipeline_.setBufferFullHandler([this]() { post(Intent::BufferFull); });
    source_.setErrorHandler([this](core::ErrorCode code, const std::string& message) {
        if (code == core::ErrorCode::CAPTURE_DEVICE_DISCONNECTED) {
            post(Intent::DeviceLost, message);
        } else {
            LOG_ERROR("ControlPlane: capture error {} ({}): {}", core::errorCodeToString(code),
                      core::errorCodeToHex(code), message);
        }
    });
}

ControlPlane::~ControlPlane() {
    // Detaching blocks until a running hook returns, so none can reach this object later
    pipeline_.setBufferFullHandler(nullptr);
    source_.setErrorHandler(nullptr);
    stop();
}

bool ControlPlane::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return true;
    }
    running_ = true;
    worker_ = std::thread(&ControlPlane::workerLoop, this);
    LOG_DEBUG("ControlPlane: worker started");
    return true;
}

void ControlPlane::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            LOG_INFO("ControlPlane: dropping {} pending intent(s) on shutdown", queue_.size());
            queue_.clear();
        }
    }
    idleCv_.notify_all();
    LOG_DEBUG("ControlPlane: worker stopped");
}

bool ControlPlane::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool ControlPlane::post(Intent intent, std::string detail) {
    return enqueue(QueuedIntent{intent, Clock::now(), std::move(detail)});
}

bool ControlPlane::post(Intent intent, Clock::time_point pressedAt) {
    return enqueue(QueuedIntent{intent, pressedAt, {}});
}

bool ControlPlane::enqueue(QueuedIntent item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
}

bool ControlPlane::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !handling_; });
}

void ControlPlane::setResultHandler(ResultHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    resultHandler_ = std::move(handler);
}

recording::RecordingResult ControlPlane::execute(Intent intent, Clock::time_point pressedAt,
                                                 const std::string& detail) {
    using recording::RecordingResult;
    using recording::RecordingState;

    switch (intent) {
    case Intent::Start:
        cancelTap_.reset();
        return coordinator_.start();
    case Intent::Stop:
        return coordinator_.stop(recording::StopReason::User);
    case Intent::Cancel:
        return coordinator_.cancel();
    case Intent::Toggle:
        if (coordinator_.state() == RecordingState::Recording) {
            return coordinator_.stop(recording::StopReason::User);
        }
        cancelTap_.reset();
        return coordinator_.start();
    case Intent::CancelKeyPress:
        if (cancelTap_.onPress(coordinator_.state(), pressedAt)) {
            return coordinator_.cancel();
        }
        return RecordingResult::success();
    case Intent::BufferFull:
        return coordinator_.handleBufferFull();
    case Intent::DeviceLost:
        return coordinator_.handleDeviceLost(detail.empty() ? "device error" : detail);
    default:
        return RecordingResult::failure(core::ErrorCode::INTERNAL_UNKNOWN, "unknown intent");
    }
}

void ControlPlane::workerLoop() {
    for (;;) {
        QueuedIntent item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (!running_) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            handling_ = true;
        }

        recording::RecordingResult result;
        try {
            result = execute(item.intent, item.pressedAt, item.detail);
        } catch (const std::exception& e) {
            LOG_ERROR("ControlPlane: intent '{}' failed: {}", intentToString(item.intent),
                      e.what());
            result = recording::RecordingResult::failure(core::ErrorCode::INTERNAL_UNKNOWN,
                                                         e.what());
        }
        if (!result.ok()) {
            LOG_DEBUG("ControlPlane: intent '{}' -> {} ({})", intentToString(item.intent),
                      core::errorCodeToString(result.code), result.message);
        }

        ResultHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex_);
            handler = resultHandler_;
        }
        if (handler) {
            handler(item.intent, result);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            handling_ = false;
        }
        idleCv_.notify_all();
    }
}

}  // namespace voxcap::control
