#pragma once

#include "core/error_codes.h"
#include "recording/recording_types.h"

#include <chrono>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace voxcap::recording {

enum class LifecycleEventType {
    Started,
    Stopped,
    Cancelled,
    Error,
};

const char* lifecycleEventTypeToString(LifecycleEventType type);

struct LifecycleEvent {
    LifecycleEventType type = LifecycleEventType::Started;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::optional<RecordingMetadata> metadata;  // Stopped, and Error after device loss
    core::ErrorCode errorCode = core::ErrorCode::OK;
    std::string message;
};

nlohmann::json toJson(const LifecycleEvent& event);

struct StateChanged {
    RecordingState from = RecordingState::Idle;
    RecordingState to = RecordingState::Idle;
};

/**
 * Fan-out of lifecycle notifications. Handlers run on the thread that published, after the
 * coordinator released its lock, so a handler may call back into the coordinator.
 */
class EventDispatcher {
   public:
    using LifecycleHandler = std::function<void(const LifecycleEvent&)>;
    using StateHandler = std::function<void(const StateChanged&)>;

    void subscribe(const LifecycleHandler& handler);
    void subscribe(const StateHandler& handler);

    void publish(const LifecycleEvent& event) const;
    void publish(const StateChanged& event) const;

   private:
    template <typename Event, typename Handler>
    void publishImpl(const Event& event, const std::vector<Handler>& handlers) const;

    mutable std::mutex mutex_;
    std::vector<LifecycleHandler> lifecycleHandlers_;
    std::vector<StateHandler> stateHandlers_;
};

inline void EventDispatcher::subscribe(const LifecycleHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    lifecycleHandlers_.push_back(handler);
}

inline void EventDispatcher::subscribe(const StateHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateHandlers_.push_back(handler);
}

inline void EventDispatcher::publish(const LifecycleEvent& event) const {
    publishImpl(event, lifecycleHandlers_);
}

inline void EventDispatcher::publish(const StateChanged& event) const {
    publishImpl(event, stateHandlers_);
}

template <typename Event, typename Handler>
void EventDispatcher::publishImpl(const Event& event, const std::vector<Handler>& handlers) const {
    std::vector<Handler> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = handlers;
    }
    for (const auto& handler : copy) {
        if (handler) {
            handler(event);
        }
    }
}

}  // namespace voxcap::recording
