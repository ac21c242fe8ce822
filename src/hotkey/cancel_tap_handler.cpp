#include "hotkey/cancel_tap_handler.h"

#include "logging/logger.h"

namespace voxcap::hotkey {

CancelTapHandler::CancelTapHandler(std::chrono::milliseconds window) : detector_(window) {}

bool CancelTapHandler::onPress(recording::RecordingState state,
                               DoubleTapDetector::Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state != recording::RecordingState::Recording) {
        detector_.reset();
        return false;
    }
    if (detector_.onPress(now)) {
        LOG_DEBUG("CancelTapHandler: double tap within {} ms", detector_.window().count());
        return true;
    }
    return false;
}

void CancelTapHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    detector_.reset();
}

}  // namespace voxcap::hotkey
