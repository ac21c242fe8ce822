#pragma once

#include "hotkey/double_tap_detector.h"
#include "recording/recording_types.h"

#include <chrono>
#include <mutex>

namespace voxcap::hotkey {

// Maps cancel-key presses to at most one cancel per double tap, only while recording.
class CancelTapHandler {
   public:
    explicit CancelTapHandler(std::chrono::milliseconds window);

    // Returns true when the caller should cancel the current recording
    bool onPress(recording::RecordingState state, DoubleTapDetector::Clock::time_point now);

    void reset();

   private:
    std::mutex mutex_;
    DoubleTapDetector detector_;
};

}  // namespace voxcap::hotkey
