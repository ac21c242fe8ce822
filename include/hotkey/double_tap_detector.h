#pragma once

#include "core/pipeline_constants.h"

#include <chrono>
#include <optional>

namespace voxcap::hotkey {

/**
 * Detects two presses within a time window. A detected double tap resets the detector,
 * so a third press inside the same window starts a new sequence instead of firing again.
 */
class DoubleTapDetector {
   public:
    using Clock = std::chrono::steady_clock;

    explicit DoubleTapDetector(
        std::chrono::milliseconds window =
            std::chrono::milliseconds(PipelineConstants::DEFAULT_DOUBLE_TAP_WINDOW_MS))
        : window_(window) {}

    // true when this press completes a double tap
    bool onPress(Clock::time_point now) {
        if (lastPress_ && now >= *lastPress_ && now - *lastPress_ <= window_) {
            lastPress_.reset();
            return true;
        }
        lastPress_ = now;
        return false;
    }

    void reset() {
        lastPress_.reset();
    }

    std::chrono::milliseconds window() const {
        return window_;
    }

   private:
    std::chrono::milliseconds window_;
    std::optional<Clock::time_point> lastPress_;
};

}  // namespace voxcap::hotkey
