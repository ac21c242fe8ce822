#pragma once

#include "core/error_codes.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace voxcap::capture {

// Invoked once per hardware period on the capture thread. Must not block.
// samples: interleaved float PCM, sampleCount = frames * channelCount.
using CaptureCallback = std::function<void(const float* samples, std::size_t sampleCount,
                                           std::size_t channelCount, uint32_t nativeRate)>;

// Invoked from the capture thread when the device fails mid-stream (e.g. unplugged).
using CaptureErrorHandler = std::function<void(core::ErrorCode code, const std::string& message)>;

struct CaptureRequest {
    std::string device = "default";
    uint32_t preferredSampleRate = 48000;
    uint32_t preferredChannels = 2;
    uint32_t periodFrames = 480;
};

struct CaptureStartResult {
    core::ErrorCode code = core::ErrorCode::OK;
    std::string message;
    uint32_t sampleRate = 0;
    uint32_t channels = 0;

    bool ok() const {
        return code == core::ErrorCode::OK;
    }
};

/**
 * @brief Audio input device abstraction.
 *
 * start() returns once the device delivers (or failed to open); stop() blocks until no
 * callback is in flight or the timeout expires.
 */
class CaptureSource {
   public:
    virtual ~CaptureSource() = default;

    virtual const char* name() const = 0;

    virtual CaptureStartResult start(const CaptureRequest& request, CaptureCallback callback) = 0;

    // true when quiescence was confirmed within the timeout
    virtual bool stop(std::chrono::milliseconds timeout) = 0;

    virtual bool isRunning() const = 0;

    // Replacing the handler waits for a call already in progress to return
    virtual void setErrorHandler(CaptureErrorHandler handler) = 0;
};

}  // namespace voxcap::capture
