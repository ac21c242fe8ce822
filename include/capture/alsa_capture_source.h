#pragma once

#include "capture/capture_source.h"

#include <alsa/asoundlib.h>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxcap::capture {

// Converts interleaved PCM to float in [-1, 1). Returns false for unsupported formats.
bool convertPcmToFloat(const void* src, snd_pcm_format_t format, size_t frames,
                       unsigned int channels, std::vector<float>& dst);

/**
 * @brief ALSA capture device driven by a dedicated read thread.
 *
 * The handle is opened synchronously in start() so open failures reach the caller.
 * FLOAT_LE is preferred; S32_LE and S16_LE are converted. The device's native rate and
 * channel count are accepted as negotiated and reported with every callback.
 */
class AlsaCaptureSource : public CaptureSource {
   public:
    AlsaCaptureSource() = default;
    ~AlsaCaptureSource() override;

    AlsaCaptureSource(const AlsaCaptureSource&) = delete;
    AlsaCaptureSource& operator=(const AlsaCaptureSource&) = delete;

    const char* name() const override {
        return "alsa";
    }

    CaptureStartResult start(const CaptureRequest& request, CaptureCallback callback) override;
    bool stop(std::chrono::milliseconds timeout) override;
    bool isRunning() const override;
    void setErrorHandler(CaptureErrorHandler handler) override;

   private:
    void captureLoop(snd_pcm_t* handle, snd_pcm_format_t format, unsigned int rate,
                     unsigned int channels, snd_pcm_uframes_t periodFrames);
    void reportError(core::ErrorCode code, const std::string& message);
    void joinIfFinished();

    CaptureCallback callback_;

    std::mutex handlerMutex_;
    CaptureErrorHandler errorHandler_;

    std::atomic<bool> running_{false};
    std::mutex threadMutex_;
    std::condition_variable finishedCv_;
    bool finished_ = true;
    std::thread thread_;
};

}  // namespace voxcap::capture
