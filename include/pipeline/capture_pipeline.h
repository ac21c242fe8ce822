#pragma once

#include "audio/automatic_gain_control.h"
#include "audio/capture_buffer.h"
#include "audio/channel_mixer.h"
#include "audio/preprocessing.h"
#include "audio/sinc_resampler.h"
#include "core/config_loader.h"
#include "denoiser/noise_suppressor.h"
#include "metrics/session_diagnostics.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxcap::pipeline {

/**
 * @brief Callback-side processing chain: mix -> preprocess -> resample -> denoise -> AGC
 *        -> capture buffer.
 *
 * onAudio() runs on the capture thread and never throws: a failing stage is counted and
 * degraded (pass-through, or silence for the resampler). Everything else is control-path
 * API and must only be called while the capture source is stopped.
 */
class CapturePipeline {
   public:
    using BufferFullHandler = std::function<void()>;

    CapturePipeline(const core::AppConfig& config, denoiser::InferenceStages stages);

    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    // Configures rate-dependent stages for the device rate and clears all session state
    void prepare(uint32_t nativeRate);

    // Clears all per-stage state, the buffer and diagnostics (keeps the configured rate)
    void resetAll();

    void onAudio(const float* samples, std::size_t sampleCount, std::size_t channelCount,
                 uint32_t nativeRate) noexcept;

    // Pushes the resampler and denoiser tails through AGC into the buffer
    std::size_t flush();

    std::vector<float> drain();
    void clearBuffer();

    // Fired once per session, from the capture thread, when the buffer runs out of space.
    // Replacing the handler waits for an in-flight call, so once this returns the old
    // handler is never entered again.
    void setBufferFullHandler(BufferFullHandler handler);

    const audio::CaptureBuffer& buffer() const {
        return buffer_;
    }
    const metrics::SessionDiagnostics& diagnostics() const {
        return diagnostics_;
    }
    uint32_t targetSampleRate() const {
        return targetRate_;
    }
    uint32_t nativeSampleRate() const {
        return nativeRate_.load(std::memory_order_acquire);
    }
    const std::string& denoiserBackendName() const {
        return backendName_;
    }

    // Stage access for tests / diagnostics
    const audio::AutomaticGainControl& agc() const {
        return agc_;
    }
    const denoiser::NoiseSuppressor& denoiser() const {
        return *denoiser_;
    }
    const audio::SincResampler& resampler() const {
        return resampler_;
    }

   private:
    void configureRate(uint32_t nativeRate);
    void resetStages();
    void appendToBuffer(const float* data, std::size_t count);
    std::size_t runTargetRateStages(std::vector<float>& resampled, bool flushDenoiser);

    core::AppConfig config_;
    uint32_t targetRate_;
    std::atomic<uint32_t> nativeRate_{0};
    std::string backendName_;

    audio::ChannelMixer mixer_;
    audio::PreprocessingChain preprocessing_;
    audio::SincResampler resampler_;
    std::unique_ptr<denoiser::NoiseSuppressor> denoiser_;
    audio::AutomaticGainControl agc_;
    audio::CaptureBuffer buffer_;
    metrics::SessionDiagnostics diagnostics_;

    std::mutex bufferFullMutex_;  // guards the handler and every call to it
    BufferFullHandler bufferFullHandler_;
    std::atomic<bool> bufferFullNotified_{false};

    // Callback scratch, reserved in prepare()
    std::vector<float> mono_;
    std::vector<float> preprocessed_;
    std::vector<float> resampled_;
    std::vector<float> denoised_;
};

}  // namespace voxcap::pipeline
