#pragma once

#include "audio/fft_engine.h"
#include "denoiser/inference_backend.h"

#include <atomic>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace voxcap::denoiser {

/**
 * @brief Two-stage frame-buffered neural noise suppressor.
 *
 * Every hop new samples, the last frameSize samples are windowed (sqrt-Hann), transformed,
 * masked by the magnitude stage, rebuilt with the original phase, inverse transformed,
 * refined by the refine stage and overlap-added. Output is aligned with the input
 * (the internal frame latency is trimmed at the start and paid back by flush()).
 *
 * Owned by the audio callback; reset()/flush() only after capture has stopped.
 */
class NoiseSuppressor {
   public:
    NoiseSuppressor(std::unique_ptr<InferenceStage> magnitude,
                    std::unique_ptr<InferenceStage> refine,
                    size_t frameSize = PipelineConstants::DEFAULT_DENOISER_FRAME,
                    size_t hopSize = PipelineConstants::DEFAULT_DENOISER_HOP);

    void setEnabled(bool enabled) {
        enabled_ = enabled;
    }
    bool isEnabled() const {
        return enabled_;
    }

    // Appends denoised samples to out; returns number appended. Disabled: plain copy.
    size_t process(const float* input, size_t count, std::vector<float>& out);

    // Pushes the last partial frame through with zero padding. Afterwards the total
    // output count equals the total input count since the last reset().
    size_t flush(std::vector<float>& out);

    // Clears frame/overlap buffers and both recurrent states.
    void reset();

    size_t frameSize() const {
        return frameSize_;
    }
    size_t hopSize() const {
        return hopSize_;
    }
    size_t latencySamples() const {
        return frameSize_ - hopSize_;
    }
    uint64_t inferenceFailures() const {
        return failures_.load(std::memory_order_relaxed);
    }
    const RecurrentState& magnitudeState() const {
        return magnitudeState_;
    }
    const RecurrentState& refineState() const {
        return refineState_;
    }

   private:
    // Runs one frame on inputFrame_ and emits hopSize_ samples (minus pending skip)
    size_t processHop(std::vector<float>& out, size_t limit);
    bool runStages();

    std::unique_ptr<InferenceStage> magnitude_;
    std::unique_ptr<InferenceStage> refine_;
    size_t frameSize_;
    size_t hopSize_;
    bool enabled_ = true;

    audio::FftEngine fft_;
    std::vector<float> window_;
    std::vector<float> overlapNorm_;  // 1 / sum of squared windows, per hop position

    RecurrentState magnitudeState_;
    RecurrentState refineState_;

    std::vector<float> inputFrame_;    // last frameSize_ input samples
    std::vector<float> overlap_;       // overlap-add accumulator
    std::vector<float> hopBuffer_;     // new samples waiting for a full hop
    size_t skip_ = 0;                  // leading latency samples still to discard
    uint64_t totalIn_ = 0;
    uint64_t totalOut_ = 0;

    // Scratch
    std::vector<float> windowed_;
    std::vector<std::complex<float>> bins_;
    std::vector<float> magnitudes_;
    std::vector<float> mask_;
    std::vector<float> timeFrame_;
    std::vector<float> refined_;

    std::atomic<uint64_t> failures_{0};
};

}  // namespace voxcap::denoiser
