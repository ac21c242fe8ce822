#ifndef VOXCAP_AUDIO_SINC_RESAMPLER_H
#define VOXCAP_AUDIO_SINC_RESAMPLER_H

#include "core/pipeline_constants.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxcap::audio {

/**
 * @brief Fixed-input-chunk windowed-sinc sample rate converter (mono).
 *
 * Input accumulates until chunkFrames samples are available; each full chunk is converted
 * and the remainder is carried to the next call. Output sample n is centered at
 * n * inRate / outRate input samples (tracked as an exact integer ratio so no phase
 * drift accumulates). An output is emitted once kernelHalfLength() input samples past
 * its center have arrived; flush() zero-pads that lookahead for the session tail.
 *
 * After flush() the total output count equals ceil(totalInput * outRate / inRate).
 */
class SincResampler {
   public:
    SincResampler() = default;

    void configure(uint32_t inputRate, uint32_t outputRate,
                   size_t chunkFrames = PipelineConstants::DEFAULT_RESAMPLER_CHUNK_FRAMES,
                   int zeroCrossings = PipelineConstants::DEFAULT_SINC_ZERO_CROSSINGS);

    // Appends converted samples to out; returns number appended.
    size_t process(const float* input, size_t count, std::vector<float>& out);

    // Zero-pads past the carried remainder, emits the samples owed for real input,
    // then clears all state. Emits at most maxOutputPerChunk() samples.
    size_t flush(std::vector<float>& out);

    void reset();

    bool isPassthrough() const {
        return passthrough_;
    }
    uint32_t inputRate() const {
        return inputRate_;
    }
    uint32_t outputRate() const {
        return outputRate_;
    }
    size_t chunkFrames() const {
        return chunkFrames_;
    }
    size_t pendingInput() const {
        return pending_.size();
    }
    // One chunk of input plus the kernel lookahead
    size_t maxOutputPerChunk() const;
    size_t kernelHalfLength() const {
        return halfLength_;
    }

   private:
    void buildKernelTable(double cutoff, int zeroCrossings);
    float kernel(double offset) const;
    size_t convertReady(uint64_t centerLimit, int64_t availableEnd, std::vector<float>& out);

    uint32_t inputRate_ = 0;
    uint32_t outputRate_ = 0;
    bool passthrough_ = true;
    size_t chunkFrames_ = PipelineConstants::DEFAULT_RESAMPLER_CHUNK_FRAMES;

    // Reduced ratio: output n sits at n * step_ / upFactor_ input samples
    uint64_t upFactor_ = 1;
    uint64_t step_ = 1;

    size_t halfLength_ = 0;
    std::vector<float> table_;  // kernel(i / SINC_TABLE_OVERSAMPLING), i >= 0

    std::vector<float> pending_;  // carried sub-chunk input
    std::vector<float> history_;  // converted input still inside some kernel span
    int64_t historyStart_ = 0;    // input index of history_[0]
    uint64_t received_ = 0;       // input samples moved into history_
    uint64_t nextOutput_ = 0;
};

}  // namespace voxcap::audio

#endif  // VOXCAP_AUDIO_SINC_RESAMPLER_H
