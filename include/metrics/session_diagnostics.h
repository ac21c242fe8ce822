#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace voxcap::metrics {

enum class PipelineStage : std::size_t {
    Mix = 0,
    Preprocess,
    Resample,
    Denoise,
    Agc,
    Buffer,
    Count
};

const char* pipelineStageToString(PipelineStage stage);

struct DiagnosticsSnapshot {
    float inputPeak = 0.0f;
    float inputRms = 0.0f;
    float outputPeak = 0.0f;
    float outputRms = 0.0f;
    uint64_t inputSamples = 0;   // mono samples at the device rate
    uint64_t outputSamples = 0;  // samples at the target rate
    uint64_t clipCount = 0;
    float appliedGainDb = 0.0f;
    uint64_t stageErrors = 0;
    uint64_t droppedSamples = 0;
    uint64_t callbacks = 0;
    uint32_t outputSampleRate = 0;
    std::array<uint64_t, static_cast<std::size_t>(PipelineStage::Count)> stageNanos{};
};

enum class QualityWarning {
    TooQuiet,  // output RMS below -30 dBFS over at least half a second
    Clipping,  // output samples at or above 0.99
};

const char* qualityWarningToString(QualityWarning warning);

double linearToDbfs(double value);

/**
 * @brief Per-session level/timing counters.
 *
 * Written only by the audio callback (single writer), read at any time by the control
 * path through snapshot(). reset() only while capture is stopped.
 */
class SessionDiagnostics {
   public:
    void reset();

    void recordInput(const float* data, std::size_t count);
    void recordOutput(const float* data, std::size_t count);
    void recordStageTime(PipelineStage stage, uint64_t nanos);
    void recordStageError();
    void recordCallback();
    void setAppliedGainDb(float gainDb);
    void setDroppedSamples(uint64_t dropped);
    void setOutputSampleRate(uint32_t rate);

    uint64_t stageErrors() const {
        return stageErrors_.load(std::memory_order_relaxed);
    }

    DiagnosticsSnapshot snapshot() const;

   private:
    std::atomic<float> inputPeak_{0.0f};
    std::atomic<float> outputPeak_{0.0f};
    std::atomic<double> inputSumSquares_{0.0};
    std::atomic<double> outputSumSquares_{0.0};
    std::atomic<uint64_t> inputSamples_{0};
    std::atomic<uint64_t> outputSamples_{0};
    std::atomic<uint64_t> clipCount_{0};
    std::atomic<float> appliedGainDb_{0.0f};
    std::atomic<uint64_t> stageErrors_{0};
    std::atomic<uint64_t> droppedSamples_{0};
    std::atomic<uint64_t> callbacks_{0};
    std::atomic<uint32_t> outputSampleRate_{0};
    std::array<std::atomic<uint64_t>, static_cast<std::size_t>(PipelineStage::Count)>
        stageNanos_{};
};

std::vector<QualityWarning> qualityWarnings(const DiagnosticsSnapshot& snapshot);

nlohmann::json toJson(const DiagnosticsSnapshot& snapshot);

}  // namespace voxcap::metrics
