#include "metrics/session_diagnostics.h"

#include "core/pipeline_constants.h"

#include <algorithm>
#include <cmath>

namespace voxcap::metrics {

namespace {

constexpr double kPeakDbfsFloor = -200.0;

void updatePeakLevel(std::atomic<float>& peak, float candidate) {
    float absValue = std::fabs(candidate);
    float current = peak.load(std::memory_order_relaxed);
    while (absValue > current &&
           !peak.compare_exchange_weak(current, absValue, std::memory_order_relaxed,
                                       std::memory_order_relaxed)) {}
}

// Single writer: a load/store pair is enough
void addRelaxed(std::atomic<double>& target, double value) {
    target.store(target.load(std::memory_order_relaxed) + value, std::memory_order_relaxed);
}

nlohmann::json makeLevelJson(float linearValue) {
    nlohmann::json level;
    level["linear"] = linearValue;
    level["dbfs"] = linearToDbfs(linearValue);
    return level;
}

}  // namespace

const char* pipelineStageToString(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::Mix:
        return "mix";
    case PipelineStage::Preprocess:
        return "preprocess";
    case PipelineStage::Resample:
        return "resample";
    case PipelineStage::Denoise:
        return "denoise";
    case PipelineStage::Agc:
        return "agc";
    case PipelineStage::Buffer:
        return "buffer";
    default:
        return "unknown";
    }
}

const char* qualityWarningToString(QualityWarning warning) {
    switch (warning) {
    case QualityWarning::TooQuiet:
        return "too_quiet";
    case QualityWarning::Clipping:
        return "clipping";
    default:
        return "unknown";
    }
}

double linearToDbfs(double value) {
    if (value <= 0.0) {
        return kPeakDbfsFloor;
    }
    return 20.0 * std::log10(value);
}

void SessionDiagnostics::reset() {
    inputPeak_.store(0.0f, std::memory_order_relaxed);
    outputPeak_.store(0.0f, std::memory_order_relaxed);
    inputSumSquares_.store(0.0, std::memory_order_relaxed);
    outputSumSquares_.store(0.0, std::memory_order_relaxed);
    inputSamples_.store(0, std::memory_order_relaxed);
    outputSamples_.store(0, std::memory_order_relaxed);
    clipCount_.store(0, std::memory_order_relaxed);
    appliedGainDb_.store(0.0f, std::memory_order_relaxed);
    stageErrors_.store(0, std::memory_order_relaxed);
    droppedSamples_.store(0, std::memory_order_relaxed);
    callbacks_.store(0, std::memory_order_relaxed);
    for (auto& nanos : stageNanos_) {
        nanos.store(0, std::memory_order_relaxed);
    }
}

void SessionDiagnostics::recordInput(const float* data, std::size_t count) {
    float peak = 0.0f;
    double sum = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        peak = std::max(peak, std::fabs(data[i]));
        sum += static_cast<double>(data[i]) * data[i];
    }
    updatePeakLevel(inputPeak_, peak);
    addRelaxed(inputSumSquares_, sum);
    inputSamples_.fetch_add(count, std::memory_order_relaxed);
}

void SessionDiagnostics::recordOutput(const float* data, std::size_t count) {
    float peak = 0.0f;
    double sum = 0.0;
    uint64_t clips = 0;
    for (std::size_t i = 0; i < count; ++i) {
        float magnitude = std::fabs(data[i]);
        peak = std::max(peak, magnitude);
        sum += static_cast<double>(data[i]) * data[i];
        if (magnitude >= PipelineConstants::CLIP_THRESHOLD) {
            ++clips;
        }
    }
    updatePeakLevel(outputPeak_, peak);
    addRelaxed(outputSumSquares_, sum);
    outputSamples_.fetch_add(count, std::memory_order_relaxed);
    if (clips > 0) {
        clipCount_.fetch_add(clips, std::memory_order_relaxed);
    }
}

void SessionDiagnostics::recordStageTime(PipelineStage stage, uint64_t nanos) {
    stageNanos_[static_cast<std::size_t>(stage)].fetch_add(nanos, std::memory_order_relaxed);
}

void SessionDiagnostics::recordStageError() {
    stageErrors_.fetch_add(1, std::memory_order_relaxed);
}

void SessionDiagnostics::recordCallback() {
    callbacks_.fetch_add(1, std::memory_order_relaxed);
}

void SessionDiagnostics::setAppliedGainDb(float gainDb) {
    appliedGainDb_.store(gainDb, std::memory_order_relaxed);
}

void SessionDiagnostics::setDroppedSamples(uint64_t dropped) {
    droppedSamples_.store(dropped, std::memory_order_relaxed);
}

void SessionDiagnostics::setOutputSampleRate(uint32_t rate) {
    outputSampleRate_.store(rate, std::memory_order_relaxed);
}

DiagnosticsSnapshot SessionDiagnostics::snapshot() const {
    DiagnosticsSnapshot s;
    s.inputPeak = inputPeak_.load(std::memory_order_relaxed);
    s.outputPeak = outputPeak_.load(std::memory_order_relaxed);
    s.inputSamples = inputSamples_.load(std::memory_order_relaxed);
    s.outputSamples = outputSamples_.load(std::memory_order_relaxed);
    if (s.inputSamples > 0) {
        s.inputRms = static_cast<float>(std::sqrt(inputSumSquares_.load(std::memory_order_relaxed) /
                                                  static_cast<double>(s.inputSamples)));
    }
    if (s.outputSamples > 0) {
        s.outputRms = static_cast<float>(std::sqrt(
            outputSumSquares_.load(std::memory_order_relaxed) / static_cast<double>(s.outputSamples)));
    }
    s.clipCount = clipCount_.load(std::memory_order_relaxed);
    s.appliedGainDb = appliedGainDb_.load(std::memory_order_relaxed);
    s.stageErrors = stageErrors_.load(std::memory_order_relaxed);
    s.droppedSamples = droppedSamples_.load(std::memory_order_relaxed);
    s.callbacks = callbacks_.load(std::memory_order_relaxed);
    s.outputSampleRate = outputSampleRate_.load(std::memory_order_relaxed);
    for (std::size_t i = 0; i < s.stageNanos.size(); ++i) {
        s.stageNanos[i] = stageNanos_[i].load(std::memory_order_relaxed);
    }
    return s;
}

std::vector<QualityWarning> qualityWarnings(const DiagnosticsSnapshot& snapshot) {
    std::vector<QualityWarning> warnings;
    double seconds = snapshot.outputSampleRate > 0
                         ? static_cast<double>(snapshot.outputSamples) / snapshot.outputSampleRate
                         : 0.0;
    if (seconds >= PipelineConstants::QUIET_MIN_SECONDS &&
        linearToDbfs(snapshot.outputRms) < PipelineConstants::QUIET_THRESHOLD_DBFS) {
        warnings.push_back(QualityWarning::TooQuiet);
    }
    if (snapshot.clipCount > 0) {
        warnings.push_back(QualityWarning::Clipping);
    }
    return warnings;
}

nlohmann::json toJson(const DiagnosticsSnapshot& snapshot) {
    nlohmann::json j;
    j["input"]["peak"] = makeLevelJson(snapshot.inputPeak);
    j["input"]["rms"] = makeLevelJson(snapshot.inputRms);
    j["input"]["samples"] = snapshot.inputSamples;
    j["output"]["peak"] = makeLevelJson(snapshot.outputPeak);
    j["output"]["rms"] = makeLevelJson(snapshot.outputRms);
    j["output"]["samples"] = snapshot.outputSamples;
    j["output"]["sample_rate"] = snapshot.outputSampleRate;
    j["clip_count"] = snapshot.clipCount;
    j["applied_gain_db"] = snapshot.appliedGainDb;
    j["stage_errors"] = snapshot.stageErrors;
    j["dropped_samples"] = snapshot.droppedSamples;
    j["callbacks"] = snapshot.callbacks;

    nlohmann::json timings = nlohmann::json::object();
    for (std::size_t i = 0; i < snapshot.stageNanos.size(); ++i) {
        auto stage = static_cast<PipelineStage>(i);
        timings[pipelineStageToString(stage)] = static_cast<double>(snapshot.stageNanos[i]) / 1e6;
    }
    j["stage_time_ms"] = timings;

    nlohmann::json warnings = nlohmann::json::array();
    for (auto warning : qualityWarnings(snapshot)) {
        warnings.push_back(qualityWarningToString(warning));
    }
    j["warnings"] = warnings;
    return j;
}

}  // namespace voxcap::metrics
