#pragma once

#include "core/config_loader.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace voxcap::denoiser {

enum class InferenceStatus {
    Ok,
    Unsupported,
    InvalidConfig,
    Error,
};

struct InferenceResult {
    InferenceStatus status = InferenceStatus::Error;
    std::string message;

    bool ok() const {
        return status == InferenceStatus::Ok;
    }
};

const char* inferenceStatusToString(InferenceStatus status);

/**
 * @brief Recurrent (LSTM) state carried by one inference stage between frames.
 *
 * Laid out as the model's [1, layers, units, 2] tensor (hidden and cell interleaved
 * on the last axis). Owned by the caller and passed to every infer() call.
 */
struct RecurrentState {
    size_t layers = 2;
    size_t units = 0;
    std::vector<float> values;

    RecurrentState() = default;
    RecurrentState(size_t layerCount, size_t unitCount)
        : layers(layerCount), units(unitCount), values(layerCount * unitCount * 2, 0.0f) {}

    void zero() {
        std::fill(values.begin(), values.end(), 0.0f);
    }

    bool isZero() const {
        for (float v : values) {
            if (v != 0.0f) {
                return false;
            }
        }
        return true;
    }
};

/**
 * @brief One neural stage: infer(input, state) -> output, updating state in place.
 *
 * The magnitude stage maps a magnitude spectrum (frame/2 + 1 bins) to a mask of the same
 * size; the refinement stage maps a time-domain frame to a refined frame of the same size.
 */
class InferenceStage {
   public:
    virtual ~InferenceStage() = default;

    virtual const char* name() const = 0;

    // Fresh state for a new session
    virtual RecurrentState initialState() const = 0;

    // output is resized to the stage's output size
    virtual InferenceResult infer(const std::vector<float>& input, RecurrentState& state,
                                  std::vector<float>& output) = 0;
};

struct InferenceStages {
    std::unique_ptr<InferenceStage> magnitude;
    std::unique_ptr<InferenceStage> refine;
    std::string backendName;
};

// Identity mask (all ones) / identity refinement with empty state.
std::unique_ptr<InferenceStage> createBypassMagnitudeStage();
std::unique_ptr<InferenceStage> createBypassRefineStage();

/**
 * @brief Build both stages for the configured backend.
 *
 * An ORT backend that cannot be initialized (missing model, ORT not compiled in,
 * unavailable provider) is logged and replaced by the bypass stages.
 */
InferenceStages createInferenceStages(const core::AppConfig::DenoiserConfig& config);

}  // namespace voxcap::denoiser
