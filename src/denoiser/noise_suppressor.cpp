#include "denoiser/noise_suppressor.h"

#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace voxcap::denoiser {

namespace {

constexpr double kPi = 3.14159265358979323846;

bool allZero(const std::vector<float>& data) {
    return std::all_of(data.begin(), data.end(), [](float v) { return v == 0.0f; });
}

}  // namespace

NoiseSuppressor::NoiseSuppressor(std::unique_ptr<InferenceStage> magnitude,
                                 std::unique_ptr<InferenceStage> refine, size_t frameSize,
                                 size_t hopSize)
    : magnitude_(std::move(magnitude)),
      refine_(std::move(refine)),
      frameSize_(frameSize),
      hopSize_(hopSize),
      fft_(frameSize) {
    if (!magnitude_ || !refine_) {
        throw std::invalid_argument("NoiseSuppressor: both inference stages are required");
    }
    if (hopSize_ == 0 || hopSize_ * 2 > frameSize_ || frameSize_ % hopSize_ != 0) {
        throw std::invalid_argument("NoiseSuppressor: hop must divide frame and be <= frame/2");
    }

    // sqrt-Hann (periodic) for both analysis and synthesis
    window_.resize(frameSize_);
    for (size_t i = 0; i < frameSize_; ++i) {
        double hann = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) /
                                           static_cast<double>(frameSize_));
        window_[i] = static_cast<float>(std::sqrt(hann));
    }
    overlapNorm_.assign(hopSize_, 0.0f);
    for (size_t n = 0; n < hopSize_; ++n) {
        double sum = 0.0;
        for (size_t j = n; j < frameSize_; j += hopSize_) {
            sum += static_cast<double>(window_[j]) * window_[j];
        }
        overlapNorm_[n] = static_cast<float>(1.0 / sum);
    }

    magnitudeState_ = magnitude_->initialState();
    refineState_ = refine_->initialState();

    const size_t bins = fft_.binCount();
    inputFrame_.assign(frameSize_, 0.0f);
    overlap_.assign(frameSize_, 0.0f);
    hopBuffer_.reserve(hopSize_);
    windowed_.assign(frameSize_, 0.0f);
    bins_.assign(bins, std::complex<float>(0.0f, 0.0f));
    magnitudes_.assign(bins, 0.0f);
    mask_.assign(bins, 1.0f);
    timeFrame_.assign(frameSize_, 0.0f);
    refined_.assign(frameSize_, 0.0f);
    skip_ = latencySamples();

    LOG_DEBUG("NoiseSuppressor: frame={} hop={} stages={}/{}", frameSize_, hopSize_,
              magnitude_->name(), refine_->name());
}

size_t NoiseSuppressor::process(const float* input, size_t count, std::vector<float>& out) {
    if (!enabled_) {
        out.insert(out.end(), input, input + count);
        return count;
    }

    totalIn_ += count;
    size_t produced = 0;
    for (size_t i = 0; i < count; ++i) {
        hopBuffer_.push_back(input[i]);
        if (hopBuffer_.size() == hopSize_) {
            produced += processHop(out, std::numeric_limits<size_t>::max());
            hopBuffer_.clear();
        }
    }
    return produced;
}

size_t NoiseSuppressor::processHop(std::vector<float>& out, size_t limit) {
    std::copy(inputFrame_.begin() + static_cast<long>(hopSize_), inputFrame_.end(),
              inputFrame_.begin());
    std::copy(hopBuffer_.begin(), hopBuffer_.end(),
              inputFrame_.end() - static_cast<long>(hopSize_));

    if (allZero(inputFrame_)) {
        // Silence stays silence and does not advance the recurrent state
        std::fill(refined_.begin(), refined_.end(), 0.0f);
    } else if (!runStages()) {
        // Degrade to the unmasked frame
        for (size_t i = 0; i < frameSize_; ++i) {
            refined_[i] = inputFrame_[i] * window_[i];
        }
    }

    for (size_t i = 0; i < frameSize_; ++i) {
        overlap_[i] += refined_[i] * window_[i];
    }

    size_t emitted = 0;
    for (size_t i = 0; i < hopSize_; ++i) {
        if (skip_ > 0) {
            --skip_;
            continue;
        }
        if (emitted >= limit) {
            break;
        }
        out.push_back(overlap_[i] * overlapNorm_[i]);
        ++emitted;
    }
    totalOut_ += emitted;

    std::copy(overlap_.begin() + static_cast<long>(hopSize_), overlap_.end(), overlap_.begin());
    std::fill(overlap_.end() - static_cast<long>(hopSize_), overlap_.end(), 0.0f);
    return emitted;
}

bool NoiseSuppressor::runStages() {
    try {
        for (size_t i = 0; i < frameSize_; ++i) {
            windowed_[i] = inputFrame_[i] * window_[i];
        }
        fft_.forwardReal(windowed_.data(), bins_);
        for (size_t k = 0; k < bins_.size(); ++k) {
            magnitudes_[k] = std::abs(bins_[k]);
        }

        InferenceResult result = magnitude_->infer(magnitudes_, magnitudeState_, mask_);
        if (!result.ok() || mask_.size() != bins_.size()) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            LOG_EVERY_N(WARN, 500, "NoiseSuppressor: magnitude stage failed ({}): {}",
                        inferenceStatusToString(result.status), result.message);
            return false;
        }

        // Scaling a bin by a real mask keeps its phase
        for (size_t k = 0; k < bins_.size(); ++k) {
            bins_[k] *= mask_[k];
        }
        fft_.inverseReal(bins_, timeFrame_.data());

        result = refine_->infer(timeFrame_, refineState_, refined_);
        if (!result.ok() || refined_.size() != frameSize_) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            LOG_EVERY_N(WARN, 500, "NoiseSuppressor: refine stage failed ({}): {}",
                        inferenceStatusToString(result.status), result.message);
            refined_.resize(frameSize_);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        refined_.resize(frameSize_);
        LOG_EVERY_N(WARN, 500, "NoiseSuppressor: inference threw: {}", e.what());
        return false;
    }
}

size_t NoiseSuppressor::flush(std::vector<float>& out) {
    if (!enabled_) {
        return 0;
    }

    const uint64_t owed = totalIn_ - totalOut_;
    size_t produced = 0;
    while (produced < owed) {
        hopBuffer_.resize(hopSize_, 0.0f);
        produced += processHop(out, static_cast<size_t>(owed) - produced);
        hopBuffer_.clear();
    }
    reset();
    return produced;
}

void NoiseSuppressor::reset() {
    std::fill(inputFrame_.begin(), inputFrame_.end(), 0.0f);
    std::fill(overlap_.begin(), overlap_.end(), 0.0f);
    hopBuffer_.clear();
    magnitudeState_.zero();
    refineState_.zero();
    skip_ = latencySamples();
    totalIn_ = 0;
    totalOut_ = 0;
}

}  // namespace voxcap::denoiser
