#ifndef VOXCAP_AUDIO_PREPROCESSING_H
#define VOXCAP_AUDIO_PREPROCESSING_H

#include "core/config_loader.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxcap::audio {

// Normalized biquad coefficients (a0 == 1)
struct BiquadCoeffs {
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;
};

/**
 * @brief RBJ cookbook highpass coefficients.
 *
 * @param cutoffHz Corner frequency (prewarped by the bilinear transform)
 * @param q Section quality factor (0.7071 for a single 2nd-order Butterworth)
 */
BiquadCoeffs highpassCoeffs(double cutoffHz, double q, double sampleRate);

/**
 * @brief Quality factors of the 2nd-order sections forming an even-order Butterworth filter.
 */
std::vector<double> butterworthSectionQs(int order);

/**
 * @brief Magnitude response of a coefficient set at one frequency (linear).
 */
double biquadMagnitude(const BiquadCoeffs& c, double frequencyHz, double sampleRate);

// Direct Form II transposed section with double-precision state
class BiquadSection {
   public:
    void setCoeffs(const BiquadCoeffs& coeffs) {
        coeffs_ = coeffs;
    }
    const BiquadCoeffs& coeffs() const {
        return coeffs_;
    }

    double process(double x) {
        double y = coeffs_.b0 * x + z1_;
        z1_ = coeffs_.b1 * x - coeffs_.a1 * y + z2_;
        z2_ = coeffs_.b2 * x - coeffs_.a2 * y;
        return y;
    }

    void reset() {
        z1_ = 0.0;
        z2_ = 0.0;
    }

   private:
    BiquadCoeffs coeffs_;
    double z1_ = 0.0;
    double z2_ = 0.0;
};

/**
 * @brief Butterworth highpass built from cascaded biquad sections.
 *
 * Runs at the capture device's native rate. State persists across process() calls.
 */
class HighpassFilter {
   public:
    void configure(double sampleRate, double cutoffHz, int order);
    void process(float* data, size_t count);
    void reset();

    // Overall magnitude response of the cascade (linear)
    double magnitudeAt(double frequencyHz) const;

    size_t sectionCount() const {
        return sections_.size();
    }

   private:
    std::vector<BiquadSection> sections_;
    double sampleRate_ = 0.0;
};

/**
 * @brief First-order pre-emphasis y[n] = x[n] - alpha * x[n-1].
 */
class PreEmphasisFilter {
   public:
    explicit PreEmphasisFilter(float alpha = PipelineConstants::DEFAULT_PRE_EMPHASIS_ALPHA)
        : alpha_(alpha) {}

    void setAlpha(float alpha) {
        alpha_ = alpha;
    }
    float alpha() const {
        return alpha_;
    }

    void process(float* data, size_t count);
    void reset() {
        previous_ = 0.0f;
    }

   private:
    float alpha_;
    float previous_ = 0.0f;
};

/**
 * @brief Highpass then pre-emphasis, in place, with per-stage bypass.
 *
 * Bypassed stages do not touch the samples at all.
 */
class PreprocessingChain {
   public:
    explicit PreprocessingChain(const core::AppConfig::PreprocessingConfig& config = {});

    // Recomputes coefficients for the device rate and clears state.
    void configure(uint32_t sampleRate);
    void process(float* data, size_t count);
    void reset();

    bool highpassEnabled() const {
        return config_.highpassEnabled;
    }
    bool preEmphasisEnabled() const {
        return config_.preEmphasisEnabled;
    }
    uint32_t sampleRate() const {
        return sampleRate_;
    }
    const HighpassFilter& highpass() const {
        return highpass_;
    }

   private:
    core::AppConfig::PreprocessingConfig config_;
    HighpassFilter highpass_;
    PreEmphasisFilter preEmphasis_;
    uint32_t sampleRate_ = 0;
};

}  // namespace voxcap::audio

#endif  // VOXCAP_AUDIO_PREPROCESSING_H
