#ifndef VOXCAP_AUDIO_AUTOMATIC_GAIN_CONTROL_H
#define VOXCAP_AUDIO_AUTOMATIC_GAIN_CONTROL_H

#include "core/config_loader.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace voxcap::audio {

inline float dbToLinear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

inline float linearToDb(float linear) {
    return 20.0f * std::log10(std::max(linear, 1e-10f));
}

/**
 * @brief Envelope-driven gain normalization with a tanh soft limiter.
 *
 * Per sample:
 *   envelope <- c * envelope + (1 - c) * x^2   (c = attack when x^2 rises above the envelope)
 *   target    = clamp(targetLevel / sqrt(envelope), 1, maxGain)   (held below the noise floor)
 *   gain     <- c' * gain + (1 - c') * target  (c' = attack when the target is below the gain)
 *   y         = softLimit(x * gain)
 *
 * The limiter is linear up to a knee at 75% of the ceiling and compresses toward the
 * ceiling above it, so |y| < ceiling for any input. Disabled: output == input bit for bit.
 */
class AutomaticGainControl {
   public:
    explicit AutomaticGainControl(const core::AppConfig::AgcConfig& config = {},
                                  uint32_t sampleRate = PipelineConstants::TARGET_SAMPLE_RATE);

    void setSampleRate(uint32_t sampleRate);
    void setEnabled(bool enabled) {
        enabled_ = enabled;
    }
    bool isEnabled() const {
        return enabled_;
    }

    void process(float* data, size_t count);
    void reset();

    float currentGain() const {
        return gain_;
    }
    float currentGainDb() const {
        return linearToDb(gain_);
    }
    float envelopeRms() const;
    float ceiling() const {
        return ceiling_;
    }

    // Exposed for tests; applies the limiter curve to one sample
    float softLimit(float x) const;

   private:
    core::AppConfig::AgcConfig config_;
    bool enabled_;
    float targetLevel_;
    float maxGain_;
    float ceiling_;
    float knee_;
    float attackCoeff_ = 0.0f;
    float releaseCoeff_ = 0.0f;

    float gain_ = 1.0f;
    float envelope_ = 0.0f;
};

}  // namespace voxcap::audio

#endif  // VOXCAP_AUDIO_AUTOMATIC_GAIN_CONTROL_H
