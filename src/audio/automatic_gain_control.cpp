#include "audio/automatic_gain_control.h"

#include <algorithm>
#include <cmath>

namespace voxcap::audio {

namespace {

float timeConstantCoeff(uint32_t sampleRate, float ms) {
    return std::exp(-1.0f / (static_cast<float>(sampleRate) * ms / 1000.0f));
}

}  // namespace

AutomaticGainControl::AutomaticGainControl(const core::AppConfig::AgcConfig& config,
                                           uint32_t sampleRate)
    : config_(config),
      enabled_(config.enabled),
      targetLevel_(dbToLinear(config.targetLevelDbfs)),
      maxGain_(dbToLinear(config.maxGainDb)),
      ceiling_(dbToLinear(config.limiterCeilingDbfs)),
      knee_(dbToLinear(config.limiterCeilingDbfs) * PipelineConstants::LIMITER_KNEE_RATIO) {
    setSampleRate(sampleRate);
}

void AutomaticGainControl::setSampleRate(uint32_t sampleRate) {
    attackCoeff_ = timeConstantCoeff(sampleRate, config_.attackMs);
    releaseCoeff_ = timeConstantCoeff(sampleRate, config_.releaseMs);
}

float AutomaticGainControl::softLimit(float x) const {
    float magnitude = std::fabs(x);
    if (magnitude <= knee_) {
        return x;
    }
    float range = ceiling_ - knee_;
    float limited = knee_ + range * std::tanh((magnitude - knee_) / range);
    return std::copysign(limited, x);
}

void AutomaticGainControl::process(float* data, size_t count) {
    if (!enabled_) {
        return;
    }

    for (size_t i = 0; i < count; ++i) {
        const float x = data[i];
        const float power = x * x;
        const float envCoeff = power > envelope_ ? attackCoeff_ : releaseCoeff_;
        envelope_ = envCoeff * envelope_ + (1.0f - envCoeff) * power;

        const float rms = std::sqrt(envelope_);
        if (rms > PipelineConstants::AGC_NOISE_FLOOR_RMS) {
            float target = std::clamp(targetLevel_ / rms, 1.0f, maxGain_);
            float gainCoeff = target < gain_ ? attackCoeff_ : releaseCoeff_;
            gain_ = gainCoeff * gain_ + (1.0f - gainCoeff) * target;
        }

        data[i] = softLimit(x * gain_);
    }
}

void AutomaticGainControl::reset() {
    gain_ = 1.0f;
    envelope_ = 0.0f;
}

float AutomaticGainControl::envelopeRms() const {
    return std::sqrt(envelope_);
}

}  // namespace voxcap::audio
