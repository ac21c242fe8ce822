#include "audio/preprocessing.h"

#include "logging/logger.h"

#include <cmath>
#include <complex>
#include <stdexcept>

namespace voxcap::audio {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

BiquadCoeffs highpassCoeffs(double cutoffHz, double q, double sampleRate) {
    double w0 = 2.0 * kPi * cutoffHz / sampleRate;
    double cosW0 = std::cos(w0);
    double sinW0 = std::sin(w0);
    double alpha = sinW0 / (2.0 * q);

    double a0 = 1.0 + alpha;
    BiquadCoeffs c;
    c.b0 = ((1.0 + cosW0) / 2.0) / a0;
    c.b1 = (-(1.0 + cosW0)) / a0;
    c.b2 = ((1.0 + cosW0) / 2.0) / a0;
    c.a1 = (-2.0 * cosW0) / a0;
    c.a2 = (1.0 - alpha) / a0;
    return c;
}

std::vector<double> butterworthSectionQs(int order) {
    std::vector<double> qs;
    const int sections = order / 2;
    qs.reserve(static_cast<size_t>(sections));
    for (int k = 0; k < sections; ++k) {
        double theta = kPi * static_cast<double>(2 * k + 1) / (2.0 * order);
        qs.push_back(1.0 / (2.0 * std::cos(theta)));
    }
    return qs;
}

double biquadMagnitude(const BiquadCoeffs& c, double frequencyHz, double sampleRate) {
    double w = 2.0 * kPi * frequencyHz / sampleRate;
    std::complex<double> z1 = std::exp(std::complex<double>(0.0, -w));
    std::complex<double> z2 = z1 * z1;
    std::complex<double> num = c.b0 + c.b1 * z1 + c.b2 * z2;
    std::complex<double> den = 1.0 + c.a1 * z1 + c.a2 * z2;
    return std::abs(num / den);
}

// ---------------------------------------------------------------------------
// HighpassFilter
// ---------------------------------------------------------------------------

void HighpassFilter::configure(double sampleRate, double cutoffHz, int order) {
    if (sampleRate <= 0.0) {
        throw std::invalid_argument("HighpassFilter: sample rate must be positive");
    }
    if (order < 2 || order % 2 != 0) {
        throw std::invalid_argument("HighpassFilter: order must be even and >= 2");
    }
    if (cutoffHz <= 0.0 || cutoffHz >= sampleRate / 2.0) {
        throw std::invalid_argument("HighpassFilter: cutoff must lie below Nyquist");
    }

    sampleRate_ = sampleRate;
    sections_.clear();
    for (double q : butterworthSectionQs(order)) {
        BiquadSection section;
        section.setCoeffs(highpassCoeffs(cutoffHz, q, sampleRate));
        sections_.push_back(section);
    }
}

void HighpassFilter::process(float* data, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        double x = data[i];
        for (auto& section : sections_) {
            x = section.process(x);
        }
        data[i] = static_cast<float>(x);
    }
}

void HighpassFilter::reset() {
    for (auto& section : sections_) {
        section.reset();
    }
}

double HighpassFilter::magnitudeAt(double frequencyHz) const {
    double mag = 1.0;
    for (const auto& section : sections_) {
        mag *= biquadMagnitude(section.coeffs(), frequencyHz, sampleRate_);
    }
    return mag;
}

// ---------------------------------------------------------------------------
// PreEmphasisFilter
// ---------------------------------------------------------------------------

void PreEmphasisFilter::process(float* data, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        float x = data[i];
        data[i] = x - alpha_ * previous_;
        previous_ = x;
    }
}

// ---------------------------------------------------------------------------
// PreprocessingChain
// ---------------------------------------------------------------------------

PreprocessingChain::PreprocessingChain(const core::AppConfig::PreprocessingConfig& config)
    : config_(config), preEmphasis_(config.preEmphasisAlpha) {}

void PreprocessingChain::configure(uint32_t sampleRate) {
    sampleRate_ = sampleRate;
    if (config_.highpassEnabled) {
        double cutoff = config_.highpassCutoffHz;
        // Very low device rates cannot host the configured corner
        if (cutoff >= sampleRate * 0.45) {
            LOG_WARN("Preprocessing: highpass cutoff {} Hz too high for {} Hz, clamping", cutoff,
                     sampleRate);
            cutoff = sampleRate * 0.45;
        }
        highpass_.configure(static_cast<double>(sampleRate), cutoff, config_.highpassOrder);
    }
    preEmphasis_.setAlpha(config_.preEmphasisAlpha);
    reset();
    LOG_DEBUG("Preprocessing: configured for {} Hz (highpass={} order={} cutoff={} Hz, "
              "preEmphasis={} alpha={})",
              sampleRate, config_.highpassEnabled, config_.highpassOrder, config_.highpassCutoffHz,
              config_.preEmphasisEnabled, config_.preEmphasisAlpha);
}

void PreprocessingChain::process(float* data, size_t count) {
    if (config_.highpassEnabled) {
        highpass_.process(data, count);
    }
    if (config_.preEmphasisEnabled) {
        preEmphasis_.process(data, count);
    }
}

void PreprocessingChain::reset() {
    highpass_.reset();
    preEmphasis_.reset();
}

}  // namespace voxcap::audio
