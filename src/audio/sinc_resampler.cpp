#include "audio/sinc_resampler.h"

#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace voxcap::audio {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kCutoffScale = 0.95;  // keeps the transition band below the new Nyquist

double sinc(double x) {
    if (std::fabs(x) < 1e-12) {
        return 1.0;
    }
    return std::sin(kPi * x) / (kPi * x);
}

double blackman(double u) {
    // u in [-1, 1]
    return 0.42 + 0.5 * std::cos(kPi * u) + 0.08 * std::cos(2.0 * kPi * u);
}

}  // namespace

void SincResampler::configure(uint32_t inputRate, uint32_t outputRate, size_t chunkFrames,
                              int zeroCrossings) {
    if (inputRate == 0 || outputRate == 0) {
        throw std::invalid_argument("SincResampler: sample rates must be non-zero");
    }
    if (chunkFrames == 0) {
        throw std::invalid_argument("SincResampler: chunk size must be non-zero");
    }
    if (zeroCrossings < 1) {
        throw std::invalid_argument("SincResampler: zeroCrossings must be positive");
    }

    inputRate_ = inputRate;
    outputRate_ = outputRate;
    chunkFrames_ = chunkFrames;
    passthrough_ = (inputRate == outputRate);

    uint64_t g = std::gcd(static_cast<uint64_t>(inputRate), static_cast<uint64_t>(outputRate));
    upFactor_ = outputRate / g;
    step_ = inputRate / g;

    if (!passthrough_) {
        double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
        double cutoff = kCutoffScale * std::min(1.0, ratio);
        buildKernelTable(cutoff, zeroCrossings);
    } else {
        halfLength_ = 0;
        table_.clear();
    }
    pending_.clear();
    pending_.reserve(chunkFrames_);
    history_.reserve(3 * halfLength_ + chunkFrames_ + 2);
    reset();

    LOG_DEBUG("SincResampler: {} Hz -> {} Hz (chunk={} halfLength={}{})", inputRate, outputRate,
              chunkFrames_, halfLength_, passthrough_ ? ", passthrough" : "");
}

void SincResampler::buildKernelTable(double cutoff, int zeroCrossings) {
    // Zero crossings of sinc(cutoff * x) fall every 1/cutoff input samples
    halfLength_ = static_cast<size_t>(std::ceil(zeroCrossings / cutoff));
    const size_t os = static_cast<size_t>(PipelineConstants::SINC_TABLE_OVERSAMPLING);
    const size_t entries = halfLength_ * os + 2;
    table_.assign(entries, 0.0f);
    for (size_t i = 0; i < entries; ++i) {
        double x = static_cast<double>(i) / static_cast<double>(os);
        if (x >= static_cast<double>(halfLength_)) {
            table_[i] = 0.0f;
            continue;
        }
        double u = x / static_cast<double>(halfLength_);
        table_[i] = static_cast<float>(cutoff * sinc(cutoff * x) * blackman(u));
    }
}

float SincResampler::kernel(double offset) const {
    double pos = std::fabs(offset) * PipelineConstants::SINC_TABLE_OVERSAMPLING;
    size_t i = static_cast<size_t>(pos);
    if (i + 1 >= table_.size()) {
        return 0.0f;
    }
    float t = static_cast<float>(pos - static_cast<double>(i));
    return table_[i] + (table_[i + 1] - table_[i]) * t;
}

size_t SincResampler::maxOutputPerChunk() const {
    if (passthrough_) {
        return chunkFrames_;
    }
    return static_cast<size_t>(((chunkFrames_ + halfLength_) * upFactor_ + step_ - 1) / step_) +
           1;
}

size_t SincResampler::process(const float* input, size_t count, std::vector<float>& out) {
    if (passthrough_) {
        out.insert(out.end(), input, input + count);
        return count;
    }

    size_t produced = 0;
    size_t offset = 0;
    while (offset < count) {
        size_t take = std::min(count - offset, chunkFrames_ - pending_.size());
        pending_.insert(pending_.end(), input + offset, input + offset + take);
        offset += take;
        if (pending_.size() == chunkFrames_) {
            history_.insert(history_.end(), pending_.begin(), pending_.end());
            received_ += chunkFrames_;
            pending_.clear();
            produced += convertReady(received_, static_cast<int64_t>(received_), out);
        }
    }
    return produced;
}

size_t SincResampler::convertReady(uint64_t centerLimit, int64_t availableEnd,
                                   std::vector<float>& out) {
    const int64_t half = static_cast<int64_t>(halfLength_);

    size_t produced = 0;
    while (true) {
        const uint64_t num = nextOutput_ * step_;
        const uint64_t center = num / upFactor_;
        // Taps span center-half+1 .. center+half
        if (center >= centerLimit || static_cast<int64_t>(center) + half >= availableEnd) {
            break;
        }
        const double position =
            static_cast<double>(center) +
            static_cast<double>(num % upFactor_) / static_cast<double>(upFactor_);

        double acc = 0.0;
        for (int64_t k = static_cast<int64_t>(center) - half + 1;
             k <= static_cast<int64_t>(center) + half; ++k) {
            const float sample = history_[static_cast<size_t>(k - historyStart_)];
            acc += static_cast<double>(sample) * kernel(static_cast<double>(k) - position);
        }
        out.push_back(static_cast<float>(acc));
        ++nextOutput_;
        ++produced;
    }

    // Drop input that no remaining output can reach
    const int64_t firstNeeded =
        static_cast<int64_t>((nextOutput_ * step_) / upFactor_) - half + 1;
    if (firstNeeded > historyStart_) {
        size_t drop = std::min(static_cast<size_t>(firstNeeded - historyStart_), history_.size());
        history_.erase(history_.begin(), history_.begin() + static_cast<long>(drop));
        historyStart_ += static_cast<int64_t>(drop);
    }
    return produced;
}

size_t SincResampler::flush(std::vector<float>& out) {
    size_t produced = 0;
    if (!passthrough_ && (received_ > 0 || !pending_.empty())) {
        history_.insert(history_.end(), pending_.begin(), pending_.end());
        received_ += pending_.size();
        pending_.clear();
        // Zero lookahead so the outputs centred on the last real samples can be formed
        history_.insert(history_.end(), halfLength_ + 1, 0.0f);
        const int64_t paddedEnd = static_cast<int64_t>(received_ + halfLength_ + 1);
        produced = convertReady(received_, paddedEnd, out);
    }
    reset();
    return produced;
}

void SincResampler::reset() {
    pending_.clear();
    // Silence before the first sample feeds the leading taps
    history_.assign(halfLength_, 0.0f);
    historyStart_ = -static_cast<int64_t>(halfLength_);
    received_ = 0;
    nextOutput_ = 0;
}

}  // namespace voxcap::audio
