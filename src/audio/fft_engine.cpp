#include "audio/fft_engine.h"

#include <kiss_fftr.h>
#include <stdexcept>

namespace voxcap::audio {

namespace {

// std::complex<float> is laid out as float[2], the same as kiss_fft_cpx
kiss_fft_cpx* asKiss(std::complex<float>* bins) {
    return reinterpret_cast<kiss_fft_cpx*>(bins);
}

const kiss_fft_cpx* asKiss(const std::complex<float>* bins) {
    return reinterpret_cast<const kiss_fft_cpx*>(bins);
}

}  // namespace

void FftEngine::PlanDeleter::operator()(kiss_fftr_state* plan) const {
    kiss_fftr_free(plan);
}

FftEngine::FftEngine(size_t size) : size_(size) {
    if (!isPowerOfTwo(size) || size < 2) {
        throw std::invalid_argument("FftEngine: size must be a power of two >= 2");
    }
    const int n = static_cast<int>(size);
    forwardPlan_.reset(kiss_fftr_alloc(n, 0, nullptr, nullptr));
    inversePlan_.reset(kiss_fftr_alloc(n, 1, nullptr, nullptr));
    if (!forwardPlan_ || !inversePlan_) {
        throw std::runtime_error("FftEngine: kiss_fftr_alloc failed");
    }
    timeScratch_.assign(size, 0.0f);
}

FftEngine::~FftEngine() = default;

bool FftEngine::isPowerOfTwo(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

void FftEngine::forwardReal(const float* input, std::vector<std::complex<float>>& bins) {
    bins.resize(binCount());
    kiss_fftr(forwardPlan_.get(), input, asKiss(bins.data()));
}

void FftEngine::inverseReal(const std::vector<std::complex<float>>& bins, float* output) {
    if (bins.size() != binCount()) {
        throw std::invalid_argument("FftEngine: expected N/2+1 bins");
    }
    // kiss_fftri leaves the result scaled by N
    kiss_fftri(inversePlan_.get(), asKiss(bins.data()), timeScratch_.data());
    const float invN = 1.0f / static_cast<float>(size_);
    for (size_t i = 0; i < size_; ++i) {
        output[i] = timeScratch_[i] * invN;
    }
}

}  // namespace voxcap::audio
