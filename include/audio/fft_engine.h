#ifndef VOXCAP_AUDIO_FFT_ENGINE_H
#define VOXCAP_AUDIO_FFT_ENGINE_H

#include <complex>
#include <cstddef>
#include <memory>
#include <vector>

struct kiss_fftr_state;

namespace voxcap::audio {

/**
 * @brief Real-input FFT on KissFFT with forward and inverse plans built at construction.
 *
 * Transforms never allocate or lock and are safe to call from the audio callback.
 * Not thread-safe per instance.
 */
class FftEngine {
   public:
    // size must be a power of two >= 2 (throws std::invalid_argument otherwise)
    explicit FftEngine(size_t size);
    ~FftEngine();

    FftEngine(const FftEngine&) = delete;
    FftEngine& operator=(const FftEngine&) = delete;

    static bool isPowerOfTwo(size_t n);

    size_t size() const {
        return size_;
    }
    size_t binCount() const {
        return size_ / 2 + 1;
    }

    // Real input of size() samples -> binCount() bins
    void forwardReal(const float* input, std::vector<std::complex<float>>& bins);
    // binCount() bins (Hermitian spectrum) -> size() real samples, 1/N applied
    void inverseReal(const std::vector<std::complex<float>>& bins, float* output);

   private:
    struct PlanDeleter {
        void operator()(kiss_fftr_state* plan) const;
    };
    using Plan = std::unique_ptr<kiss_fftr_state, PlanDeleter>;

    size_t size_;
    Plan forwardPlan_;
    Plan inversePlan_;
    std::vector<float> timeScratch_;
};

}  // namespace voxcap::audio

#endif  // VOXCAP_AUDIO_FFT_ENGINE_H
