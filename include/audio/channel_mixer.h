#ifndef VOXCAP_AUDIO_CHANNEL_MIXER_H
#define VOXCAP_AUDIO_CHANNEL_MIXER_H

#include "core/config_loader.h"

#include <cstddef>
#include <vector>

namespace voxcap::audio {

/**
 * @brief Stateless interleaved-to-mono downmix.
 *
 * - 1 channel: bit-identical copy
 * - 2 channels: (L + R) * stereoCompensation
 * - >2 channels: MultichannelPolicy (first two channels, or plain average)
 *
 * A trailing partial frame (sampleCount not a multiple of channels) is ignored.
 */
class ChannelMixer {
   public:
    ChannelMixer() = default;
    ChannelMixer(float stereoCompensation, core::MultichannelPolicy policy);

    // Returns the number of mono samples written to out (out is resized).
    size_t process(const float* interleaved, size_t sampleCount, size_t channels,
                   std::vector<float>& out) const;

    float stereoCompensation() const {
        return stereoCompensation_;
    }
    core::MultichannelPolicy policy() const {
        return policy_;
    }

   private:
    float stereoCompensation_ = PipelineConstants::DEFAULT_STEREO_COMPENSATION;
    core::MultichannelPolicy policy_ = core::MultichannelPolicy::FirstTwo;
};

}  // namespace voxcap::audio

#endif  // VOXCAP_AUDIO_CHANNEL_MIXER_H
