#include "audio/channel_mixer.h"

#include <algorithm>

namespace voxcap::audio {

ChannelMixer::ChannelMixer(float stereoCompensation, core::MultichannelPolicy policy)
    : stereoCompensation_(stereoCompensation), policy_(policy) {}

size_t ChannelMixer::process(const float* interleaved, size_t sampleCount, size_t channels,
                             std::vector<float>& out) const {
    if (interleaved == nullptr || channels == 0) {
        out.clear();
        return 0;
    }

    const size_t frames = sampleCount / channels;
    out.resize(frames);

    if (channels == 1) {
        std::copy(interleaved, interleaved + frames, out.begin());
        return frames;
    }

    if (channels == 2 || policy_ == core::MultichannelPolicy::FirstTwo) {
        for (size_t i = 0; i < frames; ++i) {
            const float* frame = interleaved + i * channels;
            out[i] = (frame[0] + frame[1]) * stereoCompensation_;
        }
        return frames;
    }

    const float invChannels = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        const float* frame = interleaved + i * channels;
        float sum = 0.0f;
        for (size_t ch = 0; ch < channels; ++ch) {
            sum += frame[ch];
        }
        out[i] = sum * invChannels;
    }
    return frames;
}

}  // namespace voxcap::audio
