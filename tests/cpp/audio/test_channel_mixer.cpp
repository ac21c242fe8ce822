/**
 * @file test_channel_mixer.cpp
 * @brief Unit tests for interleaved-to-mono channel mixing
 */

#include "audio/channel_mixer.h"
#include "support/signal_generators.h"

#include <gtest/gtest.h>

using voxcap::audio::ChannelMixer;
using voxcap::core::MultichannelPolicy;

TEST(ChannelMixer, MonoInputIsCopiedUnchanged) {
    ChannelMixer mixer(0.5f, MultichannelPolicy::FirstTwo);
    auto input = voxcap::testing::whiteNoise(480, 0.8f);
    std::vector<float> out;

    size_t frames = mixer.process(input.data(), input.size(), 1, out);

    ASSERT_EQ(frames, input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        EXPECT_EQ(out[i], input[i]) << "sample " << i;
    }
}

TEST(ChannelMixer, StereoSumIsCompensated) {
    ChannelMixer mixer(0.5f, MultichannelPolicy::FirstTwo);
    std::vector<float> input = {0.2f, 0.4f, -0.6f, 0.2f, 1.0f, 1.0f};
    std::vector<float> out;

    ASSERT_EQ(mixer.process(input.data(), input.size(), 2, out), 3u);
    EXPECT_FLOAT_EQ(out[0], 0.3f);
    EXPECT_FLOAT_EQ(out[1], -0.2f);
    EXPECT_FLOAT_EQ(out[2], 1.0f);
}

TEST(ChannelMixer, IdenticalChannelsKeepLevel) {
    ChannelMixer mixer;
    auto mono = voxcap::testing::sine(1000.0, 48000.0, 4800, 0.5f);
    auto stereo = voxcap::testing::interleave({mono, mono});
    std::vector<float> out;

    mixer.process(stereo.data(), stereo.size(), 2, out);

    ASSERT_EQ(out.size(), mono.size());
    EXPECT_NEAR(voxcap::testing::rms(out), voxcap::testing::rms(mono), 1e-6);
}

TEST(ChannelMixer, MultichannelFirstTwoIgnoresExtraChannels) {
    ChannelMixer mixer(0.5f, MultichannelPolicy::FirstTwo);
    std::vector<float> input = {0.2f, 0.4f, 0.9f, 0.9f};
    std::vector<float> out;

    ASSERT_EQ(mixer.process(input.data(), input.size(), 4, out), 1u);
    EXPECT_FLOAT_EQ(out[0], 0.3f);
}

TEST(ChannelMixer, MultichannelAverageAll) {
    ChannelMixer mixer(0.5f, MultichannelPolicy::AverageAll);
    std::vector<float> input = {0.1f, 0.2f, 0.3f, 0.4f};
    std::vector<float> out;

    ASSERT_EQ(mixer.process(input.data(), input.size(), 4, out), 1u);
    EXPECT_FLOAT_EQ(out[0], 0.25f);
}

TEST(ChannelMixer, TrailingPartialFrameIsDropped) {
    ChannelMixer mixer;
    std::vector<float> input = {0.2f, 0.2f, 0.5f};
    std::vector<float> out;

    EXPECT_EQ(mixer.process(input.data(), input.size(), 2, out), 1u);
    EXPECT_EQ(out.size(), 1u);
}

TEST(ChannelMixer, ZeroChannelsProducesNothing) {
    ChannelMixer mixer;
    std::vector<float> input = {0.2f, 0.2f};
    std::vector<float> out = {1.0f};

    EXPECT_EQ(mixer.process(input.data(), input.size(), 0, out), 0u);
    EXPECT_TRUE(out.empty());
}
