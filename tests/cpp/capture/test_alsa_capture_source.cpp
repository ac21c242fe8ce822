/**
 * @file test_alsa_capture_source.cpp
 * @brief PCM format conversion and device-less behavior of the ALSA capture source
 */

#include "capture/alsa_capture_source.h"

#include <cstdint>
#include <cstring>
#include <gtest/gtest.h>
#include <vector>

using namespace voxcap::capture;

TEST(ConvertPcmToFloat, FloatIsCopied) {
    std::vector<float> src = {0.25f, -0.5f, 1.0f, 0.0f};
    std::vector<float> dst;

    ASSERT_TRUE(convertPcmToFloat(src.data(), SND_PCM_FORMAT_FLOAT_LE, 2, 2, dst));
    EXPECT_EQ(dst, src);
}

TEST(ConvertPcmToFloat, S16IsScaledToUnitRange) {
    std::vector<int16_t> src = {0, 16384, -32768, 32767};
    std::vector<float> dst;

    ASSERT_TRUE(convertPcmToFloat(src.data(), SND_PCM_FORMAT_S16_LE, 4, 1, dst));
    ASSERT_EQ(dst.size(), 4u);
    EXPECT_FLOAT_EQ(dst[0], 0.0f);
    EXPECT_FLOAT_EQ(dst[1], 0.5f);
    EXPECT_FLOAT_EQ(dst[2], -1.0f);
    EXPECT_LT(dst[3], 1.0f);
    EXPECT_GT(dst[3], 0.999f);
}

TEST(ConvertPcmToFloat, S32IsScaledToUnitRange) {
    std::vector<int32_t> src = {INT32_MIN, 0, 1 << 30};
    std::vector<float> dst;

    ASSERT_TRUE(convertPcmToFloat(src.data(), SND_PCM_FORMAT_S32_LE, 3, 1, dst));
    EXPECT_FLOAT_EQ(dst[0], -1.0f);
    EXPECT_FLOAT_EQ(dst[1], 0.0f);
    EXPECT_FLOAT_EQ(dst[2], 0.5f);
}

TEST(ConvertPcmToFloat, UnsupportedFormatIsRejected) {
    std::vector<uint8_t> src(16, 0);
    std::vector<float> dst;
    EXPECT_FALSE(convertPcmToFloat(src.data(), SND_PCM_FORMAT_U8, 8, 2, dst));
}

TEST(AlsaCaptureSource, UnknownDeviceFailsToStart) {
    AlsaCaptureSource source;
    CaptureRequest request;
    request.device = "voxcap_no_such_device";
    int callbacks = 0;

    auto result = source.start(request, [&](const float*, std::size_t, std::size_t, uint32_t) {
        ++callbacks;
    });

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code, voxcap::core::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE);
    EXPECT_FALSE(source.isRunning());
    EXPECT_TRUE(source.stop(std::chrono::milliseconds(100)));
    EXPECT_EQ(callbacks, 0);
}
