/**
 * @file test_wav_encoder.cpp
 * @brief WAV sink: file naming, contents and failure reporting
 */

#include "output/wav_encoder.h"
#include "support/signal_generators.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sndfile.h>
#include <unistd.h>

using namespace voxcap::output;
using voxcap::recording::CompletedRecording;
using voxcap::recording::StopReason;
namespace fs = std::filesystem;
namespace vt = voxcap::testing;

namespace {

std::vector<float> readWav(const fs::path& path, SF_INFO& info) {
    info = SF_INFO{};
    SNDFILE* file = sf_open(path.string().c_str(), SFM_READ, &info);
    if (!file) {
        return {};
    }
    std::vector<float> samples(static_cast<size_t>(info.frames * info.channels));
    sf_readf_float(file, samples.data(), info.frames);
    sf_close(file);
    return samples;
}

class WavEncoderTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir_ = fs::temp_directory_path() / ("voxcap_wav_" + std::string(info->name()) + "_" +
                                                std::to_string(getpid()));
        fs::remove_all(tempDir_);
    }
    void TearDown() override {
        fs::remove_all(tempDir_);
    }

    fs::path tempDir_;
};

}  // namespace

TEST_F(WavEncoderTest, WritesMonoFloatWavAtTargetRate) {
    WavEncoder encoder(tempDir_ / "recordings");
    CompletedRecording recording;
    recording.samples = vt::sine(440.0, 16000.0, 16000, 0.5f);
    recording.metadata.sampleCount = recording.samples.size();
    recording.metadata.sampleRate = 16000;
    recording.metadata.durationSeconds = 1.0;
    recording.metadata.stopReason = StopReason::User;

    ASSERT_TRUE(encoder.onRecordingComplete(recording));

    fs::path written = encoder.lastWrittenPath();
    ASSERT_TRUE(fs::exists(written));
    EXPECT_EQ(written.parent_path(), tempDir_ / "recordings");
    EXPECT_EQ(written.extension(), ".wav");
    EXPECT_EQ(written.filename().string().rfind("voxcap_", 0), 0u);

    SF_INFO info;
    auto samples = readWav(written, info);
    EXPECT_EQ(info.samplerate, 16000);
    EXPECT_EQ(info.channels, 1);
    EXPECT_EQ(info.format & SF_FORMAT_TYPEMASK, SF_FORMAT_WAV);
    EXPECT_EQ(info.format & SF_FORMAT_SUBMASK, SF_FORMAT_FLOAT);
    EXPECT_EQ(samples, recording.samples);
}

TEST_F(WavEncoderTest, EmptyRecordingWritesNothing) {
    WavEncoder encoder(tempDir_);
    CompletedRecording recording;
    recording.metadata.sampleRate = 16000;

    EXPECT_TRUE(encoder.onRecordingComplete(recording));
    EXPECT_TRUE(encoder.lastWrittenPath().empty());
    EXPECT_FALSE(fs::exists(tempDir_));
}

TEST_F(WavEncoderTest, UnwritableDirectoryIsReported) {
    fs::create_directories(tempDir_);
    fs::path blocker = tempDir_ / "not_a_dir";
    {
        std::ofstream(blocker.string()) << "x";
    }
    WavEncoder encoder(blocker / "recordings");
    CompletedRecording recording;
    recording.samples.assign(100, 0.1f);
    recording.metadata.sampleRate = 16000;

    EXPECT_FALSE(encoder.onRecordingComplete(recording));
    EXPECT_TRUE(encoder.lastWrittenPath().empty());
}

TEST(WavWriter, WriteWithoutOpenFails) {
    WavWriter writer;
    float sample = 0.0f;
    EXPECT_FALSE(writer.isOpen());
    EXPECT_FALSE(writer.writeFrames(&sample, 1));
}

TEST(WavWriter, WriteWavFileRoundTrip) {
    fs::path path = fs::temp_directory_path() /
                    ("voxcap_wav_direct_" + std::to_string(getpid()) + ".wav");
    auto samples = vt::whiteNoise(1234, 0.8f);

    ASSERT_TRUE(writeWavFile(path, samples, 16000));

    SF_INFO info;
    EXPECT_EQ(readWav(path, info), samples);
    fs::remove(path);
}
