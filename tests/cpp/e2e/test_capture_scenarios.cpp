/**
 * @file test_capture_scenarios.cpp
 * @brief End-to-end capture sessions: fake device -> full chain -> coordinator -> sink
 */

#include "denoiser/inference_backend.h"
#include "pipeline/capture_pipeline.h"
#include "recording/recording_coordinator.h"
#include "support/fake_capture_source.h"
#include "support/signal_generators.h"

#include <atomic>
#include <gtest/gtest.h>

using namespace voxcap::recording;
using voxcap::core::AppConfig;
using voxcap::pipeline::CapturePipeline;
using voxcap::testing::FakeCaptureSource;
namespace vt = voxcap::testing;

namespace {

class CountingSink : public RecordingSink {
   public:
    const char* name() const override {
        return "counting";
    }
    bool onRecordingComplete(const CompletedRecording&) override {
        calls.fetch_add(1);
        return true;
    }
    std::atomic<int> calls{0};
};

class CaptureScenarioTest : public ::testing::Test {
   protected:
    void build(uint32_t rate, uint32_t channels) {
        config_.capture.sampleRate = rate;
        config_.capture.channels = channels;
        source_.setFormat(rate, channels);
        pipeline_ = std::make_unique<CapturePipeline>(
            config_, voxcap::denoiser::createInferenceStages(config_.denoiser));
        coordinator_ = std::make_unique<RecordingCoordinator>(config_, source_, *pipeline_);
        sink_ = std::make_shared<CountingSink>();
        coordinator_->addSink(sink_);
    }

    // Delivers mono content in 10 ms periods, duplicated to every channel
    void play(const std::vector<float>& mono, uint32_t rate, uint32_t channels) {
        const size_t periodFrames = rate / 100;
        for (size_t frame = 0; frame < mono.size(); frame += periodFrames) {
            size_t frames = std::min(periodFrames, mono.size() - frame);
            std::vector<float> block(frames * channels);
            for (size_t f = 0; f < frames; ++f) {
                for (size_t c = 0; c < channels; ++c) {
                    block[f * channels + c] = mono[frame + f];
                }
            }
            source_.push(block);
        }
    }

    AppConfig config_;
    FakeCaptureSource source_;
    std::unique_ptr<CapturePipeline> pipeline_;
    std::unique_ptr<RecordingCoordinator> coordinator_;
    std::shared_ptr<CountingSink> sink_;
};

}  // namespace

TEST_F(CaptureScenarioTest, OneSecondMono16kToneStopsWithOneSecondRecording) {
    build(16000, 1);
    ASSERT_TRUE(coordinator_->start().ok());

    play(vt::sine(1000.0, 16000.0, 16000, 0.3f), 16000, 1);
    auto result = coordinator_->stop();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metadata->sampleCount, 16000u);
    EXPECT_NEAR(result.metadata->durationSeconds, 1.0, 1e-9);
    EXPECT_TRUE(pipeline_->resampler().isPassthrough());
    EXPECT_EQ(sink_->calls.load(), 1);

    auto last = coordinator_->lastRecording();
    ASSERT_NE(last, nullptr);
    EXPECT_GT(vt::rms(last->samples, 8000), 0.05);
}

TEST_F(CaptureScenarioTest, ImmediateCancelReturnsToListeningWithNothingEncoded) {
    config_.recording.listeningMode = true;
    build(48000, 2);
    ASSERT_EQ(coordinator_->state(), RecordingState::Listening);

    ASSERT_TRUE(coordinator_->start().ok());
    auto result = coordinator_->cancel();

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(coordinator_->state(), RecordingState::Listening);
    EXPECT_EQ(pipeline_->buffer().size(), 0u);
    EXPECT_EQ(coordinator_->lastRecording(), nullptr);
    EXPECT_EQ(sink_->calls.load(), 0);
}

TEST_F(CaptureScenarioTest, HalfSecondStereo48kBecomesMono16k) {
    build(48000, 2);
    ASSERT_TRUE(coordinator_->start().ok());

    play(vt::sine(440.0, 48000.0, 24000, 0.3f), 48000, 2);
    auto result = coordinator_->stop();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metadata->sampleCount, 8000u);
    EXPECT_EQ(result.metadata->sampleRate, 16000u);
    EXPECT_NEAR(result.metadata->durationSeconds, 0.5, 1e-9);
}

TEST_F(CaptureScenarioTest, AgcAttacksOnTransientAndReleasesGradually) {
    config_.preprocessing.preEmphasisEnabled = false;
    build(48000, 1);
    ASSERT_TRUE(coordinator_->start().ok());
    const auto& agc = pipeline_->agc();

    // -40 dBFS for 5 s: gain settles at the configured maximum
    play(vt::sine(1000.0, 48000.0, 48000 * 5, 0.01f), 48000, 1);
    EXPECT_GT(agc.currentGainDb(), 19.0f);

    // 0 dBFS transient: gain collapses within a few periods
    auto loud = vt::sine(1000.0, 48000.0, 48000 / 2, 1.0f);
    float gainAfter100ms = 0.0f;
    for (size_t offset = 0; offset < loud.size(); offset += 4800) {
        play(std::vector<float>(loud.begin() + offset, loud.begin() + offset + 4800), 48000, 1);
        if (offset == 0) {
            gainAfter100ms = agc.currentGainDb();
        }
    }
    EXPECT_LT(gainAfter100ms, 6.0f);
    EXPECT_LT(agc.currentGainDb(), 1.0f);

    // Back to -40 dBFS: recovery is slow at first and complete after a few seconds
    auto quiet = vt::sine(1000.0, 48000.0, 48000 * 5, 0.01f);
    play(std::vector<float>(quiet.begin(), quiet.begin() + 9600), 48000, 1);
    EXPECT_LT(agc.currentGainDb(), 6.0f);
    play(std::vector<float>(quiet.begin() + 9600, quiet.end()), 48000, 1);
    EXPECT_GT(agc.currentGainDb(), 19.0f);

    auto result = coordinator_->stop();
    ASSERT_TRUE(result.ok());
    auto last = coordinator_->lastRecording();
    ASSERT_NE(last, nullptr);
    EXPECT_LE(vt::peak(last->samples), agc.ceiling());
}
