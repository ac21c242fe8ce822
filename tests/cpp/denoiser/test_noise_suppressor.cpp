/**
 * @file test_noise_suppressor.cpp
 * @brief Unit tests for the two-stage STFT noise suppressor
 */

#include "denoiser/inference_backend.h"
#include "denoiser/noise_suppressor.h"
#include "support/signal_generators.h"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace voxcap::denoiser;
namespace vt = voxcap::testing;

namespace {

// Attenuates every bin and folds the input energy into its recurrent state, so
// the output depends on everything seen since the last reset
class StatefulMaskStage final : public InferenceStage {
   public:
    const char* name() const override {
        return "stateful-mask";
    }
    RecurrentState initialState() const override {
        return RecurrentState(2, 4);
    }
    InferenceResult infer(const std::vector<float>& input, RecurrentState& state,
                          std::vector<float>& output) override {
        float energy = 0.0f;
        for (float v : input) {
            energy += v;
        }
        state.values[0] = 0.9f * state.values[0] + 0.1f * energy;
        float gain = 1.0f / (1.0f + 0.001f * state.values[0]);
        output.assign(input.size(), gain);
        return {InferenceStatus::Ok, ""};
    }
};

class FailingStage final : public InferenceStage {
   public:
    explicit FailingStage(std::atomic<int>* calls) : calls_(calls) {}
    const char* name() const override {
        return "failing";
    }
    RecurrentState initialState() const override {
        return RecurrentState{};
    }
    InferenceResult infer(const std::vector<float>&, RecurrentState&,
                          std::vector<float>&) override {
        calls_->fetch_add(1);
        return {InferenceStatus::Error, "simulated failure"};
    }

   private:
    std::atomic<int>* calls_;
};

class ThrowingStage final : public InferenceStage {
   public:
    const char* name() const override {
        return "throwing";
    }
    RecurrentState initialState() const override {
        return RecurrentState{};
    }
    InferenceResult infer(const std::vector<float>&, RecurrentState&,
                          std::vector<float>&) override {
        throw std::runtime_error("boom");
    }
};

class CountingStage final : public InferenceStage {
   public:
    explicit CountingStage(std::atomic<int>* calls) : calls_(calls) {}
    const char* name() const override {
        return "counting";
    }
    RecurrentState initialState() const override {
        return RecurrentState{};
    }
    InferenceResult infer(const std::vector<float>& input, RecurrentState&,
                          std::vector<float>& output) override {
        calls_->fetch_add(1);
        output.assign(input.size(), 1.0f);
        return {InferenceStatus::Ok, ""};
    }

   private:
    std::atomic<int>* calls_;
};

NoiseSuppressor makeBypass() {
    return NoiseSuppressor(createBypassMagnitudeStage(), createBypassRefineStage());
}

std::vector<float> runAll(NoiseSuppressor& ns, const std::vector<float>& input,
                          size_t block = 160) {
    std::vector<float> out;
    for (size_t offset = 0; offset < input.size(); offset += block) {
        size_t take = std::min(block, input.size() - offset);
        ns.process(input.data() + offset, take, out);
    }
    ns.flush(out);
    return out;
}

}  // namespace

TEST(NoiseSuppressor, RejectsInvalidFraming) {
    EXPECT_THROW(NoiseSuppressor(createBypassMagnitudeStage(), createBypassRefineStage(), 512, 0),
                 std::invalid_argument);
    EXPECT_THROW(NoiseSuppressor(createBypassMagnitudeStage(), createBypassRefineStage(), 512, 384),
                 std::invalid_argument);
    EXPECT_THROW(NoiseSuppressor(createBypassMagnitudeStage(), createBypassRefineStage(), 500, 100),
                 std::invalid_argument);
    EXPECT_THROW(NoiseSuppressor(nullptr, createBypassRefineStage()), std::invalid_argument);
}

TEST(NoiseSuppressor, BypassStagesReconstructInputSampleAligned) {
    auto ns = makeBypass();
    auto input = vt::whiteNoise(16000, 0.5f);

    auto out = runAll(ns, input);

    ASSERT_EQ(out.size(), input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        ASSERT_NEAR(out[i], input[i], 1e-4f) << "sample " << i;
    }
}

TEST(NoiseSuppressor, FlushReturnsExactlyTheInputCount) {
    auto ns = makeBypass();
    for (size_t count : {1u, 127u, 128u, 129u, 511u, 513u, 5000u}) {
        auto input = vt::whiteNoise(count, 0.3f);
        auto out = runAll(ns, input, 97);
        EXPECT_EQ(out.size(), count) << "input " << count;
    }
}

TEST(NoiseSuppressor, LatencyIsFrameMinusHop) {
    auto ns = makeBypass();
    EXPECT_EQ(ns.latencySamples(), 384u);

    std::vector<float> input(384, 0.1f);
    std::vector<float> out;
    EXPECT_EQ(ns.process(input.data(), input.size(), out), 0u);
    input.assign(128, 0.1f);
    EXPECT_EQ(ns.process(input.data(), input.size(), out), 128u);
}

TEST(NoiseSuppressor, ZeroInputGivesZeroOutputWithoutInference) {
    std::atomic<int> calls{0};
    NoiseSuppressor ns(std::make_unique<CountingStage>(&calls), createBypassRefineStage());
    std::vector<float> silence(8000, 0.0f);

    auto out = runAll(ns, silence);

    ASSERT_EQ(out.size(), silence.size());
    for (float v : out) {
        ASSERT_EQ(v, 0.0f);
    }
    EXPECT_EQ(calls.load(), 0);
}

TEST(NoiseSuppressor, DeterministicAfterReset) {
    NoiseSuppressor ns(std::make_unique<StatefulMaskStage>(), createBypassRefineStage());
    auto input = vt::whiteNoise(6000, 0.4f);

    std::vector<float> first;
    ns.process(input.data(), input.size(), first);
    EXPECT_FALSE(ns.magnitudeState().isZero());

    ns.reset();
    EXPECT_TRUE(ns.magnitudeState().isZero());

    std::vector<float> second;
    ns.process(input.data(), input.size(), second);
    EXPECT_EQ(first, second);
}

TEST(NoiseSuppressor, FailingStageDegradesToUnmaskedFrame) {
    std::atomic<int> calls{0};
    NoiseSuppressor ns(std::make_unique<FailingStage>(&calls), createBypassRefineStage());
    auto input = vt::whiteNoise(4000, 0.5f);

    auto out = runAll(ns, input);

    ASSERT_EQ(out.size(), input.size());
    EXPECT_GT(calls.load(), 0);
    EXPECT_EQ(ns.inferenceFailures(), static_cast<uint64_t>(calls.load()));
    for (size_t i = 0; i < input.size(); ++i) {
        ASSERT_NEAR(out[i], input[i], 1e-4f);
    }
}

TEST(NoiseSuppressor, ThrowingRefineStageIsContained) {
    NoiseSuppressor ns(createBypassMagnitudeStage(), std::make_unique<ThrowingStage>());
    auto input = vt::whiteNoise(2000, 0.5f);

    std::vector<float> out;
    EXPECT_NO_THROW(out = runAll(ns, input));
    EXPECT_EQ(out.size(), input.size());
    EXPECT_GT(ns.inferenceFailures(), 0u);
}

TEST(NoiseSuppressor, DisabledIsPassThrough) {
    auto ns = makeBypass();
    ns.setEnabled(false);
    auto input = vt::whiteNoise(1000, 0.5f);
    std::vector<float> out;

    EXPECT_EQ(ns.process(input.data(), input.size(), out), input.size());
    EXPECT_EQ(ns.flush(out), 0u);
    EXPECT_EQ(out, input);
}

TEST(InferenceBackend, BypassBackendIsSelectedByDefault) {
    voxcap::core::AppConfig::DenoiserConfig config;
    auto stages = createInferenceStages(config);

    ASSERT_NE(stages.magnitude, nullptr);
    ASSERT_NE(stages.refine, nullptr);
    EXPECT_EQ(stages.backendName, "bypass");
}

TEST(InferenceBackend, OrtRequestFallsBackWhenUnavailable) {
    voxcap::core::AppConfig::DenoiserConfig config;
    config.backend = voxcap::core::DenoiserBackend::Ort;
    config.ort.magnitudeModelPath = "/nonexistent/dtln_1.onnx";
    config.ort.refineModelPath = "/nonexistent/dtln_2.onnx";

    auto stages = createInferenceStages(config);

    ASSERT_NE(stages.magnitude, nullptr);
    ASSERT_NE(stages.refine, nullptr);
    EXPECT_EQ(stages.backendName, "bypass");
}
