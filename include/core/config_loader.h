#ifndef VOXCAP_CORE_CONFIG_LOADER_H
#define VOXCAP_CORE_CONFIG_LOADER_H

#include "core/pipeline_constants.h"
#include "logging/logger.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace voxcap::core {

constexpr const char* DEFAULT_CONFIG_FILE = "voxcap.json";

// Downmix rule for devices with more than two channels
enum class MultichannelPolicy {
    FirstTwo,   // (ch0 + ch1) * compensation, remaining channels ignored
    AverageAll  // sum of all channels / channel count
};

enum class DenoiserBackend { Bypass, Ort };

struct AppConfig {
    struct CaptureConfig {
        std::string device = "default";
        uint32_t sampleRate = PipelineConstants::DEFAULT_CAPTURE_SAMPLE_RATE;
        uint32_t channels = 2;
        uint32_t periodFrames = 480;  // 10 ms at 48 kHz
    } capture;

    struct PipelineConfig {
        uint32_t targetSampleRate = PipelineConstants::TARGET_SAMPLE_RATE;
    } pipeline;

    struct MixerConfig {
        float stereoCompensation = PipelineConstants::DEFAULT_STEREO_COMPENSATION;
        MultichannelPolicy multichannelPolicy = MultichannelPolicy::FirstTwo;
    } mixer;

    struct PreprocessingConfig {
        bool highpassEnabled = true;
        float highpassCutoffHz = PipelineConstants::DEFAULT_HIGHPASS_CUTOFF_HZ;
        int highpassOrder = PipelineConstants::DEFAULT_HIGHPASS_ORDER;
        bool preEmphasisEnabled = true;
        float preEmphasisAlpha = PipelineConstants::DEFAULT_PRE_EMPHASIS_ALPHA;
    } preprocessing;

    struct ResamplerConfig {
        size_t chunkFrames = PipelineConstants::DEFAULT_RESAMPLER_CHUNK_FRAMES;
        int zeroCrossings = PipelineConstants::DEFAULT_SINC_ZERO_CROSSINGS;
    } resampler;

    struct DenoiserConfig {
        bool enabled = true;
        DenoiserBackend backend = DenoiserBackend::Bypass;
        size_t frameSize = PipelineConstants::DEFAULT_DENOISER_FRAME;
        size_t hopSize = PipelineConstants::DEFAULT_DENOISER_HOP;

        struct OrtConfig {
            std::string magnitudeModelPath = "models/dtln_1.onnx";
            std::string refineModelPath = "models/dtln_2.onnx";
            std::string provider = "cpu";  // cpu, cuda, tensorrt
            int intraOpThreads = 1;
            size_t lstmUnits = PipelineConstants::DEFAULT_LSTM_UNITS;
        } ort;
    } denoiser;

    struct AgcConfig {
        bool enabled = true;
        float targetLevelDbfs = PipelineConstants::DEFAULT_AGC_TARGET_DBFS;
        float maxGainDb = PipelineConstants::DEFAULT_AGC_MAX_GAIN_DB;
        float attackMs = PipelineConstants::DEFAULT_AGC_ATTACK_MS;
        float releaseMs = PipelineConstants::DEFAULT_AGC_RELEASE_MS;
        float limiterCeilingDbfs = PipelineConstants::DEFAULT_LIMITER_CEILING_DBFS;
    } agc;

    struct HotkeyConfig {
        int doubleTapWindowMs = PipelineConstants::DEFAULT_DOUBLE_TAP_WINDOW_MS;
    } hotkey;

    struct RecordingConfig {
        uint32_t maxDurationSeconds = PipelineConstants::DEFAULT_MAX_RECORDING_SECONDS;
        int stopTimeoutMs = PipelineConstants::DEFAULT_STOP_TIMEOUT_MS;
        int lockTimeoutMs = PipelineConstants::DEFAULT_LOCK_TIMEOUT_MS;
        int reconnectAttempts = PipelineConstants::DEFAULT_RECONNECT_ATTEMPTS;
        int reconnectDelayMs = PipelineConstants::DEFAULT_RECONNECT_DELAY_MS;
        bool listeningMode = false;
        std::string outputDirectory = "recordings";
    } recording;

    logging::LogConfig logging;
};

MultichannelPolicy parseMultichannelPolicy(const std::string& str);
const char* multichannelPolicyToString(MultichannelPolicy policy);
DenoiserBackend parseDenoiserBackend(const std::string& str);
const char* denoiserBackendToString(DenoiserBackend backend);

/**
 * @brief Load configuration from a JSON file.
 *
 * outConfig is reset to defaults first; keys missing from the file keep their defaults.
 * Out-of-range values are replaced by the default (or clamped) with a warning.
 *
 * @return true if the file was read and parsed, false if missing or malformed
 *         (outConfig then holds defaults)
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

/**
 * @brief Parse configuration from an in-memory JSON document.
 *
 * Same semantics as loadAppConfig().
 */
bool parseAppConfig(const std::string& jsonText, AppConfig& outConfig, bool verbose = true);

}  // namespace voxcap::core

#endif  // VOXCAP_CORE_CONFIG_LOADER_H
