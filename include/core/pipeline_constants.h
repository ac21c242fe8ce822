#ifndef VOXCAP_CORE_PIPELINE_CONSTANTS_H
#define VOXCAP_CORE_PIPELINE_CONSTANTS_H

#include <cstddef>
#include <cstdint>

// Defaults and bounds shared by the capture pipeline, config loader and coordinator

namespace PipelineConstants {

// Sample rates
constexpr uint32_t TARGET_SAMPLE_RATE = 16000;  // Rate delivered to transcription
constexpr uint32_t DEFAULT_CAPTURE_SAMPLE_RATE = 48000;
constexpr uint32_t MIN_SAMPLE_RATE = 8000;
constexpr uint32_t MAX_SAMPLE_RATE = 192000;

// Channel mixer
constexpr float DEFAULT_STEREO_COMPENSATION = 0.5f;  // (L + R) * 0.5 keeps correlated peaks at unity
constexpr float MIN_STEREO_COMPENSATION = 0.25f;
constexpr float MAX_STEREO_COMPENSATION = 1.0f;

// Preprocessing
constexpr float DEFAULT_HIGHPASS_CUTOFF_HZ = 80.0f;
constexpr float MIN_HIGHPASS_CUTOFF_HZ = 20.0f;
constexpr float MAX_HIGHPASS_CUTOFF_HZ = 500.0f;
constexpr int DEFAULT_HIGHPASS_ORDER = 12;  // six biquads, 50 Hz lands near -49 dB
constexpr int MIN_HIGHPASS_ORDER = 2;
constexpr int MAX_HIGHPASS_ORDER = 16;
constexpr float DEFAULT_PRE_EMPHASIS_ALPHA = 0.97f;
constexpr float MAX_PRE_EMPHASIS_ALPHA = 0.999f;

// Resampler
constexpr size_t DEFAULT_RESAMPLER_CHUNK_FRAMES = 1024;
constexpr size_t MIN_RESAMPLER_CHUNK_FRAMES = 64;
constexpr size_t MAX_RESAMPLER_CHUNK_FRAMES = 8192;
constexpr int DEFAULT_SINC_ZERO_CROSSINGS = 16;
constexpr int SINC_TABLE_OVERSAMPLING = 128;

// Noise suppressor (DTLN geometry)
constexpr size_t DEFAULT_DENOISER_FRAME = 512;
constexpr size_t DEFAULT_DENOISER_HOP = 128;
constexpr size_t DEFAULT_LSTM_UNITS = 128;

// AGC
constexpr float DEFAULT_AGC_TARGET_DBFS = -12.0f;
constexpr float DEFAULT_AGC_MAX_GAIN_DB = 20.0f;
constexpr float DEFAULT_AGC_ATTACK_MS = 10.0f;
constexpr float DEFAULT_AGC_RELEASE_MS = 200.0f;
constexpr float DEFAULT_LIMITER_CEILING_DBFS = -3.0f;
constexpr float AGC_NOISE_FLOOR_RMS = 0.001f;  // -60 dBFS, gain is held below this
constexpr float LIMITER_KNEE_RATIO = 0.75f;

// Capture buffer / recording
constexpr uint32_t DEFAULT_MAX_RECORDING_SECONDS = 600;
constexpr int DEFAULT_STOP_TIMEOUT_MS = 2000;
constexpr int DEFAULT_LOCK_TIMEOUT_MS = 500;
constexpr int DEFAULT_RECONNECT_ATTEMPTS = 3;
constexpr int DEFAULT_RECONNECT_DELAY_MS = 200;

// Hotkey
constexpr int DEFAULT_DOUBLE_TAP_WINDOW_MS = 300;

// Diagnostics
constexpr float CLIP_THRESHOLD = 0.99f;
constexpr float QUIET_THRESHOLD_DBFS = -30.0f;
constexpr float QUIET_MIN_SECONDS = 0.5f;

}  // namespace PipelineConstants

#endif  // VOXCAP_CORE_PIPELINE_CONSTANTS_H
