#include "core/config_loader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace voxcap::core {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Reads section[key] into out when present and within [minValue, maxValue].
// Out-of-range values leave out untouched and log a warning.
template <typename T>
void readInRange(const nlohmann::json& section, const char* sectionName, const char* key,
                 T minValue, T maxValue, T& out, bool verbose) {
    if (!section.contains(key) || !section[key].is_number()) {
        return;
    }
    T value = section[key].get<T>();
    if (value < minValue || value > maxValue) {
        if (verbose) {
            LOG_WARN("Config: {}.{} out of range [{}, {}] (got {}), using {}", sectionName, key,
                     minValue, maxValue, value, out);
        }
        return;
    }
    out = value;
}

void readBool(const nlohmann::json& section, const char* key, bool& out) {
    if (section.contains(key) && section[key].is_boolean()) {
        out = section[key].get<bool>();
    }
}

void readString(const nlohmann::json& section, const char* key, std::string& out) {
    if (section.contains(key) && section[key].is_string()) {
        out = section[key].get<std::string>();
    }
}

bool isPowerOfTwo(size_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

std::string validateOrtProvider(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "cpu" || lower == "cuda" || lower == "tensorrt" || lower == "trt") {
        return (lower == "trt") ? "tensorrt" : lower;
    }
    return "cpu";
}

void parseCapture(const nlohmann::json& s, AppConfig& cfg, bool verbose) {
    std::string device = cfg.capture.device;
    readString(s, "device", device);
    if (device.empty()) {
        if (verbose) {
            LOG_WARN("Config: capture.device is empty, using '{}'", cfg.capture.device);
        }
    } else {
        cfg.capture.device = device;
    }
    readInRange<uint32_t>(s, "capture", "sampleRate", PipelineConstants::MIN_SAMPLE_RATE,
                          PipelineConstants::MAX_SAMPLE_RATE, cfg.capture.sampleRate, verbose);
    readInRange<uint32_t>(s, "capture", "channels", 1, 8, cfg.capture.channels, verbose);
    readInRange<uint32_t>(s, "capture", "periodFrames", 32, 8192, cfg.capture.periodFrames,
                          verbose);
}

void parseMixer(const nlohmann::json& s, AppConfig& cfg, bool verbose) {
    readInRange<float>(s, "mixer", "stereoCompensation",
                       PipelineConstants::MIN_STEREO_COMPENSATION,
                       PipelineConstants::MAX_STEREO_COMPENSATION, cfg.mixer.stereoCompensation,
                       verbose);
    if (s.contains("multichannelPolicy") && s["multichannelPolicy"].is_string()) {
        std::string policy = s["multichannelPolicy"].get<std::string>();
        std::string lower = toLower(policy);
        if (lower != "first_two" && lower != "average_all" && verbose) {
            LOG_WARN("Config: Unknown mixer.multichannelPolicy '{}', falling back to 'first_two'",
                     policy);
        }
        cfg.mixer.multichannelPolicy = parseMultichannelPolicy(policy);
    }
}

void parsePreprocessing(const nlohmann::json& s, AppConfig& cfg, bool verbose) {
    auto& pre = cfg.preprocessing;
    readBool(s, "highpassEnabled", pre.highpassEnabled);
    readInRange<float>(s, "preprocessing", "highpassCutoffHz",
                       PipelineConstants::MIN_HIGHPASS_CUTOFF_HZ,
                       PipelineConstants::MAX_HIGHPASS_CUTOFF_HZ, pre.highpassCutoffHz, verbose);
    int order = pre.highpassOrder;
    readInRange<int>(s, "preprocessing", "highpassOrder", PipelineConstants::MIN_HIGHPASS_ORDER,
                     PipelineConstants::MAX_HIGHPASS_ORDER, order, verbose);
    if (order % 2 != 0) {
        if (verbose) {
            LOG_WARN("Config: preprocessing.highpassOrder must be even (got {}), using {}", order,
                     order + 1);
        }
        order += 1;
    }
    pre.highpassOrder = order;
    readBool(s, "preEmphasisEnabled", pre.preEmphasisEnabled);
    readInRange<float>(s, "preprocessing", "preEmphasisAlpha", 0.0f,
                       PipelineConstants::MAX_PRE_EMPHASIS_ALPHA, pre.preEmphasisAlpha, verbose);
}

void parseResampler(const nlohmann::json& s, AppConfig& cfg, bool verbose) {
    readInRange<size_t>(s, "resampler", "chunkFrames",
                        PipelineConstants::MIN_RESAMPLER_CHUNK_FRAMES,
                        PipelineConstants::MAX_RESAMPLER_CHUNK_FRAMES, cfg.resampler.chunkFrames,
                        verbose);
    readInRange<int>(s, "resampler", "zeroCrossings", 4, 64, cfg.resampler.zeroCrossings,
                     verbose);
}

void parseDenoiser(const nlohmann::json& s, AppConfig& cfg, bool verbose) {
    auto& dn = cfg.denoiser;
    readBool(s, "enabled", dn.enabled);
    if (s.contains("backend") && s["backend"].is_string()) {
        std::string backend = s["backend"].get<std::string>();
        dn.backend = parseDenoiserBackend(backend);
        if (dn.backend == DenoiserBackend::Bypass && toLower(backend) != "bypass" && verbose) {
            LOG_WARN("Config: Unknown denoiser.backend '{}', falling back to 'bypass'", backend);
        }
    }

    size_t frame = dn.frameSize;
    size_t hop = dn.hopSize;
    readInRange<size_t>(s, "denoiser", "frameSize", 64, 4096, frame, verbose);
    readInRange<size_t>(s, "denoiser", "hopSize", 16, 4096, hop, verbose);
    if (!isPowerOfTwo(frame) || hop * 2 > frame || frame % hop != 0) {
        if (verbose) {
            LOG_WARN(
                "Config: denoiser frameSize={} hopSize={} invalid (frame must be a power of two "
                "and a multiple of 2 * hop), using {}/{}",
                frame, hop, PipelineConstants::DEFAULT_DENOISER_FRAME,
                PipelineConstants::DEFAULT_DENOISER_HOP);
        }
        frame = PipelineConstants::DEFAULT_DENOISER_FRAME;
        hop = PipelineConstants::DEFAULT_DENOISER_HOP;
    }
    dn.frameSize = frame;
    dn.hopSize = hop;

    if (s.contains("ort") && s["ort"].is_object()) {
        const auto& ort = s["ort"];
        readString(ort, "magnitudeModelPath", dn.ort.magnitudeModelPath);
        readString(ort, "refineModelPath", dn.ort.refineModelPath);
        if (ort.contains("provider") && ort["provider"].is_string()) {
            dn.ort.provider = validateOrtProvider(ort["provider"].get<std::string>());
        }
        if (ort.contains("intraOpThreads") && ort["intraOpThreads"].is_number_integer()) {
            dn.ort.intraOpThreads = std::max(0, ort["intraOpThreads"].get<int>());
        }
        readInRange<size_t>(ort, "denoiser.ort", "lstmUnits", 1, 1024, dn.ort.lstmUnits,
                            verbose);
    }
}

void parseAgc(const nlohmann::json& s, AppConfig& cfg, bool verbose) {
    auto& agc = cfg.agc;
    readBool(s, "enabled", agc.enabled);
    readInRange<float>(s, "agc", "targetLevelDbfs", -40.0f, 0.0f, agc.targetLevelDbfs, verbose);
    readInRange<float>(s, "agc", "maxGainDb", 0.0f, 40.0f, agc.maxGainDb, verbose);
    readInRange<float>(s, "agc", "attackMs", 1.0f, 100.0f, agc.attackMs, verbose);
    readInRange<float>(s, "agc", "releaseMs", 10.0f, 2000.0f, agc.releaseMs, verbose);
    readInRange<float>(s, "agc", "limiterCeilingDbfs", -20.0f, 0.0f, agc.limiterCeilingDbfs,
                       verbose);
}

void parseRecording(const nlohmann::json& s, AppConfig& cfg, bool verbose) {
    auto& rec = cfg.recording;
    readInRange<uint32_t>(s, "recording", "maxDurationSeconds", 1, 3600, rec.maxDurationSeconds,
                          verbose);
    readInRange<int>(s, "recording", "stopTimeoutMs", 100, 10000, rec.stopTimeoutMs, verbose);
    readInRange<int>(s, "recording", "lockTimeoutMs", 10, 5000, rec.lockTimeoutMs, verbose);
    readInRange<int>(s, "recording", "reconnectAttempts", 0, 10, rec.reconnectAttempts, verbose);
    readInRange<int>(s, "recording", "reconnectDelayMs", 0, 5000, rec.reconnectDelayMs, verbose);
    readBool(s, "listeningMode", rec.listeningMode);
    readString(s, "outputDirectory", rec.outputDirectory);
}

bool parseDocument(const nlohmann::json& j, AppConfig& outConfig, bool verbose) {
    if (!j.is_object()) {
        if (verbose) {
            LOG_ERROR("Config: top-level JSON value must be an object");
        }
        return false;
    }

    // Each section is parsed independently so one bad section does not discard the rest
    auto section = [&](const char* name, auto&& parser) {
        if (!j.contains(name) || !j[name].is_object()) {
            return;
        }
        try {
            parser(j[name], outConfig, verbose);
        } catch (const nlohmann::json::exception& e) {
            if (verbose) {
                LOG_WARN("Config: Invalid {} settings, keeping defaults: {}", name, e.what());
            }
        }
    };

    section("capture", parseCapture);
    if (j.contains("pipeline") && j["pipeline"].is_object()) {
        readInRange<uint32_t>(j["pipeline"], "pipeline", "targetSampleRate",
                              PipelineConstants::MIN_SAMPLE_RATE, 48000,
                              outConfig.pipeline.targetSampleRate, verbose);
    }
    section("mixer", parseMixer);
    section("preprocessing", parsePreprocessing);
    section("resampler", parseResampler);
    section("denoiser", parseDenoiser);
    section("agc", parseAgc);
    if (j.contains("hotkey") && j["hotkey"].is_object()) {
        readInRange<int>(j["hotkey"], "hotkey", "doubleTapWindowMs", 50, 2000,
                         outConfig.hotkey.doubleTapWindowMs, verbose);
    }
    section("recording", parseRecording);

    if (j.contains("logging")) {
        try {
            outConfig.logging = logging::parseLogConfig(j["logging"]);
        } catch (const nlohmann::json::exception& e) {
            if (verbose) {
                LOG_WARN("Config: Invalid logging settings, keeping defaults: {}", e.what());
            }
        }
    }
    return true;
}

}  // namespace

MultichannelPolicy parseMultichannelPolicy(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "average_all" || lower == "average") {
        return MultichannelPolicy::AverageAll;
    }
    return MultichannelPolicy::FirstTwo;
}

const char* multichannelPolicyToString(MultichannelPolicy policy) {
    switch (policy) {
    case MultichannelPolicy::AverageAll:
        return "average_all";
    case MultichannelPolicy::FirstTwo:
    default:
        return "first_two";
    }
}

DenoiserBackend parseDenoiserBackend(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "ort" || lower == "onnx" || lower == "onnxruntime") {
        return DenoiserBackend::Ort;
    }
    return DenoiserBackend::Bypass;
}

const char* denoiserBackendToString(DenoiserBackend backend) {
    switch (backend) {
    case DenoiserBackend::Ort:
        return "ort";
    case DenoiserBackend::Bypass:
    default:
        return "bypass";
    }
}

bool parseAppConfig(const std::string& jsonText, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};
    try {
        nlohmann::json j = nlohmann::json::parse(jsonText);
        return parseDocument(j, outConfig, verbose);
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse JSON: {}", e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (!parseAppConfig(contents.str(), outConfig, verbose)) {
        if (verbose) {
            LOG_ERROR("Config: Failed to load {}", configPath.string());
        }
        return false;
    }
    if (verbose) {
        std::cout << "Config: Loaded from " << std::filesystem::absolute(configPath) << '\n';
    }
    return true;
}

}  // namespace voxcap::core
