#include "denoiser/inference_backend.h"

#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <utility>
#include <vector>

#ifdef VOXCAP_ENABLE_ORT
#include <onnxruntime_cxx_api.h>
#endif

namespace voxcap::denoiser {
namespace {

class BypassMagnitudeStage final : public InferenceStage {
   public:
    const char* name() const override {
        return "bypass-magnitude";
    }

    RecurrentState initialState() const override {
        return RecurrentState{};
    }

    InferenceResult infer(const std::vector<float>& input, RecurrentState& /*state*/,
                          std::vector<float>& output) override {
        output.assign(input.size(), 1.0f);
        return {InferenceStatus::Ok, ""};
    }
};

class BypassRefineStage final : public InferenceStage {
   public:
    const char* name() const override {
        return "bypass-refine";
    }

    RecurrentState initialState() const override {
        return RecurrentState{};
    }

    InferenceResult infer(const std::vector<float>& input, RecurrentState& /*state*/,
                          std::vector<float>& output) override {
        output.assign(input.begin(), input.end());
        return {InferenceStatus::Ok, ""};
    }
};

#ifdef VOXCAP_ENABLE_ORT

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

Ort::Env& ortEnv() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "voxcap-denoiser");
    return env;
}

std::string statusMessage(OrtStatus* status, const std::string& prefix) {
    std::string message = prefix;
    message += Ort::GetApi().GetErrorMessage(status);
    Ort::GetApi().ReleaseStatus(status);
    return message;
}

// DTLN-style stage: inputs (features [1, 1, N], state [1, 2, units, 2]),
// outputs (result [1, 1, N], next state [1, 2, units, 2]).
class OrtInferenceStage final : public InferenceStage {
   public:
    OrtInferenceStage(std::string stageName, std::string modelPath,
                      core::AppConfig::DenoiserConfig::OrtConfig config)
        : stageName_(std::move(stageName)),
          modelPath_(std::move(modelPath)),
          config_(std::move(config)),
          memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)) {
        initialize();
    }

    const char* name() const override {
        return stageName_.c_str();
    }

    const std::string& initError() const {
        return initError_;
    }

    RecurrentState initialState() const override {
        return RecurrentState(2, config_.lstmUnits);
    }

    InferenceResult infer(const std::vector<float>& input, RecurrentState& state,
                          std::vector<float>& output) override {
        if (!session_) {
            return {InferenceStatus::InvalidConfig,
                    initError_.empty() ? "ORT session is not initialized" : initError_};
        }
        if (input.empty()) {
            return {InferenceStatus::InvalidConfig, "empty input"};
        }
        if (state.values.size() != 2 * 2 * config_.lstmUnits) {
            return {InferenceStatus::InvalidConfig, "recurrent state has the wrong size"};
        }

        inputBuffer_.assign(input.begin(), input.end());
        std::array<int64_t, 3> inputShape{1, 1, static_cast<int64_t>(input.size())};
        std::array<int64_t, 4> stateShape{1, 2, static_cast<int64_t>(config_.lstmUnits), 2};

        std::array<Ort::Value, 2> inputs{
            Ort::Value::CreateTensor<float>(memoryInfo_, inputBuffer_.data(), inputBuffer_.size(),
                                            inputShape.data(), inputShape.size()),
            Ort::Value::CreateTensor<float>(memoryInfo_, state.values.data(), state.values.size(),
                                            stateShape.data(), stateShape.size())};

        try {
            auto outputs = session_->Run(Ort::RunOptions{nullptr}, inputNamePtrs_.data(),
                                         inputs.data(), inputs.size(), outputNamePtrs_.data(),
                                         outputNamePtrs_.size());
            if (outputs.size() < 2) {
                return {InferenceStatus::Error, "onnxruntime returned fewer than 2 outputs"};
            }
            InferenceResult copied = copyTensor(outputs[0], input.size(), output);
            if (!copied.ok()) {
                return copied;
            }
            std::vector<float> nextState;
            copied = copyTensor(outputs[1], state.values.size(), nextState);
            if (!copied.ok()) {
                return copied;
            }
            state.values.swap(nextState);
            return {InferenceStatus::Ok, ""};
        } catch (const Ort::Exception& e) {
            return {InferenceStatus::Error, e.what()};
        } catch (const std::exception& e) {
            return {InferenceStatus::Error, e.what()};
        }
    }

   private:
    void initialize() {
        if (modelPath_.empty()) {
            initError_ = stageName_ + ": model path is empty";
            return;
        }
        if (!std::filesystem::exists(modelPath_)) {
            initError_ = stageName_ + ": model does not exist: " + modelPath_;
            return;
        }

        std::string provider = toLower(config_.provider);
        std::string ortName = "CPUExecutionProvider";
        if (provider == "cuda") {
            ortName = "CUDAExecutionProvider";
        } else if (provider == "tensorrt") {
            ortName = "TensorrtExecutionProvider";
        }

        try {
            std::vector<std::string> available = Ort::GetAvailableProviders();
            if (std::find(available.begin(), available.end(), ortName) == available.end()) {
                initError_ = "Execution provider '" + ortName +
                             "' is not available in this onnxruntime build";
                return;
            }

            Ort::SessionOptions options;
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
            if (config_.intraOpThreads > 0) {
                options.SetIntraOpNumThreads(config_.intraOpThreads);
            }
            if (!appendProvider(options, provider)) {
                return;
            }

            session_ = std::make_unique<Ort::Session>(ortEnv(), modelPath_.c_str(), options);
            loadIoNames();
        } catch (const Ort::Exception& e) {
            initError_ = e.what();
            session_.reset();
        } catch (const std::exception& e) {
            initError_ = e.what();
            session_.reset();
        }
    }

    bool appendProvider(Ort::SessionOptions& options, const std::string& provider) {
        if (provider == "cpu") {
            return true;
        }

        OrtStatus* status = nullptr;
        if (provider == "cuda") {
#if ORT_API_VERSION >= 17
            OrtCUDAProviderOptions cudaOptions{};
            cudaOptions.device_id = 0;
            status =
                Ort::GetApi().SessionOptionsAppendExecutionProvider_CUDA(options, &cudaOptions);
#else
            status = Ort::GetApi().SessionOptionsAppendExecutionProvider_CUDA(options, 0);
#endif
            if (status) {
                initError_ = statusMessage(status, "CUDA provider init failed: ");
                return false;
            }
            return true;
        }

#if ORT_API_VERSION >= 17
        OrtTensorRTProviderOptions trtOptions{};
        trtOptions.device_id = 0;
        status = Ort::GetApi().SessionOptionsAppendExecutionProvider_TensorRT(options, &trtOptions);
#else
        status = Ort::GetApi().SessionOptionsAppendExecutionProvider_TensorRT(options, 0);
#endif
        if (status) {
            initError_ = statusMessage(status, "TensorRT provider init failed: ");
            return false;
        }
        return true;
    }

    void loadIoNames() {
        Ort::AllocatorWithDefaultOptions allocator;
        if (session_->GetInputCount() < 2 || session_->GetOutputCount() < 2) {
            initError_ = stageName_ + ": model must take (features, state) and return two outputs";
            session_.reset();
            return;
        }
        for (size_t i = 0; i < 2; ++i) {
            inputNames_.push_back(session_->GetInputNameAllocated(i, allocator).get());
            outputNames_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
        }
        for (size_t i = 0; i < 2; ++i) {
            inputNamePtrs_.push_back(inputNames_[i].c_str());
            outputNamePtrs_.push_back(outputNames_[i].c_str());
        }
        initError_.clear();
    }

    static InferenceResult copyTensor(const Ort::Value& value, size_t expected,
                                      std::vector<float>& out) {
        if (!value.IsTensor()) {
            return {InferenceStatus::Error, "ORT output is not a tensor"};
        }
        auto info = value.GetTensorTypeAndShapeInfo();
        auto count = static_cast<size_t>(info.GetElementCount());
        const float* data = value.GetTensorData<float>();
        if (!data || count != expected) {
            return {InferenceStatus::Error, "ORT output shape mismatch"};
        }
        out.assign(data, data + count);
        return {InferenceStatus::Ok, ""};
    }

    std::string stageName_;
    std::string modelPath_;
    core::AppConfig::DenoiserConfig::OrtConfig config_;
    Ort::MemoryInfo memoryInfo_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<std::string> inputNames_;
    std::vector<std::string> outputNames_;
    std::vector<const char*> inputNamePtrs_;
    std::vector<const char*> outputNamePtrs_;
    std::vector<float> inputBuffer_;
    std::string initError_;
};

#endif  // VOXCAP_ENABLE_ORT

InferenceStages bypassStages() {
    InferenceStages stages;
    stages.magnitude = createBypassMagnitudeStage();
    stages.refine = createBypassRefineStage();
    stages.backendName = "bypass";
    return stages;
}

}  // namespace

const char* inferenceStatusToString(InferenceStatus status) {
    switch (status) {
    case InferenceStatus::Ok:
        return "ok";
    case InferenceStatus::Unsupported:
        return "unsupported";
    case InferenceStatus::InvalidConfig:
        return "invalid_config";
    case InferenceStatus::Error:
    default:
        return "error";
    }
}

std::unique_ptr<InferenceStage> createBypassMagnitudeStage() {
    return std::make_unique<BypassMagnitudeStage>();
}

std::unique_ptr<InferenceStage> createBypassRefineStage() {
    return std::make_unique<BypassRefineStage>();
}

InferenceStages createInferenceStages(const core::AppConfig::DenoiserConfig& config) {
    if (config.backend != core::DenoiserBackend::Ort) {
        return bypassStages();
    }

#ifdef VOXCAP_ENABLE_ORT
    auto magnitude = std::make_unique<OrtInferenceStage>("magnitude", config.ort.magnitudeModelPath,
                                                         config.ort);
    auto refine =
        std::make_unique<OrtInferenceStage>("refine", config.ort.refineModelPath, config.ort);
    if (!magnitude->initError().empty() || !refine->initError().empty()) {
        LOG_ERROR("Denoiser: ORT backend unavailable ({}{}), using bypass",
                  magnitude->initError(), refine->initError());
        return bypassStages();
    }
    LOG_INFO("Denoiser: ORT backend ready (provider={}, units={})", config.ort.provider,
             config.ort.lstmUnits);
    InferenceStages stages;
    stages.magnitude = std::move(magnitude);
    stages.refine = std::move(refine);
    stages.backendName = "ort";
    return stages;
#else
    LOG_WARN(
        "Denoiser: ONNX Runtime backend is not enabled at build time (rebuild with "
        "VOXCAP_ENABLE_ORT=ON), using bypass");
    return bypassStages();
#endif
}

}  // namespace voxcap::denoiser
