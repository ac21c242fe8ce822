#include "pipeline/capture_pipeline.h"

#include "logging/logger.h"

#include <chrono>
#include <exception>

namespace voxcap::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

// Generous enough for a 100 ms period at 192 kHz without reallocating in the callback
constexpr std::size_t kScratchReserve = 32768;

uint64_t elapsedNanos(Clock::time_point start) {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
}

// Rate changes reconfigure on the capture thread; only grow when the new rate needs it
void ensureCapacity(std::vector<float>& scratch, std::size_t required) {
    if (scratch.capacity() < required) {
        scratch.reserve(required);
    }
}

}  // namespace

CapturePipeline::CapturePipeline(const core::AppConfig& config, denoiser::InferenceStages stages)
    : config_(config),
      targetRate_(config.pipeline.targetSampleRate),
      backendName_(stages.backendName),
      mixer_(config.mixer.stereoCompensation, config.mixer.multichannelPolicy),
      preprocessing_(config.preprocessing),
      denoiser_(std::make_unique<denoiser::NoiseSuppressor>(
          std::move(stages.magnitude), std::move(stages.refine), config.denoiser.frameSize,
          config.denoiser.hopSize)),
      agc_(config.agc, config.pipeline.targetSampleRate) {
    denoiser_->setEnabled(config.denoiser.enabled);
    buffer_.init(static_cast<std::size_t>(config.recording.maxDurationSeconds) * targetRate_);
    diagnostics_.setOutputSampleRate(targetRate_);
    LOG_INFO("CapturePipeline: target={} Hz buffer={} s denoiser={} ({}) agc={}", targetRate_,
             config.recording.maxDurationSeconds, config.denoiser.enabled ? "on" : "off",
             backendName_, config.agc.enabled ? "on" : "off");
}

void CapturePipeline::prepare(uint32_t nativeRate) {
    configureRate(nativeRate);
    resetAll();
}

void CapturePipeline::configureRate(uint32_t nativeRate) {
    preprocessing_.configure(nativeRate);
    resampler_.configure(nativeRate, targetRate_, config_.resampler.chunkFrames,
                         config_.resampler.zeroCrossings);
    nativeRate_.store(nativeRate, std::memory_order_release);

    ensureCapacity(mono_, kScratchReserve);
    ensureCapacity(preprocessed_, kScratchReserve);
    ensureCapacity(resampled_, kScratchReserve + resampler_.maxOutputPerChunk());
    ensureCapacity(denoised_, kScratchReserve + resampler_.maxOutputPerChunk());
}

void CapturePipeline::setBufferFullHandler(BufferFullHandler handler) {
    std::lock_guard<std::mutex> lock(bufferFullMutex_);
    bufferFullHandler_ = std::move(handler);
}

void CapturePipeline::resetStages() {
    preprocessing_.reset();
    resampler_.reset();
    denoiser_->reset();
    agc_.reset();
}

void CapturePipeline::resetAll() {
    resetStages();
    buffer_.clear();
    diagnostics_.reset();
    diagnostics_.setOutputSampleRate(targetRate_);
    bufferFullNotified_.store(false, std::memory_order_release);
}

void CapturePipeline::onAudio(const float* samples, std::size_t sampleCount,
                              std::size_t channelCount, uint32_t nativeRate) noexcept {
    try {
        diagnostics_.recordCallback();
        if (samples == nullptr || sampleCount == 0 || channelCount == 0 || nativeRate == 0) {
            return;
        }

        if (nativeRate != nativeRate_.load(std::memory_order_relaxed)) {
            LOG_EVERY_N(WARN, 100, "CapturePipeline: device delivers {} Hz, reconfiguring",
                        nativeRate);
            configureRate(nativeRate);
            resetStages();
        }

        auto start = Clock::now();
        try {
            mixer_.process(samples, sampleCount, channelCount, mono_);
        } catch (const std::exception& e) {
            diagnostics_.recordStageError();
            LOG_EVERY_N(ERROR, 200, "CapturePipeline: mix stage failed: {}", e.what());
            mono_.assign(sampleCount / channelCount, 0.0f);
        }
        diagnostics_.recordStageTime(metrics::PipelineStage::Mix, elapsedNanos(start));
        diagnostics_.recordInput(mono_.data(), mono_.size());

        start = Clock::now();
        preprocessed_.assign(mono_.begin(), mono_.end());
        try {
            preprocessing_.process(preprocessed_.data(), preprocessed_.size());
        } catch (const std::exception& e) {
            diagnostics_.recordStageError();
            LOG_EVERY_N(ERROR, 200, "CapturePipeline: preprocessing failed: {}", e.what());
            preprocessed_.assign(mono_.begin(), mono_.end());
        }
        diagnostics_.recordStageTime(metrics::PipelineStage::Preprocess, elapsedNanos(start));

        start = Clock::now();
        resampled_.clear();
        try {
            resampler_.process(preprocessed_.data(), preprocessed_.size(), resampled_);
        } catch (const std::exception& e) {
            diagnostics_.recordStageError();
            LOG_EVERY_N(ERROR, 200, "CapturePipeline: resampler failed, muting block: {}",
                        e.what());
            std::size_t expected = static_cast<std::size_t>(
                static_cast<uint64_t>(preprocessed_.size()) * targetRate_ / nativeRate);
            resampled_.assign(expected, 0.0f);
        }
        diagnostics_.recordStageTime(metrics::PipelineStage::Resample, elapsedNanos(start));

        runTargetRateStages(resampled_, false);
    } catch (const std::exception& e) {
        diagnostics_.recordStageError();
        LOG_EVERY_N(ERROR, 200, "CapturePipeline: callback failed: {}", e.what());
    }
}

std::size_t CapturePipeline::runTargetRateStages(std::vector<float>& resampled,
                                                 bool flushDenoiser) {
    auto start = Clock::now();
    denoised_.clear();
    try {
        denoiser_->process(resampled.data(), resampled.size(), denoised_);
        if (flushDenoiser) {
            denoiser_->flush(denoised_);
        }
    } catch (const std::exception& e) {
        diagnostics_.recordStageError();
        LOG_EVERY_N(ERROR, 200, "CapturePipeline: denoiser failed, passing through: {}", e.what());
        denoised_.assign(resampled.begin(), resampled.end());
    }
    diagnostics_.recordStageTime(metrics::PipelineStage::Denoise, elapsedNanos(start));

    start = Clock::now();
    // resampled is no longer needed; keep the pre-AGC block for pass-through
    resampled.assign(denoised_.begin(), denoised_.end());
    try {
        agc_.process(denoised_.data(), denoised_.size());
    } catch (const std::exception& e) {
        diagnostics_.recordStageError();
        LOG_EVERY_N(ERROR, 200, "CapturePipeline: AGC failed, passing through: {}", e.what());
        denoised_.swap(resampled);
    }
    diagnostics_.recordStageTime(metrics::PipelineStage::Agc, elapsedNanos(start));
    diagnostics_.setAppliedGainDb(agc_.currentGainDb());
    diagnostics_.recordOutput(denoised_.data(), denoised_.size());

    start = Clock::now();
    appendToBuffer(denoised_.data(), denoised_.size());
    diagnostics_.recordStageTime(metrics::PipelineStage::Buffer, elapsedNanos(start));
    return denoised_.size();
}

void CapturePipeline::appendToBuffer(const float* data, std::size_t count) {
    if (count == 0) {
        return;
    }
    buffer_.append(data, count);
    if (!buffer_.full()) {
        return;
    }
    diagnostics_.setDroppedSamples(buffer_.droppedSamples());
    if (!bufferFullNotified_.exchange(true, std::memory_order_acq_rel)) {
        LOG_WARN("CapturePipeline: capture buffer full ({} samples), further audio is dropped",
                 buffer_.capacity());
        // Handlers only queue work, so holding the lock here is brief
        std::lock_guard<std::mutex> lock(bufferFullMutex_);
        if (bufferFullHandler_) {
            bufferFullHandler_();
        }
    }
}

std::size_t CapturePipeline::flush() {
    resampled_.clear();
    try {
        resampler_.flush(resampled_);
    } catch (const std::exception& e) {
        diagnostics_.recordStageError();
        LOG_ERROR("CapturePipeline: resampler flush failed: {}", e.what());
        resampled_.clear();
    }
    std::size_t produced = runTargetRateStages(resampled_, true);
    LOG_DEBUG("CapturePipeline: flushed {} tail samples", produced);
    return produced;
}

std::vector<float> CapturePipeline::drain() {
    return buffer_.drainAll();
}

void CapturePipeline::clearBuffer() {
    buffer_.clear();
}

}  // namespace voxcap::pipeline
