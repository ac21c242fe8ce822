/**
 * @file fake_capture_source.h
 * @brief Scriptable CaptureSource for lifecycle and pipeline tests.
 *
 * Two modes:
 *   - manual: push() delivers a block synchronously on the caller's thread
 *   - generator: setGenerator() makes start() spawn a thread delivering blocks periodically
 */

#pragma once

#include "capture/capture_source.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxcap::testing {

class FakeCaptureSource : public capture::CaptureSource {
   public:
    using Generator = std::function<void(std::vector<float>& interleaved)>;

    ~FakeCaptureSource() override {
        stopThread();
    }

    const char* name() const override {
        return "fake";
    }

    capture::CaptureStartResult start(const capture::CaptureRequest& request,
                                      capture::CaptureCallback callback) override {
        capture::CaptureStartResult result;
        startCalls_.fetch_add(1);
        lastRequest_ = request;
        if (startFailures_.load() > 0) {
            startFailures_.fetch_sub(1);
            result.code = core::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE;
            result.message = "fake device unavailable";
            return result;
        }
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback_ = std::move(callback);
        }
        running_.store(true);
        if (generator_) {
            thread_ = std::thread([this]() { generatorLoop(); });
        }
        result.sampleRate = nativeRate_;
        result.channels = channels_;
        return result;
    }

    // Waits for an in-flight push() like a real source waits for its callback
    bool stop(std::chrono::milliseconds /*timeout*/) override {
        stopCalls_.fetch_add(1);
        if (stopHangs_.load()) {
            return false;
        }
        stopThread();
        std::lock_guard<std::mutex> lock(deliverMutex_);
        return stopResult_.load();
    }

    bool isRunning() const override {
        return running_.load();
    }

    void setErrorHandler(capture::CaptureErrorHandler handler) override {
        std::lock_guard<std::mutex> lock(errorMutex_);
        errorHandler_ = std::move(handler);
    }

    // Manual mode: delivers one interleaved block if running
    bool push(const std::vector<float>& interleaved) {
        return deliver(interleaved);
    }

    // Simulates a device failure reported from the capture thread
    void raiseError(core::ErrorCode code, const std::string& message) {
        running_.store(false);
        std::lock_guard<std::mutex> lock(errorMutex_);
        if (errorHandler_) {
            errorHandler_(code, message);
        }
    }

    void setFormat(uint32_t nativeRate, uint32_t channels) {
        nativeRate_ = nativeRate;
        channels_ = channels;
    }
    void setGenerator(Generator generator, std::chrono::milliseconds period) {
        generator_ = std::move(generator);
        period_ = period;
    }
    void failNextStarts(int count) {
        startFailures_.store(count);
    }
    void setStopResult(bool quiescent) {
        stopResult_.store(quiescent);
    }
    // Stop reports a timeout and the source keeps delivering
    void setStopHangs(bool hangs) {
        stopHangs_.store(hangs);
    }

    int startCalls() const {
        return startCalls_.load();
    }
    int stopCalls() const {
        return stopCalls_.load();
    }
    uint64_t blocksDelivered() const {
        return blocks_.load();
    }
    const capture::CaptureRequest& lastRequest() const {
        return lastRequest_;
    }

   private:
    bool deliver(const std::vector<float>& interleaved) {
        std::lock_guard<std::mutex> deliverLock(deliverMutex_);
        if (!running_.load()) {
            return false;
        }
        capture::CaptureCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            callback = callback_;
        }
        if (!callback) {
            return false;
        }
        callback(interleaved.data(), interleaved.size(), channels_, nativeRate_);
        blocks_.fetch_add(1);
        return true;
    }

    void generatorLoop() {
        std::vector<float> block;
        while (running_.load()) {
            block.clear();
            generator_(block);
            deliver(block);
            std::this_thread::sleep_for(period_);
        }
    }

    void stopThread() {
        running_.store(false);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint32_t nativeRate_ = 48000;
    uint32_t channels_ = 2;

    std::mutex deliverMutex_;
    std::mutex callbackMutex_;
    std::mutex errorMutex_;
    capture::CaptureCallback callback_;
    capture::CaptureErrorHandler errorHandler_;

    Generator generator_;
    std::chrono::milliseconds period_{10};
    std::thread thread_;

    std::atomic<bool> running_{false};
    std::atomic<int> startFailures_{0};
    std::atomic<bool> stopResult_{true};
    std::atomic<bool> stopHangs_{false};
    std::atomic<int> startCalls_{0};
    std::atomic<int> stopCalls_{0};
    std::atomic<uint64_t> blocks_{0};
    capture::CaptureRequest lastRequest_;
};

}  // namespace voxcap::testing
