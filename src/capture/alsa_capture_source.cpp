#include "capture/alsa_capture_source.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace voxcap::capture {

namespace {

constexpr int kWaitTimeoutMs = 100;

struct OpenedDevice {
    snd_pcm_t* handle = nullptr;
    snd_pcm_format_t format = SND_PCM_FORMAT_UNKNOWN;
    unsigned int rate = 0;
    unsigned int channels = 0;
    snd_pcm_uframes_t periodFrames = 0;
    std::string error;
};

OpenedDevice fail(snd_pcm_t* handle, std::string message) {
    if (handle) {
        snd_pcm_close(handle);
    }
    OpenedDevice result;
    result.error = std::move(message);
    return result;
}

OpenedDevice openCaptureDevice(const CaptureRequest& request) {
    snd_pcm_t* handle = nullptr;
    int err = snd_pcm_open(&handle, request.device.c_str(), SND_PCM_STREAM_CAPTURE,
                           SND_PCM_NONBLOCK);
    if (err < 0) {
        return fail(nullptr, "cannot open capture device " + request.device + ": " +
                                 snd_strerror(err));
    }

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(handle, hw_params);

    if ((err = snd_pcm_hw_params_set_access(handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) <
        0) {
        return fail(handle, std::string("cannot set interleaved access: ") + snd_strerror(err));
    }

    snd_pcm_format_t format = SND_PCM_FORMAT_UNKNOWN;
    for (snd_pcm_format_t candidate :
         {SND_PCM_FORMAT_FLOAT_LE, SND_PCM_FORMAT_S32_LE, SND_PCM_FORMAT_S16_LE}) {
        if (snd_pcm_hw_params_test_format(handle, hw_params, candidate) == 0) {
            format = candidate;
            break;
        }
    }
    if (format == SND_PCM_FORMAT_UNKNOWN ||
        (err = snd_pcm_hw_params_set_format(handle, hw_params, format)) < 0) {
        return fail(handle, "device supports none of FLOAT_LE/S32_LE/S16_LE");
    }

    unsigned int channels = std::max<uint32_t>(1, request.preferredChannels);
    if ((err = snd_pcm_hw_params_set_channels_near(handle, hw_params, &channels)) < 0) {
        return fail(handle, std::string("cannot set channels: ") + snd_strerror(err));
    }

    unsigned int rate = request.preferredSampleRate;
    if ((err = snd_pcm_hw_params_set_rate_near(handle, hw_params, &rate, nullptr)) < 0) {
        return fail(handle, std::string("cannot set rate: ") + snd_strerror(err));
    }

    snd_pcm_uframes_t periodFrames = std::max<uint32_t>(32, request.periodFrames);
    if ((err = snd_pcm_hw_params_set_period_size_near(handle, hw_params, &periodFrames, nullptr)) <
        0) {
        return fail(handle, std::string("cannot set period size: ") + snd_strerror(err));
    }
    snd_pcm_uframes_t bufferFrames = periodFrames * 4;
    if ((err = snd_pcm_hw_params_set_buffer_size_near(handle, hw_params, &bufferFrames)) < 0) {
        return fail(handle, std::string("cannot set buffer size: ") + snd_strerror(err));
    }

    if ((err = snd_pcm_hw_params(handle, hw_params)) < 0) {
        return fail(handle, std::string("cannot apply hardware parameters: ") + snd_strerror(err));
    }
    snd_pcm_hw_params_get_period_size(hw_params, &periodFrames, nullptr);
    snd_pcm_hw_params_get_buffer_size(hw_params, &bufferFrames);

    if ((err = snd_pcm_prepare(handle)) < 0) {
        return fail(handle, std::string("cannot prepare capture device: ") + snd_strerror(err));
    }
    if ((err = snd_pcm_start(handle)) < 0) {
        return fail(handle, std::string("cannot start capture device: ") + snd_strerror(err));
    }

    LOG_INFO("[Capture] Device {} configured ({}, {} Hz, {} ch, period {} frames, buffer {} frames)",
             request.device, snd_pcm_format_name(format), rate, channels, periodFrames,
             bufferFrames);

    OpenedDevice opened;
    opened.handle = handle;
    opened.format = format;
    opened.rate = rate;
    opened.channels = channels;
    opened.periodFrames = periodFrames;
    return opened;
}

bool isDeviceGone(snd_pcm_sframes_t err) {
    return err == -ENODEV || err == -EBADFD || err == -ESHUTDOWN || err == -EIO;
}

}  // namespace

bool convertPcmToFloat(const void* src, snd_pcm_format_t format, size_t frames,
                       unsigned int channels, std::vector<float>& dst) {
    const size_t samples = frames * static_cast<size_t>(channels);
    dst.resize(samples);

    if (format == SND_PCM_FORMAT_FLOAT_LE) {
        std::memcpy(dst.data(), src, samples * sizeof(float));
        return true;
    }

    if (format == SND_PCM_FORMAT_S16_LE) {
        const auto* in = static_cast<const int16_t*>(src);
        constexpr float scale = 1.0f / 32768.0f;
        for (size_t i = 0; i < samples; ++i) {
            dst[i] = static_cast<float>(in[i]) * scale;
        }
        return true;
    }

    if (format == SND_PCM_FORMAT_S32_LE) {
        const auto* in = static_cast<const int32_t*>(src);
        constexpr float scale = 1.0f / 2147483648.0f;
        for (size_t i = 0; i < samples; ++i) {
            dst[i] = static_cast<float>(in[i]) * scale;
        }
        return true;
    }

    return false;
}

AlsaCaptureSource::~AlsaCaptureSource() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AlsaCaptureSource::setErrorHandler(CaptureErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    errorHandler_ = std::move(handler);
}

bool AlsaCaptureSource::isRunning() const {
    return running_.load(std::memory_order_acquire);
}

void AlsaCaptureSource::reportError(core::ErrorCode code, const std::string& message) {
    // Held across the call so setErrorHandler() waits for it to return
    std::lock_guard<std::mutex> lock(handlerMutex_);
    if (errorHandler_) {
        errorHandler_(code, message);
    }
}

void AlsaCaptureSource::joinIfFinished() {
    bool finished;
    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        finished = finished_;
    }
    if (finished && thread_.joinable()) {
        thread_.join();
    }
}

CaptureStartResult AlsaCaptureSource::start(const CaptureRequest& request,
                                            CaptureCallback callback) {
    CaptureStartResult result;
    joinIfFinished();
    if (running_.load(std::memory_order_acquire) || thread_.joinable()) {
        result.code = core::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE;
        result.message = "capture thread still active";
        return result;
    }

    OpenedDevice device = openCaptureDevice(request);
    if (!device.handle) {
        LOG_ERROR("[Capture] {}", device.error);
        result.code = core::ErrorCode::CAPTURE_DEVICE_UNAVAILABLE;
        result.message = device.error;
        return result;
    }

    callback_ = std::move(callback);
    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        finished_ = false;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&AlsaCaptureSource::captureLoop, this, device.handle, device.format,
                          device.rate, device.channels, device.periodFrames);

    result.sampleRate = device.rate;
    result.channels = device.channels;
    return result;
}

bool AlsaCaptureSource::stop(std::chrono::milliseconds timeout) {
    running_.store(false, std::memory_order_release);
    if (!thread_.joinable()) {
        return true;
    }
    std::unique_lock<std::mutex> lock(threadMutex_);
    if (!finishedCv_.wait_for(lock, timeout, [this]() { return finished_; })) {
        LOG_WARN("[Capture] Capture thread still busy after {} ms", timeout.count());
        return false;
    }
    lock.unlock();
    thread_.join();
    return true;
}

void AlsaCaptureSource::captureLoop(snd_pcm_t* handle, snd_pcm_format_t format,
                                    unsigned int rate, unsigned int channels,
                                    snd_pcm_uframes_t periodFrames) {
    const size_t bytesPerSample = static_cast<size_t>(snd_pcm_format_physical_width(format)) / 8;
    std::vector<uint8_t> raw(static_cast<size_t>(periodFrames) * channels * bytesPerSample);
    std::vector<float> floatBuffer(static_cast<size_t>(periodFrames) * channels);
    bool deviceLost = false;
    std::string lostReason;

    while (running_.load(std::memory_order_acquire)) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle, raw.data(), periodFrames);
        if (frames == -EAGAIN || frames == 0) {
            int ret = snd_pcm_wait(handle, kWaitTimeoutMs);
            if (ret < 0 && isDeviceGone(ret)) {
                deviceLost = true;
                lostReason = snd_strerror(ret);
                break;
            }
            continue;
        }
        if (frames == -EPIPE) {
            LOG_EVERY_N(WARN, 50, "[Capture] Overrun detected, recovering");
            snd_pcm_prepare(handle);
            snd_pcm_start(handle);
            continue;
        }
        if (frames < 0) {
            if (isDeviceGone(frames) || snd_pcm_recover(handle, static_cast<int>(frames), 1) < 0) {
                deviceLost = true;
                lostReason = snd_strerror(static_cast<int>(frames));
                break;
            }
            continue;
        }

        if (!convertPcmToFloat(raw.data(), format, static_cast<size_t>(frames), channels,
                               floatBuffer)) {
            LOG_ERROR("[Capture] Unsupported format during conversion");
            break;
        }
        if (callback_) {
            callback_(floatBuffer.data(), static_cast<size_t>(frames) * channels, channels, rate);
        }
    }

    snd_pcm_drop(handle);
    snd_pcm_close(handle);
    running_.store(false, std::memory_order_release);
    LOG_INFO("[Capture] Capture thread terminated");

    if (deviceLost) {
        LOG_ERROR("[Capture] Device lost: {}", lostReason);
        reportError(core::ErrorCode::CAPTURE_DEVICE_DISCONNECTED, lostReason);
    }

    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        finished_ = true;
    }
    finishedCv_.notify_all();
}

}  // namespace voxcap::capture
