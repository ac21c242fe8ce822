#include "output/wav_encoder.h"

#include "logging/logger.h"

#include <chrono>
#include <ctime>
#include <system_error>

namespace voxcap::output {

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::filesystem::path& path, int sampleRate, int channels) {
    close();
    info_ = SF_INFO{};
    info_.samplerate = sampleRate;
    info_.channels = channels;
    info_.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    file_ = sf_open(path.string().c_str(), SFM_WRITE, &info_);
    if (!file_) {
        LOG_ERROR("WavWriter: cannot open {}: {}", path.string(), sf_strerror(nullptr));
        return false;
    }
    return true;
}

bool WavWriter::writeFrames(const float* data, sf_count_t frames) {
    if (!file_) {
        LOG_ERROR("WavWriter: file not opened");
        return false;
    }
    sf_count_t written = sf_writef_float(file_, data, frames);
    if (written != frames) {
        LOG_ERROR("WavWriter: expected to write {} frames, wrote {}", frames, written);
        return false;
    }
    return true;
}

void WavWriter::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

bool writeWavFile(const std::filesystem::path& path, const std::vector<float>& samples,
                  uint32_t sampleRate) {
    WavWriter writer;
    if (!writer.open(path, static_cast<int>(sampleRate), 1)) {
        return false;
    }
    bool ok = writer.writeFrames(samples.data(), static_cast<sf_count_t>(samples.size()));
    writer.close();
    return ok;
}

WavEncoder::WavEncoder(std::filesystem::path outputDirectory)
    : outputDirectory_(std::move(outputDirectory)) {}

std::filesystem::path WavEncoder::nextFilePath() const {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;
    std::tm local{};
    localtime_r(&seconds, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
    return outputDirectory_ / fmt::format("voxcap_{}_{:03d}.wav", stamp, millis);
}

bool WavEncoder::onRecordingComplete(const recording::CompletedRecording& recording) {
    if (recording.samples.empty()) {
        LOG_INFO("WavEncoder: empty recording, nothing written");
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDirectory_, ec);
    if (ec) {
        LOG_ERROR("WavEncoder: cannot create {}: {}", outputDirectory_.string(), ec.message());
        return false;
    }

    std::filesystem::path path = nextFilePath();
    if (!writeWavFile(path, recording.samples, recording.metadata.sampleRate)) {
        return false;
    }
    LOG_INFO("WavEncoder: wrote {} ({:.2f} s, stop reason {})", path.string(),
             recording.metadata.durationSeconds,
             recording::stopReasonToString(recording.metadata.stopReason));

    std::lock_guard<std::mutex> lock(mutex_);
    lastWritten_ = path;
    return true;
}

std::filesystem::path WavEncoder::lastWrittenPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastWritten_;
}

}  // namespace voxcap::output
