#pragma once

#include "recording/recording_types.h"

#include <filesystem>
#include <mutex>
#include <sndfile.h>
#include <string>
#include <vector>

namespace voxcap::output {

// RAII wrapper over a libsndfile handle writing mono 32-bit float WAV
class WavWriter {
   public:
    WavWriter() = default;
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::filesystem::path& path, int sampleRate, int channels = 1);
    bool writeFrames(const float* data, sf_count_t frames);
    void close();

    bool isOpen() const {
        return file_ != nullptr;
    }

   private:
    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
};

bool writeWavFile(const std::filesystem::path& path, const std::vector<float>& samples,
                  uint32_t sampleRate);

/**
 * Writes every finished recording into outputDirectory as
 * voxcap_<YYYYmmdd>_<HHMMSS>_<ms>.wav. Empty recordings are skipped.
 */
class WavEncoder : public recording::RecordingSink {
   public:
    explicit WavEncoder(std::filesystem::path outputDirectory);

    const char* name() const override {
        return "wav";
    }

    bool onRecordingComplete(const recording::CompletedRecording& recording) override;

    std::filesystem::path lastWrittenPath() const;

   private:
    std::filesystem::path nextFilePath() const;

    std::filesystem::path outputDirectory_;
    mutable std::mutex mutex_;
    std::filesystem::path lastWritten_;
};

}  // namespace voxcap::output
