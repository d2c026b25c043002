#pragma once

#include "audio/SampleSource.hpp"
#include <sndfile.h>

namespace tunebox::audio {

// FLAC and WAV through libsndfile.
class SndfileSource : public SampleSource {
public:
    SndfileSource();
    ~SndfileSource() override;

    [[nodiscard]] bool open(const std::string& filepath) override;
    void close() override;

    [[nodiscard]] int read(float* buffer, int max_frames) override;

    [[nodiscard]] int sample_rate() const override { return info_.samplerate; }
    [[nodiscard]] int channels() const override { return info_.channels; }
    [[nodiscard]] long total_frames() const override { return static_cast<long>(info_.frames); }
    [[nodiscard]] bool is_open() const override { return file_ != nullptr; }

    [[nodiscard]] bool seek_frame(long frame) override;

private:
    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
};

}  // namespace tunebox::audio
