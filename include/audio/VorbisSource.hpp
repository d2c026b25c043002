#pragma once

#include "audio/SampleSource.hpp"
#include <vorbis/vorbisfile.h>

namespace tunebox::audio {

class VorbisSource : public SampleSource {
public:
    VorbisSource();
    ~VorbisSource() override;

    [[nodiscard]] bool open(const std::string& filepath) override;
    void close() override;

    [[nodiscard]] int read(float* buffer, int max_frames) override;

    [[nodiscard]] int sample_rate() const override { return sample_rate_; }
    [[nodiscard]] int channels() const override { return channels_; }
    [[nodiscard]] long total_frames() const override { return total_frames_; }
    [[nodiscard]] bool is_open() const override { return is_open_; }

    [[nodiscard]] bool seek_frame(long frame) override;

private:
    OggVorbis_File vf_{};
    bool is_open_ = false;
    int sample_rate_ = 0;
    int channels_ = 0;
    long total_frames_ = 0;
};

}  // namespace tunebox::audio
