#pragma once

#include "audio/SampleSource.hpp"
#include <mpg123.h>

namespace tunebox::audio {

// mpg123_init() must run once per process before any handle is created.
void ensure_mpg123_initialized();

class Mpg123Source : public SampleSource {
public:
    Mpg123Source();
    ~Mpg123Source() override;

    [[nodiscard]] bool open(const std::string& filepath) override;
    void close() override;

    [[nodiscard]] int read(float* buffer, int max_frames) override;

    [[nodiscard]] int sample_rate() const override { return sample_rate_; }
    [[nodiscard]] int channels() const override { return channels_; }
    [[nodiscard]] long total_frames() const override { return total_frames_; }
    [[nodiscard]] bool is_open() const override { return opened_; }

    [[nodiscard]] bool seek_frame(long frame) override;

private:
    mpg123_handle* handle_ = nullptr;
    bool opened_ = false;
    int sample_rate_ = 0;
    int channels_ = 0;
    long total_frames_ = 0;
};

}  // namespace tunebox::audio
