#pragma once

#include "audio/SampleSource.hpp"
#include <vector>

struct AVFormatContext;
struct AVCodecContext;
struct AVPacket;
struct AVFrame;
struct SwrContext;

namespace tunebox::audio {

// M4A/AAC (and anything else libavformat recognizes) decoded to interleaved float.
class FFmpegSource : public SampleSource {
public:
    FFmpegSource() = default;
    ~FFmpegSource() override;

    [[nodiscard]] bool open(const std::string& filepath) override;
    void close() override;

    [[nodiscard]] int read(float* buffer, int max_frames) override;

    [[nodiscard]] int sample_rate() const override { return sample_rate_; }
    [[nodiscard]] int channels() const override { return channels_; }
    [[nodiscard]] long total_frames() const override { return total_frames_; }
    [[nodiscard]] bool is_open() const override { return format_ctx_ != nullptr; }

    [[nodiscard]] bool seek_frame(long frame) override;

private:
    bool fail(const std::string& what, int code = 0);
    int drain_pending(float* buffer, int max_frames);

    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    SwrContext* swr_ctx_ = nullptr;

    int stream_index_ = -1;
    int sample_rate_ = 0;
    int channels_ = 0;
    long total_frames_ = 0;
    bool input_done_ = false;

    // Converted frames that did not fit in the caller's buffer
    std::vector<float> pending_;
    size_t pending_offset_ = 0;
};

}  // namespace tunebox::audio
