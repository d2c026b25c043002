#include "audio/FFmpegSource.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstring>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace tunebox::audio {

namespace {
    std::string av_error_string(int code) {
        char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(code, errbuf, sizeof(errbuf));
        return errbuf;
    }
}

FFmpegSource::~FFmpegSource() {
    close();
}

bool FFmpegSource::fail(const std::string& what, int code) {
    error_ = code < 0 ? what + " (" + av_error_string(code) + ")" : what;
    util::Logger::error("FFmpegSource: " + error_);
    close();
    return false;
}

bool FFmpegSource::open(const std::string& filepath) {
    util::Logger::debug("FFmpegSource: Opening " + filepath);

    int ret = avformat_open_input(&format_ctx_, filepath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        format_ctx_ = nullptr;
        return fail("Failed to open " + filepath, ret);
    }

    ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) return fail("Failed to find stream info", ret);

    const AVCodec* codec = nullptr;
    stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (stream_index_ < 0 || !codec) return fail("No decodable audio stream in " + filepath);

    AVStream* stream = format_ctx_->streams[stream_index_];

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_) return fail("Failed to allocate codec context");

    ret = avcodec_parameters_to_context(codec_ctx_, stream->codecpar);
    if (ret < 0) return fail("Failed to copy codec parameters", ret);

    ret = avcodec_open2(codec_ctx_, codec, nullptr);
    if (ret < 0) return fail("Failed to open codec", ret);

    sample_rate_ = codec_ctx_->sample_rate;
    channels_ = codec_ctx_->ch_layout.nb_channels;
    if (sample_rate_ <= 0 || channels_ <= 0) return fail("Invalid stream format");

    if (stream->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<long>(stream->duration * av_q2d(stream->time_base) * sample_rate_);
    } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<long>(
            format_ctx_->duration / static_cast<double>(AV_TIME_BASE) * sample_rate_);
    } else {
        total_frames_ = 0;
    }

    // Planar or integer codec output -> interleaved float, same rate and layout
    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, channels_);
    ret = swr_alloc_set_opts2(&swr_ctx_,
                              &out_layout, AV_SAMPLE_FMT_FLT, sample_rate_,
                              &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, sample_rate_,
                              0, nullptr);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || !swr_ctx_) return fail("Failed to allocate resampler", ret);

    ret = swr_init(swr_ctx_);
    if (ret < 0) return fail("Failed to initialize resampler", ret);

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) return fail("Failed to allocate packet/frame");

    input_done_ = false;
    pending_.clear();
    pending_offset_ = 0;

    util::Logger::info("FFmpegSource: Opened - " + std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");
    return true;
}

void FFmpegSource::close() {
    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);

    pending_.clear();
    pending_offset_ = 0;
    stream_index_ = -1;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    input_done_ = false;
}

int FFmpegSource::drain_pending(float* buffer, int max_frames) {
    size_t available = (pending_.size() - pending_offset_) / channels_;
    int to_copy = static_cast<int>(std::min<size_t>(available, max_frames));
    if (to_copy <= 0) return 0;

    std::memcpy(buffer, pending_.data() + pending_offset_, sizeof(float) * to_copy * channels_);
    pending_offset_ += static_cast<size_t>(to_copy) * channels_;
    if (pending_offset_ >= pending_.size()) {
        pending_.clear();
        pending_offset_ = 0;
    }
    return to_copy;
}

int FFmpegSource::read(float* buffer, int max_frames) {
    if (!format_ctx_ || !codec_ctx_ || !buffer || max_frames <= 0) return 0;

    int written = drain_pending(buffer, max_frames);

    while (written < max_frames) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret == AVERROR_EOF) break;

        if (ret == AVERROR(EAGAIN)) {
            if (input_done_) break;

            ret = av_read_frame(format_ctx_, packet_);
            if (ret < 0) {
                // Flush the decoder so buffered frames come out
                input_done_ = true;
                avcodec_send_packet(codec_ctx_, nullptr);
                continue;
            }
            if (packet_->stream_index == stream_index_) {
                ret = avcodec_send_packet(codec_ctx_, packet_);
                if (ret < 0) {
                    util::Logger::warn("FFmpegSource: Dropping bad packet (" + av_error_string(ret) + ")");
                }
            }
            av_packet_unref(packet_);
            continue;
        }

        if (ret < 0) {
            error_ = "Decode error (" + av_error_string(ret) + ")";
            util::Logger::error("FFmpegSource: " + error_);
            break;
        }

        int out_capacity = swr_get_out_samples(swr_ctx_, frame_->nb_samples);
        if (out_capacity <= 0) out_capacity = frame_->nb_samples;
        std::vector<float> converted(static_cast<size_t>(out_capacity) * channels_);
        uint8_t* out_ptr = reinterpret_cast<uint8_t*>(converted.data());

        int got = swr_convert(swr_ctx_, &out_ptr, out_capacity,
                              const_cast<const uint8_t**>(frame_->extended_data),
                              frame_->nb_samples);
        av_frame_unref(frame_);
        if (got <= 0) continue;

        converted.resize(static_cast<size_t>(got) * channels_);
        int to_copy = std::min(got, max_frames - written);
        std::memcpy(buffer + static_cast<size_t>(written) * channels_, converted.data(),
                    sizeof(float) * to_copy * channels_);
        written += to_copy;

        if (to_copy < got) {
            pending_.assign(converted.begin() + static_cast<long>(to_copy) * channels_, converted.end());
            pending_offset_ = 0;
        }
    }

    return written;
}

bool FFmpegSource::seek_frame(long frame) {
    if (!format_ctx_ || stream_index_ < 0) return false;

    AVStream* stream = format_ctx_->streams[stream_index_];
    int64_t timestamp = av_rescale_q(frame, AVRational{1, sample_rate_}, stream->time_base);

    int ret = av_seek_frame(format_ctx_, stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        error_ = "Seek failed (" + av_error_string(ret) + ")";
        util::Logger::warn("FFmpegSource: " + error_);
        return false;
    }

    avcodec_flush_buffers(codec_ctx_);
    pending_.clear();
    pending_offset_ = 0;
    input_done_ = false;
    return true;
}

}  // namespace tunebox::audio
