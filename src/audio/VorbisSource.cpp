#include "audio/VorbisSource.hpp"
#include "util/Logger.hpp"
#include <cstring>

namespace tunebox::audio {

VorbisSource::VorbisSource() {
    std::memset(&vf_, 0, sizeof(vf_));
}

VorbisSource::~VorbisSource() {
    close();
}

bool VorbisSource::open(const std::string& filepath) {
    util::Logger::debug("VorbisSource: Opening " + filepath);

    int result = ov_fopen(filepath.c_str(), &vf_);
    if (result < 0) {
        error_ = "not a readable Ogg Vorbis stream (code " + std::to_string(result) + ")";
        util::Logger::error("VorbisSource: " + error_ + ": " + filepath);
        return false;
    }
    is_open_ = true;

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info || info->channels <= 0) {
        error_ = "missing stream info";
        util::Logger::error("VorbisSource: " + error_ + " in " + filepath);
        close();
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    ogg_int64_t total = ov_pcm_total(&vf_, -1);
    total_frames_ = total > 0 ? static_cast<long>(total) : 0;

    util::Logger::info("VorbisSource: Opened - " + std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");
    return true;
}

void VorbisSource::close() {
    if (is_open_) {
        ov_clear(&vf_);
        is_open_ = false;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
}

int VorbisSource::read(float* buffer, int max_frames) {
    if (!is_open_ || !buffer) return 0;

    float** pcm = nullptr;
    int section = 0;
    int frames_read = 0;

    while (frames_read < max_frames) {
        long ret = ov_read_float(&vf_, &pcm, max_frames - frames_read, &section);
        if (ret == OV_HOLE) continue;  // Recoverable gap in the stream
        if (ret <= 0) break;

        // vorbisfile hands out planar data
        for (long i = 0; i < ret; ++i) {
            for (int ch = 0; ch < channels_; ++ch) {
                buffer[(frames_read + i) * channels_ + ch] = pcm[ch][i];
            }
        }
        frames_read += static_cast<int>(ret);
    }

    return frames_read;
}

bool VorbisSource::seek_frame(long frame) {
    if (!is_open_) return false;

    int result = ov_pcm_seek(&vf_, static_cast<ogg_int64_t>(frame));
    if (result != 0) {
        error_ = "ov_pcm_seek failed (code " + std::to_string(result) + ")";
        util::Logger::warn("VorbisSource: " + error_);
        return false;
    }
    return true;
}

}  // namespace tunebox::audio
