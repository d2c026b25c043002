#include "audio/SndfileSource.hpp"
#include "util/Logger.hpp"
#include <cstring>

namespace tunebox::audio {

SndfileSource::SndfileSource() {
    std::memset(&info_, 0, sizeof(info_));
}

SndfileSource::~SndfileSource() {
    close();
}

bool SndfileSource::open(const std::string& filepath) {
    util::Logger::debug("SndfileSource: Opening " + filepath);

    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open(filepath.c_str(), SFM_READ, &info_);
    if (!file_) {
        error_ = sf_strerror(nullptr);
        util::Logger::error("SndfileSource: Failed to open " + filepath + " (" + error_ + ")");
        return false;
    }
    if (info_.channels <= 0 || info_.samplerate <= 0) {
        error_ = "invalid stream format";
        util::Logger::error("SndfileSource: " + error_ + " in " + filepath);
        close();
        return false;
    }

    util::Logger::info("SndfileSource: Opened - " + std::to_string(info_.samplerate) + "Hz, " +
                       std::to_string(info_.channels) + "ch, " +
                       std::to_string(info_.frames) + " frames");
    return true;
}

void SndfileSource::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

int SndfileSource::read(float* buffer, int max_frames) {
    if (!file_ || !buffer || max_frames <= 0) return 0;
    sf_count_t frames = sf_readf_float(file_, buffer, max_frames);
    return frames > 0 ? static_cast<int>(frames) : 0;
}

bool SndfileSource::seek_frame(long frame) {
    if (!file_) return false;

    if (sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET) < 0) {
        error_ = sf_strerror(file_);
        util::Logger::warn("SndfileSource: Seek to frame " + std::to_string(frame) +
                           " failed (" + error_ + ")");
        return false;
    }
    return true;
}

}  // namespace tunebox::audio
