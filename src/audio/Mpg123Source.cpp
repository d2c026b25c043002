#include "audio/Mpg123Source.hpp"
#include "util/Logger.hpp"
#include <mutex>

namespace tunebox::audio {

void ensure_mpg123_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { mpg123_init(); });
}

Mpg123Source::Mpg123Source() {
    ensure_mpg123_initialized();
    int err = MPG123_OK;
    handle_ = mpg123_new(nullptr, &err);
    if (!handle_) {
        error_ = mpg123_plain_strerror(err);
        util::Logger::error("Mpg123Source: mpg123_new failed (" + error_ + ")");
    }
}

Mpg123Source::~Mpg123Source() {
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
}

bool Mpg123Source::open(const std::string& filepath) {
    util::Logger::debug("Mpg123Source: Opening " + filepath);

    if (!handle_) {
        if (error_.empty()) error_ = "decoder unavailable";
        return false;
    }

    // Decode straight to 32-bit float so no conversion pass is needed
    mpg123_param(handle_, MPG123_ADD_FLAGS, MPG123_FORCE_FLOAT, 0.0);

    if (mpg123_open(handle_, filepath.c_str()) != MPG123_OK) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("Mpg123Source: Failed to open " + filepath + " (" + error_ + ")");
        return false;
    }
    opened_ = true;

    long rate = 0;
    int channels = 0, encoding = 0;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("Mpg123Source: Failed to read format of " + filepath);
        close();
        return false;
    }

    // Lock the output format so it cannot change mid-stream
    mpg123_format_none(handle_);
    if (mpg123_format(handle_, rate, channels, MPG123_ENC_FLOAT_32) != MPG123_OK) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("Mpg123Source: Float output not supported for " + filepath);
        close();
        return false;
    }

    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;

    mpg123_scan(handle_);
    off_t length = mpg123_length(handle_);
    total_frames_ = (length == MPG123_ERR) ? 0 : static_cast<long>(length);

    util::Logger::info("Mpg123Source: Opened - " + std::to_string(sample_rate_) + "Hz, " +
                       std::to_string(channels_) + "ch, " +
                       std::to_string(total_frames_) + " frames");
    return true;
}

void Mpg123Source::close() {
    if (handle_ && opened_) {
        mpg123_close(handle_);
    }
    opened_ = false;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
}

int Mpg123Source::read(float* buffer, int max_frames) {
    if (!opened_ || !buffer || max_frames <= 0 || channels_ <= 0) return 0;

    size_t wanted = static_cast<size_t>(max_frames) * channels_ * sizeof(float);
    size_t bytes_read = 0;
    int result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer), wanted, &bytes_read);

    if (result == MPG123_NEW_FORMAT) {
        // Format was locked in open(); the notification carries no data
        result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer), wanted, &bytes_read);
    }

    if (result == MPG123_ERR) {
        error_ = mpg123_strerror(handle_);
        util::Logger::error("Mpg123Source: Read error (" + error_ + ")");
        return 0;
    }

    return static_cast<int>(bytes_read / (sizeof(float) * channels_));
}

bool Mpg123Source::seek_frame(long frame) {
    if (!opened_) return false;

    off_t result = mpg123_seek(handle_, static_cast<off_t>(frame), SEEK_SET);
    if (result < 0) {
        error_ = mpg123_strerror(handle_);
        util::Logger::warn("Mpg123Source: Seek to frame " + std::to_string(frame) +
                           " failed (" + error_ + ")");
        return false;
    }
    return true;
}

}  // namespace tunebox::audio
