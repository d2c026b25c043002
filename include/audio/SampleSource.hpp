#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tunebox::audio {

// Decoded stream of interleaved float frames at a fixed rate and channel
// count. Finite and non-restartable except through seek().
class SampleSource {
public:
    virtual ~SampleSource() = default;

    virtual bool open(const std::string& filepath) = 0;
    virtual void close() = 0;

    // Fills up to max_frames interleaved frames; 0 means end of stream.
    virtual int read(float* buffer, int max_frames) = 0;

    virtual int sample_rate() const = 0;
    virtual int channels() const = 0;
    virtual long total_frames() const = 0;  // 0 when unknown
    virtual bool is_open() const = 0;

    // May land near the target rather than on it, depending on the codec.
    virtual bool seek_frame(long frame) = 0;

    virtual const std::string& last_error() const { return error_; }

    bool seek(double seconds) {
        if (sample_rate() <= 0) return false;
        if (seconds < 0.0) seconds = 0.0;
        return seek_frame(static_cast<long>(seconds * sample_rate()));
    }

    std::optional<double> total_duration() const {
        if (sample_rate() <= 0 || total_frames() <= 0) return std::nullopt;
        return static_cast<double>(total_frames()) / sample_rate();
    }

protected:
    std::string error_;
};

struct OpenResult {
    std::unique_ptr<SampleSource> source;
    std::string error;

    explicit operator bool() const { return source != nullptr; }
};

// Picks the codec by file extension and opens the file.
OpenResult open_sample_source(const std::string& path);

}  // namespace tunebox::audio
