#pragma once

#include "audio/CaptureSource.hpp"
#include <memory>

namespace tunebox::audio {

// Audio device owned exclusively by the playback engine. The device pulls
// frames from the attached CaptureSource on its own schedule.
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    // Connects to the device. False means no audio is possible at all.
    [[nodiscard]] virtual bool init() = 0;

    // Replaces whatever was playing and starts pulling from source.
    [[nodiscard]] virtual bool start(std::shared_ptr<CaptureSource> source) = 0;
    virtual void stop() = 0;
    virtual void pause(bool paused) = 0;

    virtual void set_volume(float volume) = 0;
    virtual void set_speed(float speed) = 0;

    [[nodiscard]] virtual bool seek(double seconds) = 0;

    // True when nothing is attached, or the source ran dry and everything
    // queued on the device has been played.
    [[nodiscard]] virtual bool empty() const = 0;
};

}  // namespace tunebox::audio
