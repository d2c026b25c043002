#pragma once

#include "audio/CaptureSource.hpp"
#include "model/Track.hpp"
#include "util/BoundedChannel.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace tunebox::engine {

struct PlaybackCommand {
    enum class Type {
        Play,
        Pause,
        Resume,
        Stop,
        Seek,
        SetVolume,
        SetSpeed,
    };
    Type type;
    model::Track track;      // Play
    double position = 0.0;   // Seek, seconds
    float value = 0.0f;      // SetVolume (0..1) / SetSpeed (multiplier)
    uint64_t generation = 0; // Play: echoed back on every event until the next Play

    static PlaybackCommand play(model::Track track, uint64_t generation = 0) {
        PlaybackCommand cmd{Type::Play};
        cmd.track = std::move(track);
        cmd.generation = generation;
        return cmd;
    }
    static PlaybackCommand seek(double seconds) {
        PlaybackCommand cmd{Type::Seek};
        cmd.position = seconds;
        return cmd;
    }
    static PlaybackCommand set_volume(float volume) {
        PlaybackCommand cmd{Type::SetVolume};
        cmd.value = volume;
        return cmd;
    }
    static PlaybackCommand set_speed(float speed) {
        PlaybackCommand cmd{Type::SetSpeed};
        cmd.value = speed;
        return cmd;
    }
};

struct PlaybackEvent {
    enum class Type {
        Playing,
        Progress,
        TrackFinished,
        Error,
    };
    Type type;
    double seconds = 0.0;    // Playing: duration (0 if unknown), Progress: position
    std::string message;     // Error
    uint64_t generation = 0; // of the Play this event belongs to
};

using CommandChannel = util::BoundedChannel<PlaybackCommand>;
using EventChannel = util::BoundedChannel<PlaybackEvent>;

// The three queues between the engine and the rest of the player.
struct EngineChannels {
    std::shared_ptr<CommandChannel> commands;
    std::shared_ptr<EventChannel> events;
    std::shared_ptr<audio::SampleChannel> samples;

    static EngineChannels create(size_t command_capacity = 32,
                                 size_t event_capacity = 64,
                                 size_t sample_capacity = 4) {
        return EngineChannels{
            std::make_shared<CommandChannel>(command_capacity),
            std::make_shared<EventChannel>(event_capacity),
            std::make_shared<audio::SampleChannel>(sample_capacity),
        };
    }
};

}  // namespace tunebox::engine
