#pragma once

#include "audio/AudioOutput.hpp"
#include "audio/CaptureSource.hpp"
#include "engine/PlaybackTypes.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

namespace tunebox::engine {

// Owns the output device and the decode pipeline. run() is the worker
// body: it consumes commands, and every ~33 ms reports progress and checks
// whether the current track has finished playing out.
class PlaybackEngine {
public:
    using SourceOpener = std::function<audio::OpenResult(const std::string&)>;

    PlaybackEngine(std::unique_ptr<audio::AudioOutput> output,
                   EngineChannels channels,
                   SourceOpener opener = audio::open_sample_source);
    ~PlaybackEngine() = default;

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    void run(std::stop_token stop_token);

    // Seconds of audio pulled through the capture path so far.
    double position_seconds() const;

private:
    struct CurrentStream {
        std::shared_ptr<audio::CaptureSource> capture;
        std::optional<double> duration;
    };

    void handle_command(const PlaybackCommand& cmd);
    void play(const model::Track& track);
    void stop_current();
    void seek(double seconds);
    void report_progress();
    void check_finished();
    void emit(PlaybackEvent event);

    std::unique_ptr<audio::AudioOutput> output_;
    EngineChannels channels_;
    SourceOpener opener_;

    std::shared_ptr<audio::PlaybackCounters> counters_;
    std::optional<CurrentStream> current_;
    std::atomic<int> sample_rate_{0};   // of the last opened stream
    std::atomic<int> channel_count_{0};
    bool paused_ = false;
    uint64_t generation_ = 0;  // stamped on outgoing events
    uint64_t dropped_logged_ = 0;
};

}  // namespace tunebox::engine
