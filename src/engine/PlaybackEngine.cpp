#include "engine/PlaybackEngine.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <chrono>

namespace tunebox::engine {

namespace {
    constexpr auto COMMAND_POLL = std::chrono::milliseconds(16);
    constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(33);
}

PlaybackEngine::PlaybackEngine(std::unique_ptr<audio::AudioOutput> output,
                               EngineChannels channels,
                               SourceOpener opener)
    : output_(std::move(output))
    , channels_(std::move(channels))
    , opener_(std::move(opener))
    , counters_(std::make_shared<audio::PlaybackCounters>()) {
}

void PlaybackEngine::run(std::stop_token stop_token) {
    util::Logger::info("PlaybackEngine: Starting");

    if (!output_ || !output_->init()) {
        util::Logger::error("PlaybackEngine: Audio output initialization failed, engine exiting");
        emit({PlaybackEvent::Type::Error, 0.0, "No audio output device available"});
        channels_.commands->close();
        return;
    }

    auto next_progress = std::chrono::steady_clock::now();

    while (!stop_token.stop_requested()) {
        if (auto cmd = channels_.commands->recv_for(COMMAND_POLL)) {
            handle_command(*cmd);
        } else if (channels_.commands->is_closed()) {
            util::Logger::debug("PlaybackEngine: Command channel closed");
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= next_progress) {
            report_progress();
            check_finished();
            next_progress = now + PROGRESS_INTERVAL;
        }
    }

    stop_current();
    channels_.commands->close();
    util::Logger::info("PlaybackEngine: Exited");
}

double PlaybackEngine::position_seconds() const {
    int rate = sample_rate_.load(std::memory_order_acquire);
    int channels = channel_count_.load(std::memory_order_acquire);
    if (rate <= 0 || channels <= 0) return 0.0;
    uint64_t samples = counters_->samples_played.load(std::memory_order_acquire);
    return static_cast<double>(samples) / (static_cast<double>(rate) * channels);
}

void PlaybackEngine::handle_command(const PlaybackCommand& cmd) {
    switch (cmd.type) {
        case PlaybackCommand::Type::Play:
            generation_ = cmd.generation;
            play(cmd.track);
            break;
        case PlaybackCommand::Type::Pause:
            if (!paused_) {
                output_->pause(true);
                paused_ = true;
            }
            break;
        case PlaybackCommand::Type::Resume:
            if (paused_) {
                output_->pause(false);
                paused_ = false;
            }
            break;
        case PlaybackCommand::Type::Stop:
            util::Logger::debug("PlaybackEngine: Stop");
            stop_current();
            break;
        case PlaybackCommand::Type::Seek:
            seek(cmd.position);
            break;
        case PlaybackCommand::Type::SetVolume:
            // Range checks belong to the caller
            output_->set_volume(cmd.value);
            break;
        case PlaybackCommand::Type::SetSpeed:
            output_->set_speed(cmd.value);
            break;
    }
}

void PlaybackEngine::play(const model::Track& track) {
    util::Logger::info("PlaybackEngine: Play " + track.path);

    // The previous track is cancelled before anything of the new one runs
    stop_current();

    auto opened = opener_(track.path);
    if (!opened) {
        util::Logger::error("PlaybackEngine: Cannot open " + track.path + ": " + opened.error);
        emit({PlaybackEvent::Type::Error, 0.0, "Failed to play " + track.path + ": " + opened.error});
        return;
    }

    auto capture = std::make_shared<audio::CaptureSource>(std::move(opened.source), counters_,
                                                          channels_.samples);
    sample_rate_ = capture->sample_rate();
    channel_count_ = capture->channels();
    auto duration = capture->total_duration();

    if (!output_->start(capture)) {
        util::Logger::error("PlaybackEngine: Output refused stream for " + track.path);
        emit({PlaybackEvent::Type::Error, 0.0, "Failed to play " + track.path + ": output unavailable"});
        return;
    }

    current_ = CurrentStream{std::move(capture), duration};
    paused_ = false;
    emit({PlaybackEvent::Type::Playing, duration.value_or(0.0), {}});
}

void PlaybackEngine::stop_current() {
    if (current_) {
        output_->stop();
        current_.reset();
    }
    paused_ = false;
    counters_->reset();
}

void PlaybackEngine::seek(double seconds) {
    if (!current_) {
        util::Logger::debug("PlaybackEngine: Seek ignored, nothing playing");
        return;
    }

    double target = std::max(0.0, seconds);
    if (current_->duration) {
        target = std::min(target, *current_->duration);
    }

    // Report the target position right away, whatever the decoder lag
    uint64_t previous = counters_->samples_played.load(std::memory_order_acquire);
    uint64_t frame = static_cast<uint64_t>(target * sample_rate_.load());
    counters_->samples_played.store(frame * static_cast<uint64_t>(channel_count_.load()),
                                    std::memory_order_release);

    if (!output_->seek(target)) {
        counters_->samples_played.store(previous, std::memory_order_release);
        util::Logger::warn("PlaybackEngine: Seek to " + std::to_string(target) + "s failed");
        emit({PlaybackEvent::Type::Error, 0.0, "Seek failed"});
    }
}

void PlaybackEngine::report_progress() {
    emit({PlaybackEvent::Type::Progress, position_seconds(), {}});
}

void PlaybackEngine::check_finished() {
    if (!current_) return;
    if (!counters_->finished.load(std::memory_order_acquire)) return;
    if (!output_->empty()) return;  // Still audible

    util::Logger::info("PlaybackEngine: Track finished");
    output_->stop();
    current_.reset();
    paused_ = false;
    emit({PlaybackEvent::Type::TrackFinished, 0.0, {}});
}

void PlaybackEngine::emit(PlaybackEvent event) {
    event.generation = generation_;
    // Never block the engine on a stalled consumer
    if (!channels_.events->try_send(std::move(event))) {
        uint64_t dropped = channels_.events->dropped();
        if (dropped >= dropped_logged_ + 100) {
            dropped_logged_ = dropped;
            util::Logger::debug("PlaybackEngine: " + std::to_string(dropped) + " events dropped");
        }
    }
}

}  // namespace tunebox::engine
