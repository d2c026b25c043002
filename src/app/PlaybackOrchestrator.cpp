#include "app/PlaybackOrchestrator.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>
#include <sys/random.h>

namespace tunebox::app {

namespace {
    constexpr auto COMMAND_SEND_TIMEOUT = std::chrono::milliseconds(100);

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    uint64_t random_seed() {
        uint64_t seed = 0;
        if (getrandom(&seed, sizeof(seed), 0) != static_cast<ssize_t>(sizeof(seed))) {
            seed = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
        }
        return seed;
    }
}

std::string repeat_label(model::RepeatMode mode) {
    switch (mode) {
        case model::RepeatMode::Off: return "Off";
        case model::RepeatMode::All: return "All";
        case model::RepeatMode::One: return "One";
    }
    return "Off";
}

model::RepeatMode next_repeat(model::RepeatMode mode) {
    switch (mode) {
        case model::RepeatMode::Off: return model::RepeatMode::All;
        case model::RepeatMode::All: return model::RepeatMode::One;
        case model::RepeatMode::One: return model::RepeatMode::Off;
    }
    return model::RepeatMode::Off;
}

PlaybackOrchestrator::PlaybackOrchestrator(std::vector<model::Track> library,
                                           engine::EngineChannels channels,
                                           OrchestratorSettings settings)
    : library_(std::move(library))
    , channels_(std::move(channels))
    , volume_(std::clamp(settings.volume, 0.0f, 1.0f))
    , shuffle_(settings.shuffle)
    , repeat_(settings.repeat)
    , speed_(PlaybackSpeed::nearest(settings.speed))
    , theme_(settings.theme)
    , rng_(random_seed()) {
    filtered_indices_.resize(library_.size());
    std::iota(filtered_indices_.begin(), filtered_indices_.end(), size_t{0});
    visualizer_.set_mode(settings.visualizer_mode);
    if (shuffle_) regenerate_shuffle();

    util::Logger::info("PlaybackOrchestrator: " + std::to_string(library_.size()) + " tracks loaded");
}

void PlaybackOrchestrator::sync_engine() {
    send(engine::PlaybackCommand::set_volume(volume_));
    send(engine::PlaybackCommand::set_speed(speed_.value()));
}

bool PlaybackOrchestrator::send(engine::PlaybackCommand cmd) {
    if (channels_.commands->send_for(std::move(cmd), COMMAND_SEND_TIMEOUT)) {
        return true;
    }
    if (channels_.commands->is_closed()) {
        util::Logger::debug("PlaybackOrchestrator: Engine gone, command discarded");
    } else {
        util::Logger::warn("PlaybackOrchestrator: Command queue full, command dropped");
    }
    return false;
}

const model::Track* PlaybackOrchestrator::current_track() const {
    if (!playing_index_ || *playing_index_ >= library_.size()) return nullptr;
    return &library_[*playing_index_];
}

// ============================================================================
// Transport
// ============================================================================

void PlaybackOrchestrator::play(size_t index) {
    if (index >= library_.size()) return;

    const auto& track = library_[index];
    playing_index_ = index;
    is_playing_ = true;
    progress_ = 0.0;
    duration_ = track.duration;

    ++play_generation_;
    util::Logger::debug("PlaybackOrchestrator: Play #" + std::to_string(index) + " " + track.path);
    send(engine::PlaybackCommand::play(track, play_generation_));
}

void PlaybackOrchestrator::play_selected() {
    if (filtered_indices_.empty()) return;
    play(filtered_indices_[selected_index_]);
}

void PlaybackOrchestrator::toggle_pause() {
    if (!playing_index_) {
        play_selected();
        return;
    }

    is_playing_ = !is_playing_;
    send(engine::PlaybackCommand{is_playing_ ? engine::PlaybackCommand::Type::Resume
                                             : engine::PlaybackCommand::Type::Pause});
}

void PlaybackOrchestrator::stop() {
    send(engine::PlaybackCommand{engine::PlaybackCommand::Type::Stop});
    ++play_generation_;
    is_playing_ = false;
    playing_index_.reset();
    progress_ = 0.0;
    duration_ = 0.0;
}

std::optional<size_t> PlaybackOrchestrator::sequential_next() const {
    if (!playing_index_) return 0;

    size_t next = *playing_index_ + 1;
    if (next < library_.size()) return next;

    // RepeatOne is handled by handle_track_finished(), not here
    if (repeat_ == model::RepeatMode::All) return 0;
    return std::nullopt;
}

std::optional<size_t> PlaybackOrchestrator::shuffle_next() {
    if (shuffle_order_.size() != library_.size()) {
        regenerate_shuffle();
    }
    if (!playing_index_) return shuffle_order_.front();

    auto it = std::find(shuffle_order_.begin(), shuffle_order_.end(), *playing_index_);
    if (it == shuffle_order_.end()) return shuffle_order_.front();

    ++it;
    if (it != shuffle_order_.end()) return *it;

    if (repeat_ == model::RepeatMode::All) {
        regenerate_shuffle();
        return shuffle_order_.front();
    }
    return std::nullopt;
}

void PlaybackOrchestrator::next() {
    if (library_.empty()) return;

    auto next = shuffle_ ? shuffle_next() : sequential_next();
    if (!next) {
        util::Logger::debug("PlaybackOrchestrator: End of playlist");
        return;
    }
    play(*next);
}

void PlaybackOrchestrator::prev() {
    if (library_.empty()) return;

    if (progress_ > RESTART_THRESHOLD && playing_index_) {
        play(*playing_index_);
        return;
    }

    size_t target = 0;
    if (playing_index_ && *playing_index_ > 0) {
        target = *playing_index_ - 1;
    } else if (playing_index_ && repeat_ == model::RepeatMode::All) {
        target = library_.size() - 1;
    }
    play(target);
}

void PlaybackOrchestrator::handle_track_finished() {
    if (repeat_ == model::RepeatMode::One && playing_index_) {
        play(*playing_index_);
        return;
    }

    // Stays false unless next() starts another track
    is_playing_ = false;
    next();
    if (!is_playing_) {
        util::Logger::info("PlaybackOrchestrator: Playlist finished");
    }
}

void PlaybackOrchestrator::seek_forward() {
    if (!playing_index_) return;
    double target = progress_ + SEEK_STEP;
    // Unknown duration (0) leaves the clamp to the engine
    if (duration_ > 0.0) target = std::min(target, duration_);
    send(engine::PlaybackCommand::seek(target));
}

void PlaybackOrchestrator::seek_backward() {
    if (!playing_index_) return;
    send(engine::PlaybackCommand::seek(std::max(progress_ - SEEK_STEP, 0.0)));
}

// ============================================================================
// Volume / speed
// ============================================================================

void PlaybackOrchestrator::volume_up() {
    set_volume(volume_ + VOLUME_STEP);
}

void PlaybackOrchestrator::volume_down() {
    set_volume(volume_ - VOLUME_STEP);
}

void PlaybackOrchestrator::set_volume(float volume) {
    volume_ = std::clamp(volume, 0.0f, 1.0f);
    send(engine::PlaybackCommand::set_volume(volume_));
}

void PlaybackOrchestrator::speed_up() {
    speed_ = speed_.up();
    send(engine::PlaybackCommand::set_speed(speed_.value()));
}

void PlaybackOrchestrator::speed_down() {
    speed_ = speed_.down();
    send(engine::PlaybackCommand::set_speed(speed_.value()));
}

// ============================================================================
// Modes
// ============================================================================

void PlaybackOrchestrator::regenerate_shuffle() {
    shuffle_order_.resize(library_.size());
    std::iota(shuffle_order_.begin(), shuffle_order_.end(), size_t{0});

    // Fisher-Yates
    for (size_t i = shuffle_order_.size(); i > 1; --i) {
        std::uniform_int_distribution<size_t> pick(0, i - 1);
        std::swap(shuffle_order_[i - 1], shuffle_order_[pick(rng_)]);
    }
}

void PlaybackOrchestrator::toggle_shuffle() {
    shuffle_ = !shuffle_;
    if (shuffle_) regenerate_shuffle();
}

void PlaybackOrchestrator::cycle_repeat() {
    repeat_ = next_repeat(repeat_);
}

void PlaybackOrchestrator::cycle_theme() {
    theme_ = config::ThemeManager::next(theme_);
}

void PlaybackOrchestrator::cycle_visualizer() {
    visualizer_.cycle();
}

void PlaybackOrchestrator::toggle_mini_mode() {
    mini_mode_ = !mini_mode_;
}

// ============================================================================
// Sleep timer
// ============================================================================

void PlaybackOrchestrator::cycle_sleep_timer(Clock::time_point now) {
    std::optional<int> current;
    if (sleep_timer_) current = sleep_timer_->duration_minutes;
    auto minutes = SleepTimer::next_duration(current);

    // A re-armed timer keeps the volume from before any fade started
    float original = sleep_timer_ ? sleep_timer_->original_volume : volume_;
    bool volume_faded = sleep_timer_ && volume_ != original;

    if (minutes) {
        sleep_timer_ = SleepTimer::start(*minutes, original, now);
        util::Logger::info("PlaybackOrchestrator: Sleep timer " + std::to_string(*minutes) + " min");
    } else {
        sleep_timer_.reset();
        util::Logger::info("PlaybackOrchestrator: Sleep timer cancelled");
    }

    if (volume_faded || (!minutes && current)) {
        volume_ = original;
        send(engine::PlaybackCommand::set_volume(volume_));
    }
}

void PlaybackOrchestrator::update_sleep_timer(Clock::time_point now) {
    if (!sleep_timer_) return;

    if (sleep_timer_->expired(now)) {
        util::Logger::info("PlaybackOrchestrator: Sleep timer expired, pausing");
        send(engine::PlaybackCommand{engine::PlaybackCommand::Type::Pause});
        is_playing_ = false;
        volume_ = sleep_timer_->original_volume;
        send(engine::PlaybackCommand::set_volume(volume_));
        sleep_timer_.reset();
    } else if (now >= sleep_timer_->fade_start) {
        volume_ = sleep_timer_->volume_at(now);
        send(engine::PlaybackCommand::set_volume(volume_));
    }
}

std::optional<std::chrono::seconds> PlaybackOrchestrator::sleep_timer_remaining(Clock::time_point now) const {
    if (!sleep_timer_) return std::nullopt;
    return sleep_timer_->remaining(now);
}

// ============================================================================
// Selection / search
// ============================================================================

void PlaybackOrchestrator::move_selection_up() {
    if (selected_index_ > 0) --selected_index_;
}

void PlaybackOrchestrator::move_selection_down() {
    if (selected_index_ + 1 < filtered_indices_.size()) ++selected_index_;
}

void PlaybackOrchestrator::toggle_search() {
    search_mode_ = !search_mode_;
    if (!search_mode_) {
        search_query_.clear();
        update_filter();
    }
}

void PlaybackOrchestrator::search_input(char c) {
    search_query_.push_back(c);
    update_filter();
}

void PlaybackOrchestrator::search_backspace() {
    if (!search_query_.empty()) search_query_.pop_back();
    update_filter();
}

void PlaybackOrchestrator::update_filter() {
    filtered_indices_.clear();
    std::string query = to_lower(search_query_);

    for (size_t i = 0; i < library_.size(); ++i) {
        if (query.empty() ||
            to_lower(library_[i].title).find(query) != std::string::npos ||
            to_lower(library_[i].artist).find(query) != std::string::npos) {
            filtered_indices_.push_back(i);
        }
    }

    if (selected_index_ >= filtered_indices_.size()) {
        selected_index_ = filtered_indices_.empty() ? 0 : filtered_indices_.size() - 1;
    }
}

// ============================================================================
// Engine feedback
// ============================================================================

void PlaybackOrchestrator::process_audio_events() {
    while (auto event = channels_.events->try_recv()) {
        // Queued before the latest play()/stop(); errors are still worth showing
        if (event->generation != play_generation_ && event->type != engine::PlaybackEvent::Type::Error) {
            continue;
        }
        switch (event->type) {
            case engine::PlaybackEvent::Type::Playing:
                if (event->seconds > 0.0) duration_ = event->seconds;
                break;
            case engine::PlaybackEvent::Type::Progress:
                progress_ = event->seconds;
                break;
            case engine::PlaybackEvent::Type::TrackFinished:
                handle_track_finished();
                break;
            case engine::PlaybackEvent::Type::Error:
                util::Logger::warn("PlaybackOrchestrator: " + event->message);
                error_message_ = event->message;
                break;
        }
    }

    // Only the newest chunk matters
    std::optional<audio::SampleChunk> latest;
    while (auto chunk = channels_.samples->try_recv()) {
        latest = std::move(chunk);
    }

    if (latest) {
        visualizer_.process_samples(*latest);
        idle_ticks_ = 0;
    } else {
        ++idle_ticks_;
        if (!is_playing_ || idle_ticks_ >= IDLE_TICKS_BEFORE_DECAY) {
            visualizer_.decay();
        }
    }
}

void PlaybackOrchestrator::handle_remote(const RemoteIntent& intent) {
    switch (intent.type) {
        case RemoteIntent::Type::Toggle:
            toggle_pause();
            break;
        case RemoteIntent::Type::Next:
            next();
            break;
        case RemoteIntent::Type::Prev:
            prev();
            break;
        case RemoteIntent::Type::SetVolume:
            set_volume(static_cast<float>(intent.value));
            break;
        case RemoteIntent::Type::Seek:
            if (playing_index_) send(engine::PlaybackCommand::seek(intent.value));
            break;
        case RemoteIntent::Type::CycleTheme:
            cycle_theme();
            break;
        case RemoteIntent::Type::CycleVisualizer:
            cycle_visualizer();
            break;
        case RemoteIntent::Type::ToggleShuffle:
            toggle_shuffle();
            break;
    }
}

model::PlaybackState PlaybackOrchestrator::playback_state(Clock::time_point now, size_t list_rows) const {
    model::PlaybackState state;

    if (const auto* track = current_track()) {
        state.track_title = track->title;
        state.track_artist = track->artist;
        state.track_album = track->album;
    }
    state.progress = progress_;
    state.duration = duration_;
    state.is_playing = is_playing_;
    state.volume = volume_;
    state.shuffle = shuffle_;
    state.repeat = repeat_label(repeat_);
    state.theme = config::ThemeManager::name(theme_);
    state.speed = speed_.label();
    state.visualizer_mode = visualizer::mode_label(visualizer_.mode());
    state.visualizer_bars = visualizer_.bars();
    state.visualizer_peaks = visualizer_.peaks();
    state.visualizer_waveform = visualizer_.waveform();

    if (auto remaining = sleep_timer_remaining(now)) {
        state.sleep_timer_seconds = static_cast<int>(remaining->count());
    }
    state.error_message = error_message_;
    state.mini_mode = mini_mode_;
    state.search_mode = search_mode_;
    state.search_query = search_query_;
    state.track_count = library_.size();

    // Window of the filtered list centred on the selection
    size_t start = selected_index_ > list_rows / 2 ? selected_index_ - list_rows / 2 : 0;
    if (start + list_rows > filtered_indices_.size()) {
        start = filtered_indices_.size() > list_rows ? filtered_indices_.size() - list_rows : 0;
    }
    size_t end = std::min(start + list_rows, filtered_indices_.size());
    for (size_t i = start; i < end; ++i) {
        const auto& track = library_[filtered_indices_[i]];
        state.visible_titles.push_back(track.artist + " - " + track.title);
    }
    state.selected_row = static_cast<int>(selected_index_ - start);

    return state;
}

}  // namespace tunebox::app
