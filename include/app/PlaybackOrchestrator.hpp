#pragma once

#include "app/PlaybackSpeed.hpp"
#include "app/SleepTimer.hpp"
#include "config/Theme.hpp"
#include "engine/PlaybackTypes.hpp"
#include "model/Snapshot.hpp"
#include "model/Track.hpp"
#include "visualizer/Visualizer.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace tunebox::app {

std::string repeat_label(model::RepeatMode mode);
// Off -> All -> One -> Off
model::RepeatMode next_repeat(model::RepeatMode mode);

// Actions the remote surface may request; each maps onto one
// orchestrator operation.
struct RemoteIntent {
    enum class Type {
        Toggle,
        Next,
        Prev,
        SetVolume,
        Seek,
        CycleTheme,
        CycleVisualizer,
        ToggleShuffle,
    };
    Type type;
    double value = 0.0;  // SetVolume (0..1), Seek (seconds)
};

struct OrchestratorSettings {
    float volume = 0.8f;
    bool shuffle = false;
    model::RepeatMode repeat = model::RepeatMode::Off;
    double speed = 1.0;
    config::ThemeId theme = config::ThemeId::Default;
    visualizer::VisualizerMode visualizer_mode = visualizer::VisualizerMode::FrequencyBars;
};

// Player state machine. Holds the playlist, selection, shuffle order,
// repeat policy, speed and sleep timer; turns user and remote intents into
// engine commands and folds engine events back into its state.
//
// Single-threaded: everything runs on the UI loop.
class PlaybackOrchestrator {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr double SEEK_STEP = 5.0;
    static constexpr float VOLUME_STEP = 0.05f;
    static constexpr double RESTART_THRESHOLD = 3.0;
    static constexpr int IDLE_TICKS_BEFORE_DECAY = 3;

    PlaybackOrchestrator(std::vector<model::Track> library,
                         engine::EngineChannels channels,
                         OrchestratorSettings settings = {});

    // Pushes the initial volume and speed to the engine.
    void sync_engine();

    // Transport
    void play(size_t index);
    void play_selected();
    void toggle_pause();
    void stop();
    void next();
    void prev();
    void handle_track_finished();
    void seek_forward();
    void seek_backward();

    // Volume and speed
    void volume_up();
    void volume_down();
    void set_volume(float volume);
    void speed_up();
    void speed_down();

    // Modes
    void toggle_shuffle();
    void cycle_repeat();
    void cycle_theme();
    void cycle_visualizer();
    void toggle_mini_mode();

    // Sleep timer
    void cycle_sleep_timer(Clock::time_point now = Clock::now());
    void update_sleep_timer(Clock::time_point now = Clock::now());
    std::optional<std::chrono::seconds> sleep_timer_remaining(Clock::time_point now = Clock::now()) const;

    // Selection and search
    void move_selection_up();
    void move_selection_down();
    void toggle_search();
    void search_input(char c);
    void search_backspace();

    // Drains engine events and visualizer chunks; call once per UI tick.
    void process_audio_events();

    void handle_remote(const RemoteIntent& intent);

    // Read model for the remote surface and the status line. list_rows
    // bounds how many playlist titles around the selection are included.
    model::PlaybackState playback_state(Clock::time_point now = Clock::now(), size_t list_rows = 8) const;

    const std::vector<model::Track>& library() const { return library_; }
    const std::vector<size_t>& filtered_indices() const { return filtered_indices_; }
    const std::vector<size_t>& shuffle_order() const { return shuffle_order_; }
    std::optional<size_t> playing_index() const { return playing_index_; }
    const model::Track* current_track() const;
    size_t selected_index() const { return selected_index_; }

    bool is_playing() const { return is_playing_; }
    // Bumped by play() and stop(); engine events from older plays are ignored
    uint64_t play_generation() const { return play_generation_; }
    float volume() const { return volume_; }
    bool shuffle() const { return shuffle_; }
    model::RepeatMode repeat() const { return repeat_; }
    void set_repeat(model::RepeatMode mode) { repeat_ = mode; }
    PlaybackSpeed speed() const { return speed_; }
    config::ThemeId theme() const { return theme_; }
    bool mini_mode() const { return mini_mode_; }
    bool search_mode() const { return search_mode_; }
    const std::string& search_query() const { return search_query_; }
    double progress() const { return progress_; }
    double duration() const { return duration_; }
    const std::optional<std::string>& error_message() const { return error_message_; }
    const std::optional<SleepTimer>& sleep_timer() const { return sleep_timer_; }
    const visualizer::Visualizer& visualizer() const { return visualizer_; }

private:
    bool send(engine::PlaybackCommand cmd);
    void update_filter();
    void regenerate_shuffle();
    std::optional<size_t> shuffle_next();
    std::optional<size_t> sequential_next() const;

    std::vector<model::Track> library_;
    engine::EngineChannels channels_;
    visualizer::Visualizer visualizer_;

    std::vector<size_t> filtered_indices_;
    size_t selected_index_ = 0;
    std::optional<size_t> playing_index_;
    std::vector<size_t> shuffle_order_;

    bool is_playing_ = false;
    float volume_ = 0.8f;
    bool shuffle_ = false;
    model::RepeatMode repeat_ = model::RepeatMode::Off;
    PlaybackSpeed speed_;
    config::ThemeId theme_ = config::ThemeId::Default;
    bool mini_mode_ = false;

    bool search_mode_ = false;
    std::string search_query_;

    double progress_ = 0.0;
    double duration_ = 0.0;
    std::optional<std::string> error_message_;
    std::optional<SleepTimer> sleep_timer_;
    int idle_ticks_ = 0;
    uint64_t play_generation_ = 0;

    std::mt19937_64 rng_;
};

}  // namespace tunebox::app
