#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tunebox::model {

enum class RepeatMode {
    Off,
    All,
    One,
};

/// Read model handed to the remote surface and the status line.
/// Built by the orchestrator once per UI tick; never mutated afterwards.
struct PlaybackState {
    std::optional<std::string> track_title;
    std::optional<std::string> track_artist;
    std::optional<std::string> track_album;
    double progress = 0.0;
    double duration = 0.0;
    bool is_playing = false;
    float volume = 0.0f;
    bool shuffle = false;
    std::string repeat;
    std::string theme;
    std::string speed;
    std::string visualizer_mode;
    std::vector<float> visualizer_bars;
    std::vector<float> visualizer_peaks;
    std::vector<float> visualizer_waveform;

    // Display extras for the terminal front end
    std::optional<int> sleep_timer_seconds;
    std::optional<std::string> error_message;
    bool mini_mode = false;
    bool search_mode = false;
    std::string search_query;
    std::vector<std::string> visible_titles;
    int selected_row = 0;
    size_t track_count = 0;

    bool operator==(const PlaybackState&) const = default;
};

struct Snapshot {
    uint64_t seq = 0;
    PlaybackState playback;
    std::chrono::steady_clock::time_point timestamp;
};

}  // namespace tunebox::model
