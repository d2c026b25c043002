#pragma once

#include "config/Theme.hpp"
#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace tunebox::ui {

// Turns one published PlaybackState into screen lines. Pure: no terminal
// access, so it renders the same in tests.
class StatusLine {
public:
    static constexpr int VISUALIZER_ROWS = 8;

    static std::vector<std::string> render(const model::PlaybackState& state,
                                           const config::Theme& theme,
                                           int width,
                                           int height);

    // "▶ Title - Artist"
    static std::string now_playing(const model::PlaybackState& state);
    // "Vol 80% │ 1x │ Repeat: All │ Shuffle │ Sleep 14:59"
    static std::string settings(const model::PlaybackState& state);
};

}  // namespace tunebox::ui
