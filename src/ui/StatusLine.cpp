#include "ui/StatusLine.hpp"
#include "ui/Formatting.hpp"
#include "ui/VisualBlocks.hpp"
#include <algorithm>
#include <format>
#include <sstream>

namespace tunebox::ui {

namespace {
    constexpr const char* RESET = "\033[0m";

    std::string paint(const std::string& color, const std::string& text) {
        if (color.empty()) return text;
        return color + text + RESET;
    }
}

std::string StatusLine::now_playing(const model::PlaybackState& state) {
    if (!state.track_title) {
        return "■ Nothing playing";
    }
    std::string line = state.is_playing ? "▶ " : "⏸ ";
    line += *state.track_title;
    if (state.track_artist) line += " - " + *state.track_artist;
    return line;
}

std::string StatusLine::settings(const model::PlaybackState& state) {
    std::ostringstream out;
    out << "Vol " << static_cast<int>(state.volume * 100.0f + 0.5f) << "%";
    out << " │ " << state.speed;
    out << " │ Repeat: " << state.repeat;
    if (state.shuffle) out << " │ Shuffle";
    if (state.sleep_timer_seconds) {
        out << " │ Sleep " << format_time(*state.sleep_timer_seconds);
    }
    return out.str();
}

std::vector<std::string> StatusLine::render(const model::PlaybackState& state,
                                            const config::Theme& theme,
                                            int width,
                                            int height) {
    width = std::max(width, 20);
    int inner = width - 2;
    std::vector<std::string> body;

    body.push_back(paint(theme.current_track, now_playing(state)));
    if (state.track_album && !state.mini_mode) {
        body.push_back(paint(theme.foreground, *state.track_album));
    }

    // Progress: bar plus elapsed/total on the right
    std::string times = format_time(state.progress) + " / " + format_time(state.duration);
    int bar_width = std::max(inner - display_cols(times) - 1, 0);
    double fraction = state.duration > 0.0 ? state.progress / state.duration : 0.0;
    body.push_back(paint(theme.accent, blocks::progress_bar(fraction, bar_width)) + " " + times);

    body.push_back(lr_align(inner, settings(state), state.theme + " │ " + state.visualizer_mode));

    if (!state.mini_mode) {
        if (state.visualizer_mode == "Spectrum") {
            for (auto& row : blocks::spectrum_rows(state.visualizer_bars, state.visualizer_peaks,
                                                   inner, VISUALIZER_ROWS)) {
                body.push_back(paint(theme.accent, row));
            }
        } else if (state.visualizer_mode == "Waveform") {
            for (auto& row : blocks::waveform_rows(state.visualizer_waveform, inner, VISUALIZER_ROWS)) {
                body.push_back(paint(theme.accent, row));
            }
        }

        body.push_back("");
        if (state.search_mode) {
            body.push_back("/" + state.search_query + "_");
        }
        for (size_t i = 0; i < state.visible_titles.size(); ++i) {
            const std::string& title = state.visible_titles[i];
            if (static_cast<int>(i) == state.selected_row) {
                body.push_back(paint(theme.highlight, trunc_pad("> " + title, inner)));
            } else {
                body.push_back(paint(theme.foreground, "  " + title));
            }
        }
    }

    if (state.error_message) {
        body.push_back(paint("\033[31m", "Error: " + *state.error_message));
    }

    std::string title = std::format("tunebox │ {} tracks", state.track_count);
    int min_rows = state.mini_mode ? 0 : std::max(height - 2, 0);
    auto lines = make_box(title, body, width, min_rows);
    if (height > 0 && static_cast<int>(lines.size()) > height) {
        lines.resize(static_cast<size_t>(height));
    }
    return lines;
}

}  // namespace tunebox::ui
