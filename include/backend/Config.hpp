#pragma once

#include "config/Theme.hpp"
#include "model/Snapshot.hpp"
#include "visualizer/Visualizer.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace tunebox::backend {

struct Config {
    // Playback settings
    float volume = 0.8f;
    bool shuffle = false;
    model::RepeatMode repeat = model::RepeatMode::Off;
    double speed = 1.0;

    // Display settings
    visualizer::VisualizerMode visualizer_mode = visualizer::VisualizerMode::FrequencyBars;
    config::ThemeId theme = config::ThemeId::Default;

    // Engine queue sizes
    size_t command_capacity = 32;
    size_t event_capacity = 64;
    size_t sample_capacity = 4;

    // action name -> key name, layered over the defaults
    std::unordered_map<std::string, std::string> keybinds;

    std::filesystem::path music_directory;

    // Logging
    std::string log_level = "info";
    std::filesystem::path log_file = "/tmp/tunebox.log";
};

class ConfigLoader {
public:
    // Reads ~/.config/tunebox/config.toml, writing a default one on first run.
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();

    static std::optional<model::RepeatMode> parse_repeat(const std::string& value);
    static std::optional<visualizer::VisualizerMode> parse_visualizer_mode(const std::string& value);
};

}  // namespace tunebox::backend
