#include "backend/Config.hpp"
#include "app/PlaybackSpeed.hpp"
#include "config/KeyMap.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace tunebox::backend {

namespace {
    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r");
        return s.substr(start, end - start + 1);
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::optional<double> parse_double(const std::string& value) {
        double out = 0.0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
        if (ec != std::errc() || ptr != value.data() + value.size()) return std::nullopt;
        return out;
    }

    std::optional<size_t> parse_capacity(const std::string& value) {
        size_t out = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
        if (ec != std::errc() || ptr != value.data() + value.size() || out == 0) return std::nullopt;
        return out;
    }

    std::filesystem::path expand_home(const std::string& value) {
        const char* home = std::getenv("HOME");
        if (home && (value == "~" || value.starts_with("~/"))) {
            return std::filesystem::path(home) / value.substr(value.size() > 1 ? 2 : 1);
        }
        return std::filesystem::path(value);
    }

    bool parse_bool(const std::string& value) {
        auto v = to_lower(value);
        return v == "true" || v == "yes" || v == "1";
    }

    std::string repeat_name(model::RepeatMode mode) {
        switch (mode) {
            case model::RepeatMode::All: return "all";
            case model::RepeatMode::One: return "one";
            case model::RepeatMode::Off: break;
        }
        return "off";
    }

    std::string mode_name(visualizer::VisualizerMode mode) {
        switch (mode) {
            case visualizer::VisualizerMode::Waveform: return "waveform";
            case visualizer::VisualizerMode::Off: return "off";
            case visualizer::VisualizerMode::FrequencyBars: break;
        }
        return "bars";
    }

    void warn_bad_value(const std::string& section, const std::string& key, const std::string& value) {
        util::Logger::warn("Config: Ignoring invalid value for " + section + "." + key + ": '" + value + "'");
    }
}

std::optional<model::RepeatMode> ConfigLoader::parse_repeat(const std::string& value) {
    auto v = to_lower(value);
    if (v == "off") return model::RepeatMode::Off;
    if (v == "all") return model::RepeatMode::All;
    if (v == "one") return model::RepeatMode::One;
    return std::nullopt;
}

std::optional<visualizer::VisualizerMode> ConfigLoader::parse_visualizer_mode(const std::string& value) {
    auto v = to_lower(value);
    if (v == "bars" || v == "spectrum") return visualizer::VisualizerMode::FrequencyBars;
    if (v == "waveform") return visualizer::VisualizerMode::Waveform;
    if (v == "off") return visualizer::VisualizerMode::Off;
    return std::nullopt;
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }

    Config cfg = create_default_config();
    if (save_config(cfg, config_file)) {
        util::Logger::info("Config: Wrote default config to " + config_file.string());
    }
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "playback") {
            if (key == "volume") {
                if (auto v = parse_double(value)) cfg.volume = std::clamp(static_cast<float>(*v), 0.0f, 1.0f);
                else warn_bad_value(current_section, key, value);
            } else if (key == "shuffle") {
                cfg.shuffle = parse_bool(value);
            } else if (key == "repeat") {
                if (auto mode = parse_repeat(value)) cfg.repeat = *mode;
                else warn_bad_value(current_section, key, value);
            } else if (key == "speed") {
                if (auto v = parse_double(value)) cfg.speed = app::PlaybackSpeed::nearest(*v).value();
                else warn_bad_value(current_section, key, value);
            }
        } else if (current_section == "visualizer") {
            if (key == "mode") {
                if (auto mode = parse_visualizer_mode(value)) cfg.visualizer_mode = *mode;
                else warn_bad_value(current_section, key, value);
            }
        } else if (current_section == "ui") {
            if (key == "theme") {
                if (auto theme = config::ThemeManager::parse(value)) cfg.theme = *theme;
                else warn_bad_value(current_section, key, value);
            }
        } else if (current_section == "engine") {
            auto capacity = parse_capacity(value);
            if (!capacity) {
                warn_bad_value(current_section, key, value);
            } else if (key == "command_capacity") {
                cfg.command_capacity = *capacity;
            } else if (key == "event_capacity") {
                cfg.event_capacity = *capacity;
            } else if (key == "sample_capacity") {
                cfg.sample_capacity = *capacity;
            }
        } else if (current_section == "keybinds") {
            cfg.keybinds[key] = value;
        } else if (current_section == "paths" || current_section == "library") {
            if (key == "music_directory") cfg.music_directory = expand_home(value);
        } else if (current_section == "logging") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = std::filesystem::path(value);
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        util::Logger::warn("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot write " + path.string());
        return false;
    }

    file << "# tunebox config\n\n";

    file << "[playback]\n";
    file << "# Startup volume (0.0 - 1.0)\n";
    file << "volume = " << cfg.volume << "\n";
    file << "shuffle = " << (cfg.shuffle ? "true" : "false") << "\n";
    file << "# Repeat mode: \"off\", \"all\", \"one\"\n";
    file << "repeat = \"" << repeat_name(cfg.repeat) << "\"\n";
    file << "# One of 0.5, 0.75, 1.0, 1.25, 1.5, 2.0\n";
    file << "speed = " << cfg.speed << "\n\n";

    file << "[visualizer]\n";
    file << "# \"bars\", \"waveform\", \"off\"\n";
    file << "mode = \"" << mode_name(cfg.visualizer_mode) << "\"\n\n";

    file << "[ui]\n";
    file << "# Default, Dracula, Nord, Gruvbox, Neon\n";
    file << "theme = \"" << config::ThemeManager::name(cfg.theme) << "\"\n\n";

    file << "[engine]\n";
    file << "command_capacity = " << cfg.command_capacity << "\n";
    file << "event_capacity = " << cfg.event_capacity << "\n";
    file << "sample_capacity = " << cfg.sample_capacity << "\n\n";

    file << "[keybinds]\n";
    for (const auto& [action, key] : config::KeyMap::default_bindings()) {
        auto it = cfg.keybinds.find(action);
        file << action << " = \"" << (it != cfg.keybinds.end() ? it->second : key) << "\"\n";
    }
    file << "\n";

    file << "[paths]\n";
    if (!cfg.music_directory.empty()) {
        file << "music_directory = \"" << cfg.music_directory.string() << "\"\n\n";
    } else {
        file << "# music_directory = \"~/Music\"\n\n";
    }

    file << "[logging]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.music_directory = util::Platform::get_music_directory();
    return cfg;
}

}  // namespace tunebox::backend
