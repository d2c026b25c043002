#include "app/PlaybackOrchestrator.hpp"
#include "audio/PipeWireOutput.hpp"
#include "backend/Config.hpp"
#include "backend/Library.hpp"
#include "backend/SnapshotPublisher.hpp"
#include "backend/TrackListStore.hpp"
#include "config/KeyMap.hpp"
#include "config/Theme.hpp"
#include "engine/PlaybackEngine.hpp"
#include "ui/StatusLine.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

using namespace tunebox;
using namespace std::chrono_literals;

namespace {

constexpr int FRAME_MS = 33;

struct CommandLine {
    bool shuffle = false;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::filesystem::path> path;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--shuffle] [--config FILE] [PATH]\n"
              << "  PATH            music directory or a single audio file\n"
              << "  --shuffle       start with shuffle enabled\n"
              << "  --config FILE   read settings from FILE\n";
}

// nullopt means exit immediately; exit_code says how
std::optional<CommandLine> parse_command_line(int argc, char** argv, int& exit_code) {
    CommandLine cli;
    static struct option long_options[] = {
        {"shuffle", no_argument,       nullptr, 's'},
        {"config",  required_argument, nullptr, 'c'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr,   0,                 nullptr,  0 }
    };

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "", long_options, &option_index)) != -1) {
        switch (opt) {
            case 's':
                cli.shuffle = true;
                break;
            case 'c':
                cli.config_file = std::filesystem::path(optarg);
                break;
            case 'h':
                print_usage(argv[0]);
                exit_code = EXIT_SUCCESS;
                return std::nullopt;
            default:
                print_usage(argv[0]);
                exit_code = EXIT_FAILURE;
                return std::nullopt;
        }
    }

    if (optind < argc) {
        cli.path = std::filesystem::path(argv[optind]);
    }
    return cli;
}

// Returns false when the action asks to quit.
bool dispatch_action(app::PlaybackOrchestrator& player, const std::string& action) {
    if (action == "quit") return false;
    if (action == "play_pause") player.toggle_pause();
    else if (action == "next") player.next();
    else if (action == "prev") player.prev();
    else if (action == "volume_up") player.volume_up();
    else if (action == "volume_down") player.volume_down();
    else if (action == "seek_forward") player.seek_forward();
    else if (action == "seek_backward") player.seek_backward();
    else if (action == "select_up") player.move_selection_up();
    else if (action == "select_down") player.move_selection_down();
    else if (action == "play_selected") player.play_selected();
    else if (action == "shuffle") player.toggle_shuffle();
    else if (action == "repeat") player.cycle_repeat();
    else if (action == "search") player.toggle_search();
    else if (action == "visualizer") player.cycle_visualizer();
    else if (action == "theme") player.cycle_theme();
    else if (action == "sleep_timer") player.cycle_sleep_timer();
    else if (action == "mini_mode") player.toggle_mini_mode();
    else if (action == "speed_up") player.speed_up();
    else if (action == "speed_down") player.speed_down();
    return true;
}

void handle_search_key(app::PlaybackOrchestrator& player, const ui::InputEvent& event) {
    if (event.is_key("esc") || event.is_key("enter")) {
        player.toggle_search();
    } else if (event.is_key("backspace")) {
        player.search_backspace();
    } else if (event.is_key("space")) {
        player.search_input(' ');
    } else if (event.key_name.size() == 1) {
        player.search_input(event.key_name[0]);
    }
}

int run_player(const CommandLine& cli) {
    auto cfg = cli.config_file ? backend::ConfigLoader::load_from_file(*cli.config_file)
                               : backend::ConfigLoader::load_config();

    util::Logger::init(cfg.log_file.string());
    util::Logger::set_level(util::Logger::parse_level(cfg.log_level));
    util::Logger::info("tunebox starting...");

    auto root = cli.path.value_or(cfg.music_directory);
    std::error_code ec;
    auto canonical = std::filesystem::canonical(root, ec);
    if (ec) {
        std::cerr << "Invalid path: " << root.string() << " (" << ec.message() << ")\n";
        return EXIT_FAILURE;
    }

    backend::FileTrackListStore store(backend::FileTrackListStore::default_path());
    auto tracks = backend::Library::scan(canonical, &store);
    if (tracks.empty()) {
        std::cerr << "No audio files found in " << canonical.string() << "\n";
        return EXIT_FAILURE;
    }
    std::cerr << "Found " << tracks.size() << " tracks. Starting tunebox...\n";

    auto channels = engine::EngineChannels::create(cfg.command_capacity, cfg.event_capacity, cfg.sample_capacity);

    engine::PlaybackEngine engine(std::make_unique<audio::PipeWireOutput>(), channels);
    std::jthread engine_thread([&engine](std::stop_token st) { engine.run(st); });

    app::OrchestratorSettings settings;
    settings.volume = cfg.volume;
    settings.shuffle = cfg.shuffle || cli.shuffle;
    settings.repeat = cfg.repeat;
    settings.speed = cfg.speed;
    settings.theme = cfg.theme;
    settings.visualizer_mode = cfg.visualizer_mode;

    app::PlaybackOrchestrator player(std::move(tracks), channels, settings);
    player.sync_engine();

    config::KeyMap keymap;
    keymap.apply_overrides(cfg.keybinds);

    bool single_file = std::filesystem::is_regular_file(canonical, ec);
    if (single_file) {
        player.play(0);
    }

    backend::SnapshotPublisher publisher;
    auto& terminal = ui::Terminal::instance();
    terminal.init();
    terminal.clear_screen();

    bool running = true;
    while (running && !terminal.quit_requested()) {
        player.process_audio_events();
        player.update_sleep_timer();

        int width = terminal.get_terminal_width();
        int height = terminal.get_terminal_height();
        size_t list_rows = static_cast<size_t>(std::max(height - 18, 3));
        publisher.publish(player.playback_state(std::chrono::steady_clock::now(), list_rows));

        auto snapshot = publisher.get_current();
        auto theme = config::ThemeManager::get_theme(player.theme());
        terminal.draw_lines(ui::StatusLine::render(snapshot->playback, theme, width, height));

        auto event = terminal.poll_input(FRAME_MS);
        if (event.type == ui::InputEvent::Type::Resize) {
            terminal.clear_screen();
            continue;
        }
        if (event.type != ui::InputEvent::Type::KeyPress) continue;

        if (event.is_key("ctrl+c")) {
            running = false;
        } else if (player.search_mode()) {
            handle_search_key(player, event);
        } else {
            running = dispatch_action(player, keymap.lookup_action(event.key_name));
        }
    }

    player.stop();
    terminal.shutdown();
    engine_thread.request_stop();
    engine_thread.join();

    util::Logger::info("tunebox exiting");
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    int exit_code = EXIT_SUCCESS;
    auto cli = parse_command_line(argc, argv, exit_code);
    if (!cli) return exit_code;

    try {
        return run_player(*cli);
    } catch (const std::exception& e) {
        auto& terminal = ui::Terminal::instance();
        if (terminal.is_initialized()) {
            terminal.shutdown();
        }
        util::Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "tunebox: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
