#include "../framework/SimpleTest.hpp"
#include "app/PlaybackOrchestrator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

using namespace tunebox;
using engine::PlaybackCommand;
using engine::PlaybackEvent;
using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

namespace {

model::Track make_track(const std::string& title, const std::string& artist, double duration = 180.0) {
    model::Track t;
    t.path = "/music/" + artist + "/" + title + ".flac";
    t.title = title;
    t.artist = artist;
    t.album = "Album";
    t.duration = duration;
    return t;
}

std::vector<model::Track> playlist(size_t n) {
    std::vector<model::Track> tracks;
    for (size_t i = 0; i < n; ++i) {
        tracks.push_back(make_track("Song " + std::to_string(i), "Artist"));
    }
    return tracks;
}

std::vector<PlaybackCommand> drain(const engine::EngineChannels& ch) {
    std::vector<PlaybackCommand> out;
    while (auto cmd = ch.commands->try_recv()) out.push_back(std::move(*cmd));
    return out;
}

// Stamped as the engine would for the player's current play
void push_event(const engine::EngineChannels& ch, const app::PlaybackOrchestrator& player,
                PlaybackEvent::Type type, double seconds = 0.0, std::string message = {}) {
    ch.events->try_send(PlaybackEvent{type, seconds, std::move(message), player.play_generation()});
}

}  // namespace

TEST_CASE(test_play_sends_track) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);

    player.play(1);
    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 1u);
    ASSERT_TRUE(cmds[0].type == PlaybackCommand::Type::Play);
    ASSERT_EQ(cmds[0].track.title, std::string("Song 1"));
    ASSERT_TRUE(player.is_playing());
    ASSERT_EQ(*player.playing_index(), 1u);
    ASSERT_NEAR(player.duration(), 180.0, 1e-9);

    // Out of range is ignored
    player.play(7);
    ASSERT_TRUE(drain(ch).empty());
    ASSERT_EQ(*player.playing_index(), 1u);
}

TEST_CASE(test_sync_engine_pushes_volume_and_speed) {
    auto ch = engine::EngineChannels::create();
    app::OrchestratorSettings settings;
    settings.volume = 0.6f;
    settings.speed = 1.3;  // snaps to 1.25
    app::PlaybackOrchestrator player(playlist(1), ch, settings);

    player.sync_engine();
    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 2u);
    ASSERT_TRUE(cmds[0].type == PlaybackCommand::Type::SetVolume);
    ASSERT_NEAR(cmds[0].value, 0.6f, 1e-6f);
    ASSERT_TRUE(cmds[1].type == PlaybackCommand::Type::SetSpeed);
    ASSERT_NEAR(cmds[1].value, 1.25f, 1e-6f);
}

TEST_CASE(test_next_stops_at_end_without_repeat) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);

    player.next();  // nothing playing -> first track
    ASSERT_EQ(*player.playing_index(), 0u);
    player.next();
    player.next();
    ASSERT_EQ(*player.playing_index(), 2u);
    drain(ch);

    player.next();
    ASSERT_EQ(*player.playing_index(), 2u);
    ASSERT_TRUE(drain(ch).empty());
}

TEST_CASE(test_next_wraps_with_repeat_all) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);
    player.set_repeat(model::RepeatMode::All);

    player.play(2);
    player.next();
    ASSERT_EQ(*player.playing_index(), 0u);
}

TEST_CASE(test_prev_restarts_after_threshold) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);

    player.play(2);
    push_event(ch, player, PlaybackEvent::Type::Progress, 10.0);
    player.process_audio_events();
    ASSERT_NEAR(player.progress(), 10.0, 1e-9);

    player.prev();
    ASSERT_EQ(*player.playing_index(), 2u);  // restarted

    player.prev();  // progress reset by play()
    ASSERT_EQ(*player.playing_index(), 1u);
    player.prev();
    player.prev();
    ASSERT_EQ(*player.playing_index(), 0u);  // clamps at the start
}

TEST_CASE(test_prev_wraps_with_repeat_all) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(4), ch);
    player.set_repeat(model::RepeatMode::All);

    player.play(0);
    player.prev();
    ASSERT_EQ(*player.playing_index(), 3u);
}

TEST_CASE(test_track_finished_advances) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);

    player.play(0);
    drain(ch);
    push_event(ch, player, PlaybackEvent::Type::TrackFinished);
    player.process_audio_events();

    ASSERT_EQ(*player.playing_index(), 1u);
    ASSERT_TRUE(player.is_playing());
    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 1u);
    ASSERT_EQ(cmds[0].track.title, std::string("Song 1"));
}

TEST_CASE(test_track_finished_at_end_stops) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(2), ch);

    player.play(1);
    drain(ch);
    player.handle_track_finished();

    ASSERT_FALSE(player.is_playing());
    ASSERT_TRUE(drain(ch).empty());
}

TEST_CASE(test_repeat_one_replays_on_finish_only) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);
    player.set_repeat(model::RepeatMode::One);

    player.play(1);
    player.handle_track_finished();
    ASSERT_EQ(*player.playing_index(), 1u);
    ASSERT_TRUE(player.is_playing());

    // Explicit next still moves on
    player.next();
    ASSERT_EQ(*player.playing_index(), 2u);
}

TEST_CASE(test_shuffle_order_is_permutation) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(25), ch);

    player.toggle_shuffle();
    ASSERT_TRUE(player.shuffle());
    auto order = player.shuffle_order();
    ASSERT_EQ(order.size(), 25u);

    std::sort(order.begin(), order.end());
    std::vector<size_t> expected(25);
    std::iota(expected.begin(), expected.end(), size_t{0});
    ASSERT_TRUE(order == expected);
}

TEST_CASE(test_shuffle_follows_order_and_stops) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(5), ch);
    player.toggle_shuffle();
    auto order = player.shuffle_order();

    player.next();
    ASSERT_EQ(*player.playing_index(), order[0]);
    for (size_t i = 1; i < order.size(); ++i) {
        player.next();
        ASSERT_EQ(*player.playing_index(), order[i]);
    }

    drain(ch);
    player.next();
    ASSERT_EQ(*player.playing_index(), order.back());
    ASSERT_TRUE(drain(ch).empty());
}

TEST_CASE(test_shuffle_repeat_all_reshuffles) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(4), ch);
    player.toggle_shuffle();
    player.set_repeat(model::RepeatMode::All);

    for (int i = 0; i < 4; ++i) player.next();
    player.next();
    ASSERT_TRUE(player.playing_index().has_value());
    ASSERT_EQ(*player.playing_index(), player.shuffle_order().front());
}

TEST_CASE(test_volume_is_clamped) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);

    player.set_volume(1.5f);
    ASSERT_NEAR(player.volume(), 1.0f, 1e-6f);
    player.volume_up();
    ASSERT_NEAR(player.volume(), 1.0f, 1e-6f);

    player.set_volume(0.02f);
    player.volume_down();
    ASSERT_NEAR(player.volume(), 0.0f, 1e-6f);

    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 4u);
    for (const auto& cmd : cmds) {
        ASSERT_TRUE(cmd.type == PlaybackCommand::Type::SetVolume);
        ASSERT_TRUE(cmd.value >= 0.0f && cmd.value <= 1.0f);
    }
}

TEST_CASE(test_speed_ladder_clamps) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);

    for (int i = 0; i < 6; ++i) player.speed_up();
    ASSERT_NEAR(player.speed().value(), 2.0f, 1e-6f);
    ASSERT_EQ(player.speed().label(), std::string("2x"));

    for (int i = 0; i < 10; ++i) player.speed_down();
    ASSERT_NEAR(player.speed().value(), 0.5f, 1e-6f);

    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 16u);
    ASSERT_NEAR(cmds[0].value, 1.25f, 1e-6f);
    ASSERT_NEAR(cmds.back().value, 0.5f, 1e-6f);
}

TEST_CASE(test_speed_ladder_nearest) {
    ASSERT_NEAR(app::PlaybackSpeed::nearest(0.1).value(), 0.5f, 1e-6f);
    ASSERT_NEAR(app::PlaybackSpeed::nearest(1.6).value(), 1.5f, 1e-6f);
    ASSERT_NEAR(app::PlaybackSpeed::nearest(9.0).value(), 2.0f, 1e-6f);
    ASSERT_EQ(app::PlaybackSpeed{}.label(), std::string("1x"));
}

TEST_CASE(test_seek_steps_are_clamped) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);

    player.seek_forward();  // nothing playing
    ASSERT_TRUE(drain(ch).empty());

    player.play(0);
    push_event(ch, player, PlaybackEvent::Type::Playing, 10.0);
    push_event(ch, player, PlaybackEvent::Type::Progress, 8.0);
    player.process_audio_events();
    drain(ch);

    player.seek_forward();
    player.seek_backward();
    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 2u);
    ASSERT_NEAR(cmds[0].position, 10.0, 1e-9);
    ASSERT_NEAR(cmds[1].position, 3.0, 1e-9);

    push_event(ch, player, PlaybackEvent::Type::Progress, 2.0);
    player.process_audio_events();
    player.seek_backward();
    ASSERT_NEAR(drain(ch)[0].position, 0.0, 1e-9);
}

TEST_CASE(test_events_from_replaced_track_are_ignored) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(4), ch);

    player.play(0);
    // Track 0 ends in the engine just as the user skips ahead
    push_event(ch, player, PlaybackEvent::Type::Progress, 179.5);
    push_event(ch, player, PlaybackEvent::Type::TrackFinished);
    player.next();
    ASSERT_EQ(*player.playing_index(), 1u);
    drain(ch);

    player.process_audio_events();
    ASSERT_EQ(*player.playing_index(), 1u);  // not skipped to 2
    ASSERT_NEAR(player.progress(), 0.0, 1e-9);
    ASSERT_TRUE(drain(ch).empty());

    // prev() keeps seeing the fresh position, so it goes back instead of restarting
    player.prev();
    ASSERT_EQ(*player.playing_index(), 0u);
}

TEST_CASE(test_finish_queued_before_stop_does_not_restart) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);

    player.play(0);
    push_event(ch, player, PlaybackEvent::Type::TrackFinished);
    player.stop();
    drain(ch);

    player.process_audio_events();
    ASSERT_FALSE(player.is_playing());
    ASSERT_FALSE(player.playing_index().has_value());
    ASSERT_TRUE(drain(ch).empty());
}

TEST_CASE(test_stale_errors_still_reported) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(2), ch);

    player.play(0);
    push_event(ch, player, PlaybackEvent::Type::Error, 0.0, "Seek failed");
    player.play(1);
    player.process_audio_events();
    ASSERT_EQ(*player.error_message(), std::string("Seek failed"));
}

TEST_CASE(test_playing_event_without_duration_keeps_track_duration) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);

    player.play(0);
    push_event(ch, player, PlaybackEvent::Type::Playing, 0.0);
    player.process_audio_events();
    ASSERT_NEAR(player.duration(), 180.0, 1e-9);
}

TEST_CASE(test_toggle_pause_cycle) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);
    player.move_selection_down();

    player.toggle_pause();  // nothing playing: plays the selection
    ASSERT_EQ(*player.playing_index(), 1u);
    player.toggle_pause();
    ASSERT_FALSE(player.is_playing());
    player.toggle_pause();
    ASSERT_TRUE(player.is_playing());

    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 3u);
    ASSERT_TRUE(cmds[0].type == PlaybackCommand::Type::Play);
    ASSERT_TRUE(cmds[1].type == PlaybackCommand::Type::Pause);
    ASSERT_TRUE(cmds[2].type == PlaybackCommand::Type::Resume);

    player.stop();
    ASSERT_FALSE(player.is_playing());
    ASSERT_FALSE(player.playing_index().has_value());
    ASSERT_TRUE(drain(ch)[0].type == PlaybackCommand::Type::Stop);
}

TEST_CASE(test_search_filters_title_and_artist) {
    auto ch = engine::EngineChannels::create();
    std::vector<model::Track> tracks = {
        make_track("Blue Train", "John Coltrane"),
        make_track("So What", "Miles Davis"),
        make_track("Giant Steps", "John Coltrane"),
        make_track("Blue in Green", "Miles Davis"),
    };
    app::PlaybackOrchestrator player(tracks, ch);

    player.toggle_search();
    ASSERT_TRUE(player.search_mode());
    for (char c : std::string("BLUE")) player.search_input(c);
    ASSERT_EQ(player.filtered_indices().size(), 2u);
    ASSERT_EQ(player.filtered_indices()[0], 0u);
    ASSERT_EQ(player.filtered_indices()[1], 3u);

    player.move_selection_down();
    player.play_selected();
    ASSERT_EQ(*player.playing_index(), 3u);

    for (int i = 0; i < 4; ++i) player.search_backspace();
    for (char c : std::string("coltrane")) player.search_input(c);
    ASSERT_EQ(player.filtered_indices().size(), 2u);
    ASSERT_TRUE(player.selected_index() < player.filtered_indices().size());

    player.search_input('x');
    ASSERT_TRUE(player.filtered_indices().empty());
    player.play_selected();  // nothing to play
    ASSERT_EQ(*player.playing_index(), 3u);

    player.toggle_search();
    ASSERT_FALSE(player.search_mode());
    ASSERT_EQ(player.search_query(), std::string());
    ASSERT_EQ(player.filtered_indices().size(), 4u);
}

TEST_CASE(test_selection_stays_in_bounds) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);

    player.move_selection_up();
    ASSERT_EQ(player.selected_index(), 0u);
    for (int i = 0; i < 10; ++i) player.move_selection_down();
    ASSERT_EQ(player.selected_index(), 2u);
}

TEST_CASE(test_sleep_timer_ladder_and_fade) {
    auto ch = engine::EngineChannels::create();
    app::OrchestratorSettings settings;
    settings.volume = 0.8f;
    app::PlaybackOrchestrator player(playlist(1), ch, settings);
    player.play(0);
    drain(ch);

    auto t0 = Clock::now();
    player.cycle_sleep_timer(t0);
    ASSERT_EQ(player.sleep_timer()->duration_minutes, 15);
    ASSERT_EQ(player.sleep_timer_remaining(t0)->count(), 900);

    // Half way through the final minute
    player.update_sleep_timer(t0 + 14min + 30s);
    ASSERT_NEAR(player.volume(), 0.4f, 1e-3f);

    // Re-arming restores the pre-fade volume
    player.cycle_sleep_timer(t0 + 14min + 30s);
    ASSERT_EQ(player.sleep_timer()->duration_minutes, 30);
    ASSERT_NEAR(player.volume(), 0.8f, 1e-6f);
    ASSERT_NEAR(player.sleep_timer()->original_volume, 0.8f, 1e-6f);

    player.cycle_sleep_timer(t0);  // 45
    player.cycle_sleep_timer(t0);  // 60
    ASSERT_EQ(player.sleep_timer()->duration_minutes, 60);
    player.cycle_sleep_timer(t0);  // off
    ASSERT_FALSE(player.sleep_timer().has_value());
    ASSERT_FALSE(player.sleep_timer_remaining(t0).has_value());
    ASSERT_NEAR(player.volume(), 0.8f, 1e-6f);

    auto cmds = drain(ch);
    ASSERT_FALSE(cmds.empty());
    ASSERT_TRUE(cmds.back().type == PlaybackCommand::Type::SetVolume);
    ASSERT_NEAR(cmds.back().value, 0.8f, 1e-6f);
}

TEST_CASE(test_sleep_timer_expiry_pauses) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);
    player.play(0);
    drain(ch);

    auto t0 = Clock::now();
    player.cycle_sleep_timer(t0);
    player.update_sleep_timer(t0 + 5min);  // before the fade
    ASSERT_TRUE(drain(ch).empty());

    player.update_sleep_timer(t0 + 15min);
    ASSERT_FALSE(player.is_playing());
    ASSERT_FALSE(player.sleep_timer().has_value());
    ASSERT_NEAR(player.volume(), 0.8f, 1e-6f);

    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 2u);
    ASSERT_TRUE(cmds[0].type == PlaybackCommand::Type::Pause);
    ASSERT_TRUE(cmds[1].type == PlaybackCommand::Type::SetVolume);
}

TEST_CASE(test_sleep_timer_volume_curve) {
    auto t0 = Clock::now();
    auto timer = app::SleepTimer::start(15, 1.0f, t0);
    ASSERT_NEAR(timer.volume_at(t0), 1.0f, 1e-6f);
    ASSERT_NEAR(timer.volume_at(t0 + 14min), 1.0f, 1e-6f);
    ASSERT_NEAR(timer.volume_at(t0 + 14min + 45s), 0.25f, 1e-3f);
    ASSERT_NEAR(timer.volume_at(t0 + 15min), 0.0f, 1e-6f);
    ASSERT_TRUE(timer.fading(t0 + 14min + 1s));
    ASSERT_FALSE(timer.fading(t0 + 15min));
    ASSERT_EQ(timer.remaining(t0 + 20min).count(), 0);
}

TEST_CASE(test_engine_error_is_kept) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);

    push_event(ch, player, PlaybackEvent::Type::Error, 0.0, "first");
    push_event(ch, player, PlaybackEvent::Type::Error, 0.0, "Seek failed");
    player.process_audio_events();
    ASSERT_EQ(*player.error_message(), std::string("Seek failed"));
}

TEST_CASE(test_latest_chunk_feeds_visualizer) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);
    player.play(0);

    std::vector<float> tone(visualizer::Visualizer::FFT_SIZE);
    for (size_t n = 0; n < tone.size(); ++n) {
        tone[n] = std::sin(2.0f * 3.14159265f * 100.0f * static_cast<float>(n) / 2048.0f);
    }
    ch.samples->push_latest(std::vector<float>(tone.size(), 0.0f));
    ch.samples->push_latest(tone);
    player.process_audio_events();

    float max = *std::max_element(player.visualizer().bars().begin(), player.visualizer().bars().end());
    ASSERT_NEAR(max, 1.0f, 1e-5f);
    ASSERT_EQ(ch.samples->size(), 0u);

    // Playing: the first idle ticks hold the bars
    player.process_audio_events();
    player.process_audio_events();
    float held = *std::max_element(player.visualizer().bars().begin(), player.visualizer().bars().end());
    ASSERT_NEAR(held, 1.0f, 1e-5f);

    player.process_audio_events();
    float decayed = *std::max_element(player.visualizer().bars().begin(), player.visualizer().bars().end());
    ASSERT_NEAR(decayed, 0.85f, 1e-5f);
}

TEST_CASE(test_paused_player_decays_every_tick) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);

    std::vector<float> tone(2048);
    for (size_t n = 0; n < tone.size(); ++n) {
        tone[n] = std::sin(2.0f * 3.14159265f * 60.0f * static_cast<float>(n) / 2048.0f);
    }
    ch.samples->push_latest(tone);
    player.process_audio_events();
    player.process_audio_events();  // not playing: decays right away

    float max = *std::max_element(player.visualizer().bars().begin(), player.visualizer().bars().end());
    ASSERT_NEAR(max, 0.85f, 1e-5f);
}

TEST_CASE(test_remote_intents) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(3), ch);
    using Intent = app::RemoteIntent;

    player.handle_remote({Intent::Type::Seek, 42.0});  // nothing playing
    ASSERT_TRUE(drain(ch).empty());

    player.handle_remote({Intent::Type::Toggle});
    ASSERT_TRUE(player.is_playing());
    player.handle_remote({Intent::Type::Next});
    ASSERT_EQ(*player.playing_index(), 1u);
    player.handle_remote({Intent::Type::Prev});
    ASSERT_EQ(*player.playing_index(), 0u);
    drain(ch);

    player.handle_remote({Intent::Type::SetVolume, 2.0});
    ASSERT_NEAR(player.volume(), 1.0f, 1e-6f);
    player.handle_remote({Intent::Type::Seek, 500.0});
    auto cmds = drain(ch);
    ASSERT_EQ(cmds.size(), 2u);
    ASSERT_NEAR(cmds[0].value, 1.0f, 1e-6f);
    ASSERT_TRUE(cmds[1].type == PlaybackCommand::Type::Seek);
    ASSERT_NEAR(cmds[1].position, 500.0, 1e-9);  // the engine clamps

    player.handle_remote({Intent::Type::CycleTheme});
    ASSERT_TRUE(player.theme() == config::ThemeId::Dracula);
    player.handle_remote({Intent::Type::CycleVisualizer});
    ASSERT_TRUE(player.visualizer().mode() == visualizer::VisualizerMode::Waveform);
    player.handle_remote({Intent::Type::ToggleShuffle});
    ASSERT_TRUE(player.shuffle());
}

TEST_CASE(test_modes_cycle) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(1), ch);

    player.cycle_repeat();
    ASSERT_TRUE(player.repeat() == model::RepeatMode::All);
    player.cycle_repeat();
    ASSERT_TRUE(player.repeat() == model::RepeatMode::One);
    player.cycle_repeat();
    ASSERT_TRUE(player.repeat() == model::RepeatMode::Off);

    for (int i = 0; i < 5; ++i) player.cycle_theme();
    ASSERT_TRUE(player.theme() == config::ThemeId::Default);

    player.toggle_mini_mode();
    ASSERT_TRUE(player.mini_mode());
}

TEST_CASE(test_playback_state_read_model) {
    auto ch = engine::EngineChannels::create();
    app::PlaybackOrchestrator player(playlist(20), ch);
    for (int i = 0; i < 10; ++i) player.move_selection_down();
    player.play(4);
    player.cycle_repeat();

    auto now = Clock::now();
    player.cycle_sleep_timer(now);
    auto state = player.playback_state(now, 6);

    ASSERT_EQ(*state.track_title, std::string("Song 4"));
    ASSERT_EQ(*state.track_artist, std::string("Artist"));
    ASSERT_TRUE(state.is_playing);
    ASSERT_EQ(state.repeat, std::string("All"));
    ASSERT_EQ(state.speed, std::string("1x"));
    ASSERT_EQ(state.theme, std::string("Default"));
    ASSERT_EQ(state.visualizer_mode, std::string("Spectrum"));
    ASSERT_EQ(state.visualizer_bars.size(), visualizer::Visualizer::NUM_BANDS);
    ASSERT_EQ(*state.sleep_timer_seconds, 900);
    ASSERT_EQ(state.track_count, 20u);

    ASSERT_EQ(state.visible_titles.size(), 6u);
    ASSERT_EQ(state.visible_titles[static_cast<size_t>(state.selected_row)], std::string("Artist - Song 10"));
}

TEST_CASE(test_closed_engine_does_not_block) {
    auto ch = engine::EngineChannels::create();
    ch.commands->close();
    app::PlaybackOrchestrator player(playlist(2), ch);

    auto started = Clock::now();
    player.play(0);
    player.next();
    ASSERT_TRUE(Clock::now() - started < 150ms);
    ASSERT_EQ(*player.playing_index(), 1u);
}

int main() {
    return tunebox::test::TestRunner::instance().run_all("ORCHESTRATOR");
}
