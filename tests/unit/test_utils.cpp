#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "config/KeyMap.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "ui/CommandLine.hpp"
#include "ui/Formatting.hpp"
#include "util/BoyerMoore.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <filesystem>
#include <fstream>

using namespace turntable;
using namespace turntable::util;

namespace {

std::filesystem::path write_config(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << body;
    return path;
}

}  // namespace

// ========== SEARCH ==========

TEST_CASE(test_boyer_moore_search) {
    BoyerMooreSearch bms("needle");
    ASSERT_EQ(bms.search("haystack needle haystack"), 9);
}

TEST_CASE(test_boyer_moore_search_not_found) {
    BoyerMooreSearch bms("gold");
    ASSERT_EQ(bms.search("haystack needle haystack"), -1);
    ASSERT_FALSE(bms.contains("go"));
}

TEST_CASE(test_boyer_moore_case_insensitive) {
    BoyerMooreSearch bms("NEEDLE", false);
    ASSERT_EQ(bms.search("haystack needle haystack"), 9);

    BoyerMooreSearch exact("NEEDLE");
    ASSERT_EQ(exact.search("haystack needle haystack"), -1);
}

TEST_CASE(test_boyer_moore_start_position) {
    BoyerMooreSearch bms("ab");
    ASSERT_EQ(bms.search("ab ab ab", 1), 3);
    ASSERT_EQ(bms.search("ab", 5), -1);
}

TEST_CASE(test_boyer_moore_empty_pattern) {
    BoyerMooreSearch bms("");
    ASSERT_EQ(bms.search("anything"), -1);
}

TEST_CASE(test_normalize_for_search) {
    ASSERT_EQ(normalize_for_search("Café DEL Mar"), "cafe del mar");
    ASSERT_EQ(normalize_for_search("plain"), "plain");
}

// ========== PLATFORM ==========

TEST_CASE(test_is_audio_file) {
    ASSERT_TRUE(Platform::is_audio_file("/a/b/song.mp3"));
    ASSERT_TRUE(Platform::is_audio_file("TUNE.XM"));
    ASSERT_TRUE(Platform::is_audio_file("x.s3m"));
    ASSERT_FALSE(Platform::is_audio_file("cover.jpg"));
    ASSERT_FALSE(Platform::is_audio_file("mp3"));
    ASSERT_FALSE(Platform::is_audio_file("song.m4a"));
}

TEST_CASE(test_detect_format) {
    ASSERT_EQ(Platform::detect_format("a.Flac"), model::AudioFormat::FLAC);
    ASSERT_EQ(Platform::detect_format("a.it"), model::AudioFormat::IT);
    ASSERT_EQ(Platform::detect_format("a.wav"), model::AudioFormat::WAV);
    ASSERT_EQ(Platform::detect_format("a.txt"), model::AudioFormat::Unknown);
}

TEST_CASE(test_display_name) {
    ASSERT_EQ(Platform::display_name("/music/a/b.mp3"), "b.mp3");
    ASSERT_EQ(Platform::display_name("b.mp3"), "b.mp3");
}

// ========== FORMATTING ==========

TEST_CASE(test_format_clock) {
    ASSERT_EQ(ui::format_clock(0.0), "00:00");
    ASSERT_EQ(ui::format_clock(65.9), "01:05");
    ASSERT_EQ(ui::format_clock(3725.0), "1:02:05");
    ASSERT_EQ(ui::format_clock(-3.0), "00:00");
    ASSERT_EQ(ui::format_length(0.0), "--:--");
    ASSERT_EQ(ui::format_length(180.0), "03:00");
}

TEST_CASE(test_trunc_pad) {
    ASSERT_EQ(ui::trunc_pad("abc", 5), "abc  ");
    ASSERT_EQ(ui::trunc_pad("abcdef", 4), "abc~");
    ASSERT_EQ(ui::display_cols("héllo"), 5);
    ASSERT_EQ(ui::trunc_pad("héllo!", 3), "hé~");
}

TEST_CASE(test_status_line) {
    model::PlayerSnapshot snap;
    snap.phase = model::PlaybackPhase::Playing;
    snap.elapsed = 83.0;
    snap.track_length = 180.0;
    snap.current_track_name = "song.mp3";
    snap.current_index = 1;
    snap.track_count = 9;
    snap.volume = 0.8;
    snap.repeat_mode = model::RepeatMode::One;

    ASSERT_EQ(ui::status_line(snap), "[Playing] song.mp3  01:23 / 03:00  vol 80%  repeat:one  (2/9)");
}

// ========== CONFIG ==========

TEST_CASE(test_config_parses_sections) {
    auto path = write_config("turntable_cfg_ok.toml",
        "# comment\n"
        "[playback]\n"
        "default_volume = 35\n"
        "shuffle = true\n"
        "repeat = \"one\"\n"
        "tick_hz = 30\n"
        "seek_step_seconds = 15\n"
        "volume_step_percent = 2\n"
        "\n"
        "[logging]\n"
        "log_file = \"/tmp/tt.log\"\n"
        "level = \"debug\"\n"
        "[keybinds]\n"
        "next = \"j\"\n"
        "[paths]\n"
        "music_directory = \"/srv/music\"\n");

    auto cfg = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.default_volume, 35);
    ASSERT_TRUE(cfg.shuffle);
    ASSERT_EQ(cfg.repeat, "one");
    ASSERT_EQ(cfg.tick_hz, 30);
    ASSERT_EQ(cfg.seek_step_seconds, 15);
    ASSERT_EQ(cfg.volume_step_percent, 2);
    ASSERT_EQ(cfg.log_file, std::filesystem::path("/tmp/tt.log"));
    ASSERT_EQ(cfg.log_level, "debug");
    ASSERT_EQ(cfg.keybinds.at("next"), "j");
    ASSERT_EQ(cfg.music_directory, std::filesystem::path("/srv/music"));

    std::filesystem::remove(path);
}

TEST_CASE(test_config_invalid_values_keep_defaults) {
    auto path = write_config("turntable_cfg_bad.toml",
        "[playback]\n"
        "default_volume = loud\n"
        "tick_hz = 0\n"
        "repeat = \"all\"\n");

    auto cfg = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.default_volume, 80);
    ASSERT_EQ(cfg.tick_hz, 60);
    ASSERT_EQ(cfg.repeat, "off");
    ASSERT_FALSE(cfg.shuffle);

    std::filesystem::remove(path);
}

TEST_CASE(test_config_save_then_load) {
    backend::Config cfg;
    cfg.default_volume = 55;
    cfg.repeat = "one";
    cfg.keybinds["quit"] = "x";
    auto path = std::filesystem::temp_directory_path() / "turntable_cfg_dir" / "config.toml";
    std::filesystem::remove_all(path.parent_path());

    backend::ConfigLoader::save_config(cfg, path);
    auto loaded = backend::ConfigLoader::load_from_file(path);
    ASSERT_EQ(loaded.default_volume, 55);
    ASSERT_EQ(loaded.repeat, "one");
    ASSERT_EQ(loaded.keybinds.at("quit"), "x");

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE(test_config_missing_file_defaults) {
    auto cfg = backend::ConfigLoader::load_from_file("/nonexistent/turntable.toml");
    ASSERT_EQ(cfg.default_volume, 80);
    ASSERT_EQ(cfg.tick_hz, 60);
}

// ========== KEYMAP / COMMANDS ==========

TEST_CASE(test_keymap_defaults_and_overrides) {
    config::KeyMap keymap;
    ASSERT_EQ(keymap.lookup_action("n"), "next");
    ASSERT_EQ(keymap.lookup_action("unbound"), "");

    keymap.apply_overrides({{"next", "j"}, {"bogus", "k"}});
    ASSERT_EQ(keymap.lookup_action("j"), "next");
    ASSERT_EQ(keymap.lookup_action("k"), "");
    ASSERT_EQ(keymap.keys_for("next").size(), 3u);
}

TEST_CASE(test_every_action_maps_to_event) {
    for (const auto& action : config::KeyMap::known_actions()) {
        ASSERT_TRUE(config::KeyMap::event_for_action(action).has_value());
    }
    ASSERT_FALSE(config::KeyMap::event_for_action("dance").has_value());
}

TEST_CASE(test_tokenize_quotes) {
    auto words = ui::tokenize("add \"/m/my song.mp3\"  /m/b.ogg");
    ASSERT_EQ(words.size(), 3u);
    ASSERT_EQ(words[1], "/m/my song.mp3");
}

TEST_CASE(test_parse_time) {
    ASSERT_NEAR(*ui::parse_time("90"), 90.0, 1e-9);
    ASSERT_NEAR(*ui::parse_time("1:30"), 90.0, 1e-9);
    ASSERT_NEAR(*ui::parse_time("1:00:05"), 3605.0, 1e-9);
    ASSERT_FALSE(ui::parse_time("1:75").has_value());
    ASSERT_FALSE(ui::parse_time("abc").has_value());
    ASSERT_FALSE(ui::parse_time("-3").has_value());
    ASSERT_FALSE(ui::parse_time("nan").has_value());
    ASSERT_FALSE(ui::parse_time("inf").has_value());
    ASSERT_FALSE(ui::parse_time("1:nan").has_value());
}

TEST_CASE(test_parse_commands) {
    config::KeyMap keymap;
    backend::Config cfg;
    cfg.seek_step_seconds = 7;

    auto seek = ui::parse_command("seek 1:30", keymap, cfg);
    ASSERT_TRUE(seek.event.has_value());
    ASSERT_EQ(seek.event->type, events::Event::Type::Seek);
    ASSERT_NEAR(seek.event->seek_seconds, 90.0, 1e-9);

    auto fwd = ui::parse_command("l", keymap, cfg);
    ASSERT_EQ(fwd.event->type, events::Event::Type::SeekForward);
    ASSERT_NEAR(fwd.event->seek_seconds, 7.0, 1e-9);

    auto play = ui::parse_command("play 3", keymap, cfg);
    ASSERT_EQ(play.event->type, events::Event::Type::PlayIndex);
    ASSERT_EQ(play.event->index, 2);

    auto rm = ui::parse_command("rm 1 3", keymap, cfg);
    ASSERT_EQ(rm.event->type, events::Event::Type::RemoveTracks);
    ASSERT_TRUE((rm.event->indices == std::vector<int>{0, 2}));

    auto blank = ui::parse_command("", keymap, cfg);
    ASSERT_EQ(blank.event->type, events::Event::Type::PlayPause);

    auto bad = ui::parse_command("rm zero", keymap, cfg);
    ASSERT_FALSE(bad.event.has_value());
    ASSERT_FALSE(bad.error.empty());

    auto unknown = ui::parse_command("dance", keymap, cfg);
    ASSERT_FALSE(unknown.event.has_value());
}

// ========== EVENTS ==========

TEST_CASE(test_event_bus_publish_and_unsubscribe) {
    auto& bus = events::EventBus::instance();
    bus.clear();

    int hits = 0;
    auto id = bus.subscribe(events::Event::Type::NextTrack, [&hits](const events::Event&) { hits++; });
    bus.subscribe(events::Event::Type::Stop, [&hits](const events::Event&) { hits += 100; });

    bus.publish({events::Event::Type::NextTrack});
    ASSERT_EQ(hits, 1);

    bus.unsubscribe(id);
    bus.publish({events::Event::Type::NextTrack});
    ASSERT_EQ(hits, 1);

    bus.clear();
}

TEST_CASE(test_scheduler_runs_due_tasks) {
    using namespace std::chrono;
    events::Scheduler scheduler;
    int fast = 0, slow = 0;

    auto start = events::Scheduler::Clock::now();
    scheduler.schedule("fast", milliseconds(10), [&fast] { fast++; });
    scheduler.schedule("slow", milliseconds(1000), [&slow] { slow++; });

    scheduler.process(start + milliseconds(20));
    ASSERT_EQ(fast, 1);
    ASSERT_EQ(slow, 0);

    scheduler.process(start + milliseconds(25));
    ASSERT_EQ(fast, 1);

    scheduler.process(start + milliseconds(1100));
    ASSERT_EQ(fast, 2);
    ASSERT_EQ(slow, 1);

    ASSERT_EQ(scheduler.time_until_next(start + milliseconds(1100), milliseconds(50)).count(), 10);

    scheduler.unschedule("fast");
    scheduler.unschedule("slow");
    ASSERT_EQ(scheduler.time_until_next(start, milliseconds(50)).count(), 50);
}

int main() {
    return turntable::test::TestRunner::instance().run_all();
}
