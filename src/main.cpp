#include "backend/Config.hpp"
#include "backend/MetadataDurationProbe.hpp"
#include "backend/PipeWireBackend.hpp"
#include "backend/Player.hpp"
#include "config/KeyMap.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "ui/CommandLine.hpp"
#include "ui/Formatting.hpp"
#include "util/Logger.hpp"
#include "util/TimeSource.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <vector>

using namespace turntable;
using events::Event;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_alerts(backend::Player& player) {
    for (const auto& alert : player.drain_alerts()) {
        std::cout << "[" << alert.level << "] " << alert.message << std::endl;
    }
}

static void print_playlist(const backend::Player& player, const std::vector<size_t>& only = {}) {
    const auto& tracks = player.playlist().tracks();
    auto lines = ui::playlist_lines(tracks, player.playlist().current_index());
    if (only.empty()) {
        for (const auto& line : lines) std::cout << line << "\n";
    } else {
        for (size_t i : only) std::cout << lines[i] << "\n";
    }
    std::cout << tracks.size() << " track(s)" << std::endl;
}

static void subscribe_intents(backend::Player& player) {
    auto& bus = events::EventBus::instance();

    // ========== TRANSPORT ==========
    bus.subscribe(Event::Type::Play, [&player](const Event&) { player.play(); });
    bus.subscribe(Event::Type::Pause, [&player](const Event&) { player.pause(); });
    bus.subscribe(Event::Type::PlayPause, [&player](const Event&) { player.play_pause(); });
    bus.subscribe(Event::Type::Stop, [&player](const Event&) { player.stop(); });
    bus.subscribe(Event::Type::NextTrack, [&player](const Event&) { player.next(); });
    bus.subscribe(Event::Type::PrevTrack, [&player](const Event&) { player.previous(); });

    bus.subscribe(Event::Type::PlayIndex, [&player](const Event& evt) {
        if (evt.index >= static_cast<int>(player.playlist().size())) {
            std::cout << "No track " << evt.index + 1 << std::endl;
            return;
        }
        player.play_index(evt.index);
    });

    bus.subscribe(Event::Type::Seek, [&player](const Event& evt) {
        if (!player.seek(evt.seek_seconds)) {
            std::cout << "Cannot seek: nothing playing or length unknown" << std::endl;
        }
    });
    bus.subscribe(Event::Type::SeekForward, [&player](const Event& evt) {
        player.seek_by(evt.seek_seconds);
    });
    bus.subscribe(Event::Type::SeekBackward, [&player](const Event& evt) {
        player.seek_by(-evt.seek_seconds);
    });

    bus.subscribe(Event::Type::SetVolume, [&player](const Event& evt) {
        player.set_volume(evt.volume_delta / 100.0);
    });
    bus.subscribe(Event::Type::VolumeUp, [&player](const Event& evt) {
        player.adjust_volume(evt.volume_delta / 100.0);
    });
    bus.subscribe(Event::Type::VolumeDown, [&player](const Event& evt) {
        player.adjust_volume(-evt.volume_delta / 100.0);
    });

    // ========== PLAYLIST ==========
    bus.subscribe(Event::Type::ShuffleToggle, [&player](const Event&) {
        player.toggle_shuffle();
        std::cout << "Shuffle " << (player.playlist().shuffle_enabled() ? "on" : "off") << std::endl;
    });
    bus.subscribe(Event::Type::RepeatToggle, [&player](const Event&) {
        player.toggle_repeat();
        std::cout << "Repeat " << model::to_string(player.playlist().repeat_mode()) << std::endl;
    });
    bus.subscribe(Event::Type::AddTracks, [&player](const Event& evt) {
        size_t added = player.add_tracks(evt.paths);
        std::cout << "Added " << added << " track(s)" << std::endl;
    });
    bus.subscribe(Event::Type::AddFolder, [&player](const Event& evt) {
        size_t added = player.add_folder(evt.data);
        if (added > 0) std::cout << "Added " << added << " track(s)" << std::endl;
    });
    bus.subscribe(Event::Type::RemoveTracks, [&player](const Event& evt) {
        player.remove_items(evt.indices);
    });
    bus.subscribe(Event::Type::ClearPlaylist, [&player](const Event&) {
        player.clear_playlist();
    });
    bus.subscribe(Event::Type::Search, [&player](const Event& evt) {
        auto matches = player.filter(evt.data);
        if (matches.empty()) {
            std::cout << "No matches for \"" << evt.data << "\"" << std::endl;
            return;
        }
        print_playlist(player, matches);
    });
    bus.subscribe(Event::Type::ListPlaylist, [&player](const Event&) {
        print_playlist(player);
    });
    bus.subscribe(Event::Type::Quit, [](const Event&) {
        g_shutdown.store(true);
    });
}

// Feeds complete lines from stdin to the command parser; false on EOF
static bool read_commands(std::string& pending, const config::KeyMap& keymap, const backend::Config& cfg) {
    char buf[1024];
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n == 0) return false;
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return true;
        util::Logger::error(std::string("main: stdin read failed: ") + std::strerror(errno));
        return false;
    }
    pending.append(buf, static_cast<size_t>(n));

    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, newline);
        pending.erase(0, newline + 1);

        auto result = ui::parse_command(line, keymap, cfg);
        if (!result.event) {
            std::cout << result.error << std::endl;
            continue;
        }
        events::EventBus::instance().publish(*result.event);
    }
    return true;
}

int main(int argc, char* argv[]) {
    try {
        auto cfg = backend::ConfigLoader::load_config();

        util::Logger::init(cfg.log_file, util::Logger::parse_level(cfg.log_level));
        util::Logger::info("turntable starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        backend::PipeWireBackend audio_backend;
        backend::MetadataDurationProbe probe;
        util::SystemTimeSource time_source;
        backend::Player player(audio_backend, probe, time_source);

        player.set_volume(cfg.default_volume / 100.0);
        if (cfg.shuffle) player.toggle_shuffle();
        if (cfg.repeat == "one") player.toggle_repeat();

        namespace fs = std::filesystem;
        std::error_code ec;
        if (!cfg.music_directory.empty() && fs::is_directory(cfg.music_directory, ec)) {
            player.add_folder(cfg.music_directory);
        }
        for (int i = 1; i < argc; ++i) {
            fs::path arg(argv[i]);
            if (fs::is_directory(arg, ec)) {
                player.add_folder(arg);
            } else {
                player.add_tracks({arg.string()});
            }
        }

        config::KeyMap keymap;
        keymap.apply_overrides(cfg.keybinds);
        subscribe_intents(player);

        events::Scheduler scheduler;
        auto tick_period = std::chrono::milliseconds(std::max(1, 1000 / cfg.tick_hz));

        model::PlayerSnapshot last_snapshot;
        scheduler.schedule("tick", tick_period, [&player, &last_snapshot] {
            last_snapshot = player.tick();
            print_alerts(player);
        });
        scheduler.schedule("status", std::chrono::milliseconds(1000), [&last_snapshot] {
            if (last_snapshot.phase == model::PlaybackPhase::Playing) {
                std::cout << ui::status_line(last_snapshot) << std::endl;
            }
        });

        std::cout << "turntable: " << player.playlist().size()
                  << " track(s). Type a command (ls, p, n, N, seek 1:30, q)." << std::endl;
        print_alerts(player);

        std::string pending;
        while (!g_shutdown.load()) {
            auto timeout = scheduler.time_until_next(events::Scheduler::Clock::now(), tick_period);

            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (ready < 0 && errno != EINTR) {
                util::Logger::error(std::string("main: poll failed: ") + std::strerror(errno));
                break;
            }
            if (ready > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
                if (!read_commands(pending, keymap, cfg)) {
                    util::Logger::info("main: stdin closed");
                    break;
                }
                print_alerts(player);
            }

            scheduler.process();
        }

        player.stop();
        events::EventBus::instance().clear();
        util::Logger::info("turntable shut down cleanly");
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Fatal error: ") + e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
