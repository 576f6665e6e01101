#pragma once

#include "backend/AudioBackend.hpp"
#include "backend/DurationProbe.hpp"
#include "backend/PlaybackClock.hpp"
#include "backend/PlaylistStore.hpp"
#include "model/Snapshot.hpp"
#include "util/TimeSource.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace turntable::backend {

// Intent API of the player core. Owns the playlist and the playback clock;
// the host calls intents and tick() from a single thread.
class Player {
public:
    Player(AudioBackend& backend, DurationProbe& probe, const util::TimeSource& time);
    Player(AudioBackend& backend, DurationProbe& probe, const util::TimeSource& time, uint64_t shuffle_seed);

    // ========== TRANSPORT ==========
    void play();
    void pause();
    void play_pause();
    void stop();
    void next();
    void previous();
    bool play_index(int index);

    bool seek(double offset_seconds);
    bool seek_by(double delta_seconds);
    void set_volume(double volume);
    void adjust_volume(double delta);

    // ========== PLAYLIST ==========
    void toggle_shuffle();
    void toggle_repeat();
    size_t add_tracks(const std::vector<std::string>& paths);
    size_t add_folder(const std::filesystem::path& folder);
    void remove_items(const std::vector<int>& indices);
    void clear_playlist();
    std::vector<size_t> filter(const std::string& query) const;

    // Polls for end of track and advances; returns the state to render
    model::PlayerSnapshot tick();
    model::PlayerSnapshot snapshot() const;
    std::vector<model::Alert> drain_alerts();

    const PlaylistStore& playlist() const { return playlist_; }
    PlaylistStore& playlist() { return playlist_; }
    const PlaybackClock& clock() const { return clock_; }

private:
    bool load_and_play(int index);
    void handle_track_end();
    void select_first_if_unset();
    void push_alert(const std::string& level, const std::string& message);

    PlaylistStore playlist_;
    PlaybackClock clock_;
    std::vector<model::Alert> alerts_;
};

}  // namespace turntable::backend
