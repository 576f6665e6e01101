#pragma once

#include "model/Snapshot.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace turntable::backend {

// Ordered track list with a cursor, shuffle/repeat modes and the
// original-order snapshot used to undo shuffling.
//
// current_index is -1 when nothing is selected, otherwise a valid index.
class PlaylistStore {
public:
    PlaylistStore();
    explicit PlaylistStore(uint64_t shuffle_seed);

    // Appends supported files, skipping the rest. Returns the number added.
    size_t add_tracks(const std::vector<std::string>& paths);
    size_t add_folder(const std::filesystem::path& folder);
    void remove_items(const std::vector<int>& indices);
    void clear();

    void toggle_shuffle();
    void toggle_repeat();
    void set_repeat_mode(model::RepeatMode mode) { repeat_mode_ = mode; }

    [[nodiscard]] int next_index() const;
    [[nodiscard]] int prev_index() const;

    bool set_current_index(int index);
    int current_index() const { return current_index_; }
    std::optional<model::TrackRef> current_track() const;

    // Indices whose file name contains query (case and accent insensitive)
    std::vector<size_t> filter(const std::string& query) const;

    const std::vector<model::TrackRef>& tracks() const { return tracks_; }
    const std::vector<model::TrackRef>& original_order() const { return original_order_; }
    size_t size() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }
    bool shuffle_enabled() const { return shuffle_mode_; }
    model::RepeatMode repeat_mode() const { return repeat_mode_; }

private:
    void apply_shuffle();
    void restore_original_order();
    void update_original_order();

    std::vector<model::TrackRef> tracks_;
    std::vector<model::TrackRef> original_order_;
    int current_index_ = -1;
    model::RepeatMode repeat_mode_ = model::RepeatMode::Off;
    bool shuffle_mode_ = false;
    std::mt19937_64 rng_;
};

}  // namespace turntable::backend
