#include "backend/PlaylistStore.hpp"
#include "util/BoyerMoore.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <sys/random.h>
#include <sys/types.h>

namespace turntable::backend {

namespace {
    uint64_t random_seed() {
        uint64_t seed = 0;
        if (getrandom(&seed, sizeof(seed), 0) != static_cast<ssize_t>(sizeof(seed))) {
            util::Logger::warn("PlaylistStore: getrandom failed, seeding shuffle from clock");
            seed = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
        }
        return seed;
    }
}

PlaylistStore::PlaylistStore() : PlaylistStore(random_seed()) {}

PlaylistStore::PlaylistStore(uint64_t shuffle_seed) : rng_(shuffle_seed) {}

size_t PlaylistStore::add_tracks(const std::vector<std::string>& paths) {
    size_t added = 0;
    for (const auto& path : paths) {
        if (util::Platform::is_audio_file(path)) {
            tracks_.push_back(path);
            added++;
        } else {
            util::Logger::debug("PlaylistStore: Skipping unsupported file: " + path);
        }
    }
    update_original_order();

    util::Logger::info("PlaylistStore: Added " + std::to_string(added) + " of " +
                       std::to_string(paths.size()) + " files (playlist size " +
                       std::to_string(tracks_.size()) + ")");
    return added;
}

size_t PlaylistStore::add_folder(const std::filesystem::path& folder) {
    auto files = util::DirectoryScanner::scan_directory(folder);
    tracks_.insert(tracks_.end(), files.begin(), files.end());
    update_original_order();

    util::Logger::info("PlaylistStore: Added " + std::to_string(files.size()) +
                       " files from folder " + folder.string());
    return files.size();
}

void PlaylistStore::remove_items(const std::vector<int>& indices) {
    std::vector<int> ordered = indices;
    std::sort(ordered.begin(), ordered.end(), std::greater<int>());
    ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

    // Highest first so lower indices stay valid while erasing
    for (int idx : ordered) {
        if (idx < 0 || idx >= static_cast<int>(tracks_.size())) {
            continue;
        }
        tracks_.erase(tracks_.begin() + idx);
        if (idx == current_index_) {
            current_index_ = -1;
        } else if (idx < current_index_) {
            current_index_--;
        }
    }

    update_original_order();

    if (current_index_ >= static_cast<int>(tracks_.size())) {
        current_index_ = static_cast<int>(tracks_.size()) - 1;
    }

    util::Logger::info("PlaylistStore: Removed items, playlist size " + std::to_string(tracks_.size()) +
                       ", current_index=" + std::to_string(current_index_));
}

void PlaylistStore::clear() {
    util::Logger::info("PlaylistStore: Clearing playlist");

    tracks_.clear();
    original_order_.clear();
    current_index_ = -1;
}

void PlaylistStore::toggle_shuffle() {
    shuffle_mode_ = !shuffle_mode_;
    util::Logger::info(std::string("PlaylistStore: Shuffle ") + (shuffle_mode_ ? "on" : "off"));

    if (shuffle_mode_) {
        apply_shuffle();
    } else {
        restore_original_order();
    }
}

void PlaylistStore::toggle_repeat() {
    repeat_mode_ = (repeat_mode_ == model::RepeatMode::Off) ? model::RepeatMode::One : model::RepeatMode::Off;
    util::Logger::info(std::string("PlaylistStore: Repeat ") + model::to_string(repeat_mode_));
}

void PlaylistStore::apply_shuffle() {
    if (tracks_.empty()) return;

    std::vector<model::TrackRef> working = tracks_;
    std::optional<model::TrackRef> current;

    if (current_index_ >= 0) {
        current = working[current_index_];
        working.erase(working.begin() + current_index_);
    }

    std::shuffle(working.begin(), working.end(), rng_);

    if (current) {
        working.insert(working.begin(), *current);
        current_index_ = 0;
    }

    tracks_ = std::move(working);
}

void PlaylistStore::restore_original_order() {
    if (original_order_.empty()) return;

    std::optional<model::TrackRef> current = current_track();
    tracks_ = original_order_;

    if (current) {
        auto it = std::find(tracks_.begin(), tracks_.end(), *current);
        current_index_ = (it != tracks_.end()) ? static_cast<int>(it - tracks_.begin()) : -1;
    }
}

void PlaylistStore::update_original_order() {
    original_order_ = tracks_;
}

int PlaylistStore::next_index() const {
    if (tracks_.empty()) return -1;
    if (repeat_mode_ == model::RepeatMode::One) return current_index_;

    const int n = static_cast<int>(tracks_.size());
    return ((current_index_ + 1) % n + n) % n;
}

int PlaylistStore::prev_index() const {
    if (tracks_.empty()) return -1;
    if (repeat_mode_ == model::RepeatMode::One) return current_index_;

    const int n = static_cast<int>(tracks_.size());
    return ((current_index_ - 1) % n + n) % n;
}

bool PlaylistStore::set_current_index(int index) {
    if (index == -1 || (index >= 0 && index < static_cast<int>(tracks_.size()))) {
        current_index_ = index;
        return true;
    }
    util::Logger::debug("PlaylistStore: Ignoring out-of-range index " + std::to_string(index));
    return false;
}

std::optional<model::TrackRef> PlaylistStore::current_track() const {
    if (current_index_ >= 0 && current_index_ < static_cast<int>(tracks_.size())) {
        return tracks_[current_index_];
    }
    return std::nullopt;
}

std::vector<size_t> PlaylistStore::filter(const std::string& query) const {
    std::vector<size_t> matches;
    const std::string needle = util::normalize_for_search(query);

    if (needle.empty()) {
        matches.resize(tracks_.size());
        for (size_t i = 0; i < tracks_.size(); ++i) matches[i] = i;
        return matches;
    }

    util::BoyerMooreSearch search(needle);
    for (size_t i = 0; i < tracks_.size(); ++i) {
        if (search.contains(util::normalize_for_search(util::Platform::display_name(tracks_[i])))) {
            matches.push_back(i);
        }
    }
    return matches;
}

}  // namespace turntable::backend
