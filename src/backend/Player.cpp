#include "backend/Player.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <chrono>

namespace turntable::backend {

Player::Player(AudioBackend& backend, DurationProbe& probe, const util::TimeSource& time)
    : clock_(backend, probe, time) {}

Player::Player(AudioBackend& backend, DurationProbe& probe, const util::TimeSource& time, uint64_t shuffle_seed)
    : playlist_(shuffle_seed), clock_(backend, probe, time) {}

void Player::push_alert(const std::string& level, const std::string& message) {
    alerts_.push_back({level, message, std::chrono::steady_clock::now()});
}

bool Player::load_and_play(int index) {
    if (index < 0 || index >= static_cast<int>(playlist_.size())) {
        return false;
    }

    const std::string path = playlist_.tracks()[index];
    auto error = clock_.load_and_play(path);
    if (error) {
        // Cursor stays on the failed track; the caller decides whether to skip
        push_alert("error", "Could not load: " + path + "\n" + *error);
        return false;
    }
    return true;
}

// ========== TRANSPORT ==========

void Player::play() {
    if (playlist_.empty()) {
        push_alert("info", "Add files or a folder first.");
        return;
    }

    switch (clock_.phase()) {
        case model::PlaybackPhase::Paused:
            clock_.resume();
            return;
        case model::PlaybackPhase::Playing:
            return;
        case model::PlaybackPhase::Stopped:
            break;
    }

    select_first_if_unset();
    load_and_play(playlist_.current_index());
}

void Player::pause() {
    clock_.pause();
}

void Player::play_pause() {
    if (clock_.phase() == model::PlaybackPhase::Playing) {
        clock_.pause();
    } else {
        play();
    }
}

void Player::stop() {
    clock_.stop();
}

void Player::next() {
    if (playlist_.empty()) return;

    int target = playlist_.next_index();
    playlist_.set_current_index(target);
    load_and_play(target);
}

void Player::previous() {
    if (playlist_.empty()) return;

    int target = playlist_.prev_index();
    playlist_.set_current_index(target);
    load_and_play(target);
}

bool Player::play_index(int index) {
    if (index < 0 || index >= static_cast<int>(playlist_.size())) {
        return false;
    }
    playlist_.set_current_index(index);
    return load_and_play(index);
}

bool Player::seek(double offset_seconds) {
    const std::string path = clock_.current_path();
    if (clock_.seek(offset_seconds)) {
        return true;
    }
    // A rejected seek leaves the phase alone; a failed restart stops the clock
    if (!path.empty() && clock_.phase() == model::PlaybackPhase::Stopped) {
        push_alert("error", "Could not seek: " + path);
    }
    return false;
}

bool Player::seek_by(double delta_seconds) {
    return seek(std::max(0.0, clock_.elapsed() + delta_seconds));
}

void Player::set_volume(double volume) {
    clock_.set_volume(volume);
}

void Player::adjust_volume(double delta) {
    clock_.set_volume(std::clamp(clock_.volume() + delta, 0.0, 1.0));
}

// ========== PLAYLIST ==========

void Player::toggle_shuffle() {
    playlist_.toggle_shuffle();
}

void Player::toggle_repeat() {
    playlist_.toggle_repeat();
}

void Player::select_first_if_unset() {
    if (playlist_.current_index() == -1 && !playlist_.empty()) {
        playlist_.set_current_index(0);
    }
}

size_t Player::add_tracks(const std::vector<std::string>& paths) {
    size_t added = playlist_.add_tracks(paths);
    select_first_if_unset();
    return added;
}

size_t Player::add_folder(const std::filesystem::path& folder) {
    size_t added = playlist_.add_folder(folder);
    if (added == 0) {
        push_alert("info", "No compatible audio files found in " + folder.string());
    }
    select_first_if_unset();
    return added;
}

void Player::remove_items(const std::vector<int>& indices) {
    if (indices.empty()) return;

    playlist_.remove_items(indices);
    if (playlist_.empty()) {
        clock_.stop();
    }
}

void Player::clear_playlist() {
    playlist_.clear();
    clock_.stop();
}

std::vector<size_t> Player::filter(const std::string& query) const {
    return playlist_.filter(query);
}

// ========== TICK ==========

void Player::handle_track_end() {
    util::Logger::debug("Player: End of track detected");

    if (playlist_.repeat_mode() == model::RepeatMode::One) {
        if (!load_and_play(playlist_.current_index())) {
            clock_.stop();
        }
    } else {
        next();
    }
}

model::PlayerSnapshot Player::tick() {
    if (clock_.poll_for_completion()) {
        handle_track_end();
    }
    return snapshot();
}

model::PlayerSnapshot Player::snapshot() const {
    model::PlayerSnapshot snap;
    snap.phase = clock_.phase();
    snap.elapsed = clock_.elapsed();
    snap.track_length = clock_.track_length();
    snap.current_index = playlist_.current_index();
    if (auto track = playlist_.current_track()) {
        snap.current_track_name = util::Platform::display_name(*track);
    }
    snap.track_count = playlist_.size();
    snap.shuffle_enabled = playlist_.shuffle_enabled();
    snap.repeat_mode = playlist_.repeat_mode();
    snap.volume = clock_.volume();
    snap.alerts = alerts_;
    return snap;
}

std::vector<model::Alert> Player::drain_alerts() {
    std::vector<model::Alert> drained;
    drained.swap(alerts_);
    return drained;
}

}  // namespace turntable::backend
