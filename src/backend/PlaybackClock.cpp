#include "backend/PlaybackClock.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace turntable::backend {

PlaybackClock::PlaybackClock(AudioBackend& backend, DurationProbe& probe, const util::TimeSource& time)
    : backend_(backend), probe_(probe), time_(time) {}

void PlaybackClock::reset() {
    phase_ = model::PlaybackPhase::Stopped;
    track_length_ = 0.0;
    start_anchor_ = 0.0;
    pause_accum_ = 0.0;
    last_pause_at_ = 0.0;
    current_path_.clear();
}

std::optional<std::string> PlaybackClock::load_and_play(const std::string& path) {
    util::Logger::info("PlaybackClock: Loading " + path);

    double length = probe_.probe(path);
    if (length <= 0.0) {
        util::Logger::debug("PlaybackClock: Track length unknown for " + path);
        length = 0.0;
    }

    try {
        backend_.load(path);
        backend_.play_from_offset(0.0);
    } catch (const LoadError& e) {
        util::Logger::error("PlaybackClock: Could not load " + e.path() + ": " + e.what());
        reset();
        return std::string(e.what());
    } catch (const std::exception& e) {
        util::Logger::error("PlaybackClock: Backend failure while loading " + path + ": " + e.what());
        reset();
        return std::string(e.what());
    }

    phase_ = model::PlaybackPhase::Playing;
    track_length_ = length;
    start_anchor_ = time_.now();
    pause_accum_ = 0.0;
    last_pause_at_ = 0.0;
    current_path_ = path;

    util::Logger::info("PlaybackClock: Playing " + path + " (length " + std::to_string(track_length_) + "s)");
    return std::nullopt;
}

void PlaybackClock::pause() {
    if (phase_ != model::PlaybackPhase::Playing) return;

    try {
        backend_.pause();
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("PlaybackClock: Backend pause failed: ") + e.what());
    }
    phase_ = model::PlaybackPhase::Paused;
    last_pause_at_ = time_.now();
    util::Logger::debug("PlaybackClock: Paused at " + std::to_string(elapsed()) + "s");
}

void PlaybackClock::resume() {
    if (phase_ != model::PlaybackPhase::Paused) return;

    try {
        backend_.resume();
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("PlaybackClock: Backend resume failed: ") + e.what());
    }
    phase_ = model::PlaybackPhase::Playing;
    pause_accum_ += time_.now() - last_pause_at_;
    last_pause_at_ = 0.0;
    util::Logger::debug("PlaybackClock: Resumed at " + std::to_string(elapsed()) + "s");
}

void PlaybackClock::stop() {
    try {
        backend_.stop();
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("PlaybackClock: Backend stop failed: ") + e.what());
    }
    if (phase_ != model::PlaybackPhase::Stopped) {
        util::Logger::info("PlaybackClock: Stopped");
    }
    reset();
}

bool PlaybackClock::seek(double offset_seconds) {
    if (phase_ == model::PlaybackPhase::Stopped || track_length_ <= 0.0) {
        return false;
    }
    if (!std::isfinite(offset_seconds)) {
        util::Logger::warn("PlaybackClock: Ignoring non-finite seek offset");
        return false;
    }

    double offset = std::clamp(offset_seconds, 0.0, track_length_);
    bool was_paused = (phase_ == model::PlaybackPhase::Paused);

    // No in-place seek exists: restart at the offset, re-pause if needed so a
    // seek while paused stays silent
    try {
        backend_.play_from_offset(offset);
        if (was_paused) {
            backend_.pause();
        }
    } catch (const std::exception& e) {
        util::Logger::error("PlaybackClock: Seek restart failed for " + current_path_ + ": " + e.what());
        stop();
        return false;
    }

    double now = time_.now();
    start_anchor_ = now - offset;
    pause_accum_ = 0.0;
    last_pause_at_ = was_paused ? now : 0.0;

    util::Logger::debug("PlaybackClock: Seek to " + std::to_string(offset) + "s" +
                        (was_paused ? " (paused)" : ""));
    return true;
}

double PlaybackClock::elapsed() const {
    switch (phase_) {
        case model::PlaybackPhase::Stopped:
            return 0.0;
        case model::PlaybackPhase::Paused:
            return std::max(0.0, (last_pause_at_ - start_anchor_) - pause_accum_);
        case model::PlaybackPhase::Playing:
            return std::max(0.0, (time_.now() - start_anchor_) - pause_accum_);
    }
    return 0.0;
}

bool PlaybackClock::poll_for_completion() const {
    if (phase_ != model::PlaybackPhase::Playing) return false;
    return !backend_.is_busy();
}

void PlaybackClock::set_volume(double volume) {
    try {
        backend_.set_volume(std::clamp(volume, 0.0, 1.0));
    } catch (const std::exception& e) {
        util::Logger::warn(std::string("PlaybackClock: Volume change ignored: ") + e.what());
    }
}

double PlaybackClock::volume() const {
    return backend_.current_volume();
}

}  // namespace turntable::backend
