#pragma once

#include "backend/AudioBackend.hpp"
#include "backend/DurationProbe.hpp"
#include "model/Snapshot.hpp"
#include "util/TimeSource.hpp"
#include <optional>
#include <string>

namespace turntable::backend {

// Transport state machine layered over an AudioBackend that cannot report its
// own position.
//
// Elapsed time is always derived from a wall-clock anchor:
//   Playing: (now - start_anchor) - pause_accum
//   Paused:  (last_pause_at - start_anchor) - pause_accum
// Seeking restarts the backend at the offset and moves the anchor so the
// formula yields the offset immediately afterwards.
//
// Not thread-safe: callers serialize all calls on one logical thread.
class PlaybackClock {
public:
    PlaybackClock(AudioBackend& backend, DurationProbe& probe, const util::TimeSource& time);

    // Returns the error message on failure; the clock is then Stopped.
    [[nodiscard]] std::optional<std::string> load_and_play(const std::string& path);

    void pause();
    void resume();
    void stop();

    // Applied only while Playing/Paused with a known track length and a
    // finite offset. A failed restart stops the clock and returns false.
    bool seek(double offset_seconds);

    [[nodiscard]] double elapsed() const;

    // True when the backend stopped producing audio while Playing.
    [[nodiscard]] bool poll_for_completion() const;

    void set_volume(double volume);
    double volume() const;

    model::PlaybackPhase phase() const { return phase_; }
    double track_length() const { return track_length_; }
    const std::string& current_path() const { return current_path_; }

private:
    void reset();

    AudioBackend& backend_;
    DurationProbe& probe_;
    const util::TimeSource& time_;

    model::PlaybackPhase phase_ = model::PlaybackPhase::Stopped;
    double track_length_ = 0.0;
    double start_anchor_ = 0.0;
    double pause_accum_ = 0.0;
    double last_pause_at_ = 0.0;
    std::string current_path_;
};

}  // namespace turntable::backend
