#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace turntable::model {

enum class PlaybackPhase {
    Stopped,
    Playing,
    Paused,
};

enum class RepeatMode {
    Off,
    One,
};

enum class AudioFormat {
    Unknown,
    MP3,
    OGG,
    WAV,
    FLAC,
    MOD,
    XM,
    IT,
    S3M,
};

// Opaque track reference. Uniqueness is not enforced.
using TrackRef = std::string;

struct Alert {
    std::string level;  // "info", "warn", "error"
    std::string message;
    std::chrono::steady_clock::time_point timestamp;

    bool operator==(const Alert&) const = default;
};

/// PlayerSnapshot is the value the host reads once per tick.
///
/// Everything here is derived at the moment the snapshot is taken:
/// - elapsed comes from PlaybackClock (anchor + pause accounting), never
///   from the backend
/// - current_track_name is the file name component of the current path
/// - alerts are the user-visible failures raised since the last drain
struct PlayerSnapshot {
    PlaybackPhase phase = PlaybackPhase::Stopped;
    double elapsed = 0.0;
    double track_length = 0.0;  // 0 = unknown
    int current_index = -1;
    std::optional<std::string> current_track_name;
    size_t track_count = 0;
    bool shuffle_enabled = false;
    RepeatMode repeat_mode = RepeatMode::Off;
    double volume = 0.0;
    std::vector<Alert> alerts;

    bool operator==(const PlayerSnapshot&) const = default;
};

const char* to_string(PlaybackPhase phase);
const char* to_string(RepeatMode mode);

}  // namespace turntable::model
