#include "model/Snapshot.hpp"

namespace turntable::model {

const char* to_string(PlaybackPhase phase) {
    switch (phase) {
        case PlaybackPhase::Stopped: return "Stopped";
        case PlaybackPhase::Playing: return "Playing";
        case PlaybackPhase::Paused: return "Paused";
    }
    return "Unknown";
}

const char* to_string(RepeatMode mode) {
    switch (mode) {
        case RepeatMode::Off: return "Off";
        case RepeatMode::One: return "One";
    }
    return "Unknown";
}

}  // namespace turntable::model
