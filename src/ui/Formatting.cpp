#include "ui/Formatting.hpp"
#include "util/Platform.hpp"
#include <cmath>
#include <cstdio>

namespace turntable::ui {

std::string format_clock(double seconds) {
    long total = seconds > 0.0 ? static_cast<long>(std::floor(seconds)) : 0;
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    char buf[32];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", hours, minutes, secs);
    } else {
        std::snprintf(buf, sizeof(buf), "%02ld:%02ld", minutes, secs);
    }
    return buf;
}

std::string format_length(double seconds) {
    if (seconds <= 0.0) return "--:--";
    return format_clock(seconds);
}

int display_cols(const std::string& s) {
    int cols = 0;
    for (unsigned char c : s) {
        // Continuation bytes (10xxxxxx) belong to the previous code point
        if ((c & 0xC0) != 0x80) ++cols;
    }
    return cols;
}

std::string trunc_pad(const std::string& s, int width) {
    if (width <= 0) return "";

    int cols = display_cols(s);
    if (cols <= width) {
        return s + std::string(width - cols, ' ');
    }

    // Keep width-1 code points and mark the cut
    std::string out;
    int taken = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) {
            if (taken == width - 1) break;
            ++taken;
        }
        out += s[i];
    }
    out += '~';
    return out;
}

std::string status_line(const model::PlayerSnapshot& snap) {
    std::string line = "[";
    line += model::to_string(snap.phase);
    line += "] ";
    line += snap.current_track_name.value_or("(no track)");
    line += "  " + format_clock(snap.elapsed) + " / " + format_length(snap.track_length);
    line += "  vol " + std::to_string(static_cast<int>(std::lround(snap.volume * 100.0))) + "%";
    if (snap.shuffle_enabled) line += "  shuffle";
    if (snap.repeat_mode == model::RepeatMode::One) line += "  repeat:one";
    if (snap.track_count > 0 && snap.current_index >= 0) {
        line += "  (" + std::to_string(snap.current_index + 1) + "/" + std::to_string(snap.track_count) + ")";
    }
    return line;
}

std::vector<std::string> playlist_lines(const std::vector<std::string>& tracks, int current_index) {
    std::vector<std::string> lines;
    lines.reserve(tracks.size());
    for (size_t i = 0; i < tracks.size(); ++i) {
        std::string marker = static_cast<int>(i) == current_index ? "> " : "  ";
        lines.push_back(marker + std::to_string(i + 1) + ". " + util::Platform::display_name(tracks[i]));
    }
    return lines;
}

}  // namespace turntable::ui
