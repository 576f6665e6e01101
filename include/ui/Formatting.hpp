#pragma once

#include "model/Snapshot.hpp"
#include <string>
#include <vector>

namespace turntable::ui {

/**
 * Format seconds as "mm:ss", or "h:mm:ss" from one hour on.
 * Negative values format as "00:00".
 */
std::string format_clock(double seconds);

/**
 * Like format_clock, but a length of 0 (unknown) renders as "--:--".
 */
std::string format_length(double seconds);

/**
 * Number of terminal columns a UTF-8 string occupies
 * (one per code point, no wide-character handling).
 */
int display_cols(const std::string& s);

/**
 * Truncate to `width` columns (with a trailing "~" when cut) or pad with spaces.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * One-line transport summary:
 *   [Playing] song.mp3  01:23 / 03:00  vol 80%  shuffle  repeat:one  (2/9)
 */
std::string status_line(const model::PlayerSnapshot& snap);

/**
 * Numbered playlist rows (1-based); the current row is marked with '>'.
 */
std::vector<std::string> playlist_lines(const std::vector<std::string>& tracks, int current_index);

}  // namespace turntable::ui
