#pragma once

#include "backend/Config.hpp"
#include "config/KeyMap.hpp"
#include "events/EventBus.hpp"
#include <optional>
#include <string>
#include <vector>

namespace turntable::ui {

struct CommandResult {
    std::optional<events::Event> event;
    std::string error;  // set when the line was not understood
};

// Splits on whitespace; double quotes group words ("my song.mp3")
std::vector<std::string> tokenize(const std::string& line);

// Parses "mm:ss", "h:mm:ss" or plain seconds. nullopt when malformed.
std::optional<double> parse_time(const std::string& text);

/**
 * Turns one prompt line into an event.
 *
 * The first word goes through the KeyMap; the rest are arguments. Track
 * numbers are 1-based at the prompt and 0-based in the event. A blank line
 * resolves as the "space" binding. Step sizes default to the configured
 * seek and volume steps.
 */
CommandResult parse_command(const std::string& line,
                            const config::KeyMap& keymap,
                            const backend::Config& cfg);

}  // namespace turntable::ui
