#include "ui/CommandLine.hpp"
#include <cmath>
#include <stdexcept>

namespace turntable::ui {

using events::Event;

namespace {

std::optional<int> parse_int(const std::string& text) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<double> parse_double(const std::string& text) {
    try {
        size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<int> parse_track_number(const std::string& text) {
    auto n = parse_int(text);
    if (!n || *n < 1) return std::nullopt;
    return *n - 1;
}

std::string join(const std::vector<std::string>& words, size_t from) {
    std::string out;
    for (size_t i = from; i < words.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += words[i];
    }
    return out;
}

}  // namespace

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    bool has_token = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_token = true;
        } else if (!in_quotes && (c == ' ' || c == '\t' || c == '\r' || c == '\n')) {
            if (has_token) {
                tokens.push_back(current);
                current.clear();
                has_token = false;
            }
        } else {
            current += c;
            has_token = true;
        }
    }
    if (has_token) tokens.push_back(current);
    return tokens;
}

std::optional<double> parse_time(const std::string& text) {
    if (text.empty()) return std::nullopt;

    double total = 0.0;
    size_t start = 0;
    int fields = 0;
    while (true) {
        size_t colon = text.find(':', start);
        std::string part = text.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        auto value = parse_double(part);
        if (!value || !std::isfinite(*value) || *value < 0.0) return std::nullopt;
        // Only the leading field may exceed 59
        if (fields > 0 && *value >= 60.0) return std::nullopt;
        total = total * 60.0 + *value;
        ++fields;
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    if (fields > 3) return std::nullopt;
    return total;
}

CommandResult parse_command(const std::string& line,
                            const config::KeyMap& keymap,
                            const backend::Config& cfg) {
    CommandResult result;
    auto words = tokenize(line);
    std::string key = words.empty() ? "space" : words.front();

    std::string action = keymap.lookup_action(key);
    if (action.empty()) {
        result.error = "Unknown command: " + key;
        return result;
    }
    auto type = config::KeyMap::event_for_action(action);
    if (!type) {
        result.error = "Unknown action: " + action;
        return result;
    }

    Event event{*type};
    const size_t argc = words.empty() ? 0 : words.size() - 1;

    switch (*type) {
        case Event::Type::Play:
            if (argc >= 1) {
                auto index = parse_track_number(words[1]);
                if (!index) {
                    result.error = "Not a track number: " + words[1];
                    return result;
                }
                event.type = Event::Type::PlayIndex;
                event.index = *index;
            }
            break;

        case Event::Type::PlayIndex: {
            if (argc < 1) {
                result.error = "Usage: " + key + " <track number>";
                return result;
            }
            auto index = parse_track_number(words[1]);
            if (!index) {
                result.error = "Not a track number: " + words[1];
                return result;
            }
            event.index = *index;
            break;
        }

        case Event::Type::Seek: {
            if (argc < 1) {
                result.error = "Usage: " + key + " <mm:ss | seconds>";
                return result;
            }
            auto target = parse_time(words[1]);
            if (!target) {
                result.error = "Not a time: " + words[1];
                return result;
            }
            event.seek_seconds = *target;
            break;
        }

        case Event::Type::SeekForward:
        case Event::Type::SeekBackward: {
            event.seek_seconds = cfg.seek_step_seconds;
            if (argc >= 1) {
                auto step = parse_time(words[1]);
                if (!step) {
                    result.error = "Not a time: " + words[1];
                    return result;
                }
                event.seek_seconds = *step;
            }
            break;
        }

        case Event::Type::SetVolume: {
            auto level = argc >= 1 ? parse_int(words[1]) : std::nullopt;
            if (!level) {
                result.error = "Usage: " + key + " <0-100>";
                return result;
            }
            event.volume_delta = *level;
            break;
        }

        case Event::Type::VolumeUp:
        case Event::Type::VolumeDown: {
            event.volume_delta = cfg.volume_step_percent;
            if (argc >= 1) {
                auto step = parse_int(words[1]);
                if (!step) {
                    result.error = "Not a number: " + words[1];
                    return result;
                }
                event.volume_delta = *step;
            }
            break;
        }

        case Event::Type::AddTracks:
            if (argc < 1) {
                result.error = "Usage: " + key + " <file>...";
                return result;
            }
            event.paths.assign(words.begin() + 1, words.end());
            break;

        case Event::Type::AddFolder:
            if (argc < 1) {
                result.error = "Usage: " + key + " <directory>";
                return result;
            }
            event.data = join(words, 1);
            break;

        case Event::Type::RemoveTracks:
            if (argc < 1) {
                result.error = "Usage: " + key + " <track number>...";
                return result;
            }
            for (size_t i = 1; i < words.size(); ++i) {
                auto index = parse_track_number(words[i]);
                if (!index) {
                    result.error = "Not a track number: " + words[i];
                    return result;
                }
                event.indices.push_back(*index);
            }
            break;

        case Event::Type::Search:
            event.data = join(words, 1);
            break;

        default:
            break;
    }

    result.event = event;
    return result;
}

}  // namespace turntable::ui
