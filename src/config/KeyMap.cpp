#include "config/KeyMap.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace turntable::config {

namespace {

using Type = events::Event::Type;

const std::unordered_map<std::string, Type>& action_table() {
    static const std::unordered_map<std::string, Type> table = {
        {"play", Type::Play},
        {"pause", Type::Pause},
        {"play_pause", Type::PlayPause},
        {"stop", Type::Stop},
        {"next", Type::NextTrack},
        {"prev", Type::PrevTrack},
        {"play_index", Type::PlayIndex},
        {"seek", Type::Seek},
        {"seek_forward", Type::SeekForward},
        {"seek_backward", Type::SeekBackward},
        {"volume", Type::SetVolume},
        {"volume_up", Type::VolumeUp},
        {"volume_down", Type::VolumeDown},
        {"shuffle", Type::ShuffleToggle},
        {"repeat", Type::RepeatToggle},
        {"add", Type::AddTracks},
        {"add_folder", Type::AddFolder},
        {"remove", Type::RemoveTracks},
        {"clear", Type::ClearPlaylist},
        {"search", Type::Search},
        {"list", Type::ListPlaylist},
        {"quit", Type::Quit},
    };
    return table;
}

}  // namespace

KeyMap::KeyMap() {
    load_default_keybinds();
}

void KeyMap::load_default_keybinds() {
    bindings_.clear();
    bindings_["space"] = "play_pause";
    bindings_["p"] = "play_pause";
    bindings_["play"] = "play";
    bindings_["pause"] = "pause";
    bindings_["stop"] = "stop";
    bindings_["s"] = "stop";
    bindings_["n"] = "next";
    bindings_["next"] = "next";
    bindings_["N"] = "prev";
    bindings_["prev"] = "prev";
    bindings_["goto"] = "play_index";
    bindings_["g"] = "play_index";
    bindings_["seek"] = "seek";
    bindings_["l"] = "seek_forward";
    bindings_["h"] = "seek_backward";
    bindings_["vol"] = "volume";
    bindings_["+"] = "volume_up";
    bindings_["-"] = "volume_down";
    bindings_["shuffle"] = "shuffle";
    bindings_["z"] = "shuffle";
    bindings_["repeat"] = "repeat";
    bindings_["r"] = "repeat";
    bindings_["add"] = "add";
    bindings_["folder"] = "add_folder";
    bindings_["rm"] = "remove";
    bindings_["clear"] = "clear";
    bindings_["/"] = "search";
    bindings_["find"] = "search";
    bindings_["ls"] = "list";
    bindings_["q"] = "quit";
    bindings_["quit"] = "quit";
}

void KeyMap::add_binding(const std::string& action, const std::string& key_sequence) {
    bindings_[key_sequence] = action;
}

void KeyMap::apply_overrides(const std::unordered_map<std::string, std::string>& overrides) {
    for (const auto& [action, key] : overrides) {
        if (!event_for_action(action)) {
            util::Logger::warn("KeyMap: Unknown action in [keybinds]: " + action);
            continue;
        }
        if (key.empty()) {
            util::Logger::warn("KeyMap: Empty command for action " + action);
            continue;
        }
        add_binding(action, key);
        util::Logger::debug("KeyMap: Bound '" + key + "' to " + action);
    }
}

std::string KeyMap::lookup_action(const std::string& key_sequence) const {
    auto it = bindings_.find(key_sequence);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

std::vector<std::string> KeyMap::keys_for(const std::string& action) const {
    std::vector<std::string> keys;
    for (const auto& [key, bound] : bindings_) {
        if (bound == action) keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::optional<events::Event::Type> KeyMap::event_for_action(const std::string& action) {
    const auto& table = action_table();
    auto it = table.find(action);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

const std::vector<std::string>& KeyMap::known_actions() {
    static const std::vector<std::string> actions = [] {
        std::vector<std::string> names;
        for (const auto& [name, type] : action_table()) names.push_back(name);
        std::sort(names.begin(), names.end());
        return names;
    }();
    return actions;
}

}  // namespace turntable::config
