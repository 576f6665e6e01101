#pragma once

#include "events/EventBus.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace turntable::config {

// Maps the command word typed at the prompt to a host action name
// ("n" -> "next"). Several words may map to the same action.
class KeyMap {
public:
    KeyMap();

    void load_default_keybinds();

    // Binds key_sequence to action; an existing binding of the same word is replaced
    void add_binding(const std::string& action, const std::string& key_sequence);

    // Applies [keybinds] entries (action -> command word) from the config file
    void apply_overrides(const std::unordered_map<std::string, std::string>& overrides);

    // Empty string when unbound
    std::string lookup_action(const std::string& key_sequence) const;

    // Command words bound to action, sorted
    std::vector<std::string> keys_for(const std::string& action) const;

    static std::optional<events::Event::Type> event_for_action(const std::string& action);
    static const std::vector<std::string>& known_actions();

private:
    std::unordered_map<std::string, std::string> bindings_;
};

}  // namespace turntable::config
