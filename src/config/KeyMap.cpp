#include "config/KeyMap.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace tunebox::config {

KeyMap::KeyMap() {
    load_default_keybinds();
}

const std::vector<std::pair<std::string, std::string>>& KeyMap::default_bindings() {
    static const std::vector<std::pair<std::string, std::string>> defaults = {
        {"play_pause", "space"},
        {"next", "n"},
        {"prev", "p"},
        {"quit", "q"},
        {"volume_up", "+"},
        {"volume_down", "-"},
        {"seek_forward", "right"},
        {"seek_backward", "left"},
        {"select_up", "k"},
        {"select_down", "j"},
        {"play_selected", "enter"},
        {"shuffle", "s"},
        {"repeat", "r"},
        {"search", "/"},
        {"visualizer", "v"},
        {"theme", "T"},
        {"sleep_timer", "t"},
        {"mini_mode", "m"},
        {"speed_up", ">"},
        {"speed_down", "<"},
    };
    return defaults;
}

void KeyMap::load_default_keybinds() {
    bindings_.clear();
    for (const auto& [action, key] : default_bindings()) {
        bindings_[key] = action;
    }

    // Secondary keys
    bindings_["up"] = "select_up";
    bindings_["down"] = "select_down";
    bindings_["]"] = "volume_up";
    bindings_["["] = "volume_down";
    bindings_["."] = "speed_up";
    bindings_[","] = "speed_down";
    bindings_["ctrl+c"] = "quit";
}

void KeyMap::apply_overrides(const std::unordered_map<std::string, std::string>& action_keys) {
    for (const auto& [action, key] : action_keys) {
        auto def = std::find_if(default_bindings().begin(), default_bindings().end(),
                                [&](const auto& entry) { return entry.first == action; });
        if (def == default_bindings().end()) {
            util::Logger::warn("KeyMap: Unknown action '" + action + "' in keybinds");
            continue;
        }
        // Unchanged primary key keeps the secondary keys too
        if (key.empty() || key == def->second) continue;

        std::erase_if(bindings_, [&](const auto& entry) { return entry.second == action; });
        add_binding(action, key);
    }
}

void KeyMap::add_binding(const std::string& action, const std::string& key_name) {
    bindings_[key_name] = action;
}

std::string KeyMap::lookup_action(const std::string& key_name) const {
    auto it = bindings_.find(key_name);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

}  // namespace tunebox::config
