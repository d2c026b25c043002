#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tunebox::config {

// Key name ("space", "left", "n", "T", ...) -> action name ("play_pause").
class KeyMap {
public:
    KeyMap();

    // Primary key per action, in display order
    static const std::vector<std::pair<std::string, std::string>>& default_bindings();

    void load_default_keybinds();
    // action -> key pairs from the config file; each replaces every key
    // previously bound to that action
    void apply_overrides(const std::unordered_map<std::string, std::string>& action_keys);
    void add_binding(const std::string& action, const std::string& key_name);
    std::string lookup_action(const std::string& key_name) const;

private:
    std::unordered_map<std::string, std::string> bindings_;
};

}  // namespace tunebox::config
