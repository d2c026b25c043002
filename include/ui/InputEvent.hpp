#pragma once

#include <string>

namespace tunebox::ui {

struct InputEvent {
    enum class Type {
        None,
        KeyPress,
        Resize,
    };

    Type type = Type::None;
    int key = 0;           // raw byte, 0 for escape sequences
    std::string key_name;  // "up", "enter", "space", "ctrl+c", "a", "T", ...

    bool is_key(const std::string& name_to_check) const {
        return type == Type::KeyPress && key_name == name_to_check;
    }
    bool empty() const { return type == Type::None; }
};

}  // namespace tunebox::ui
