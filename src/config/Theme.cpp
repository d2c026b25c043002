#include "config/Theme.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace tunebox::config {

namespace {
    constexpr std::array<ThemeId, 5> ALL_THEMES = {
        ThemeId::Default, ThemeId::Dracula, ThemeId::Nord, ThemeId::Gruvbox, ThemeId::Neon
    };
}

Theme ThemeManager::get_theme(ThemeId id) {
    switch (id) {
        case ThemeId::Default:
            // Inherits the host terminal palette
            return {"Default", "", "\033[36m", "\033[1m", "\033[7m"};
        case ThemeId::Dracula:
            return {"Dracula", "\033[38;2;248;248;242m", "\033[38;2;189;147;249m",
                    "\033[1;38;2;255;121;198m", "\033[48;2;68;71;90m"};
        case ThemeId::Nord:
            return {"Nord", "\033[38;2;216;222;233m", "\033[38;2;136;192;208m",
                    "\033[1;38;2;143;188;187m", "\033[48;2;59;66;82m"};
        case ThemeId::Gruvbox:
            return {"Gruvbox", "\033[38;2;235;219;178m", "\033[38;2;250;189;47m",
                    "\033[1;38;2;184;187;38m", "\033[48;2;80;73;69m"};
        case ThemeId::Neon:
            return {"Neon", "\033[38;2;255;255;255m", "\033[38;2;57;255;20m",
                    "\033[1;38;2;255;0;255m", "\033[48;2;40;0;60m"};
    }
    return get_theme(ThemeId::Default);
}

std::string ThemeManager::name(ThemeId id) {
    return get_theme(id).name;
}

ThemeId ThemeManager::next(ThemeId id) {
    switch (id) {
        case ThemeId::Default: return ThemeId::Dracula;
        case ThemeId::Dracula: return ThemeId::Nord;
        case ThemeId::Nord: return ThemeId::Gruvbox;
        case ThemeId::Gruvbox: return ThemeId::Neon;
        case ThemeId::Neon: return ThemeId::Default;
    }
    return ThemeId::Default;
}

std::optional<ThemeId> ThemeManager::parse(const std::string& name) {
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };
    std::string wanted = lower(name);
    for (ThemeId id : ALL_THEMES) {
        if (lower(ThemeManager::name(id)) == wanted) return id;
    }
    return std::nullopt;
}

}  // namespace tunebox::config
