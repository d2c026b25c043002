#pragma once

#include <optional>
#include <string>

namespace tunebox::config {

enum class ThemeId {
    Default,
    Dracula,
    Nord,
    Gruvbox,
    Neon,
};

// ANSI escape sequences for each role; empty means inherit from the terminal.
struct Theme {
    std::string name;
    std::string foreground;
    std::string accent;         // bars, progress
    std::string current_track;
    std::string highlight;      // selected row
};

class ThemeManager {
public:
    static Theme get_theme(ThemeId id);
    static std::string name(ThemeId id);
    // Default -> Dracula -> Nord -> Gruvbox -> Neon -> Default
    static ThemeId next(ThemeId id);
    // Case-insensitive; nullopt for unknown names
    static std::optional<ThemeId> parse(const std::string& name);
};

}  // namespace tunebox::config
