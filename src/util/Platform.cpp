#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace tunebox::util {

namespace {
    std::filesystem::path home_or(const std::filesystem::path& relative) {
        auto home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / relative;
        }
        Logger::warn("Platform: HOME env var not set, using fallback: " + relative.string());
        return relative;
    }
}

std::filesystem::path Platform::get_music_directory() {
    auto path = home_or("Music");
    Logger::debug("Platform: Music directory: " + path.string());
    return path;
}

std::filesystem::path Platform::get_config_directory() {
    return home_or(std::filesystem::path(".config") / "tunebox");
}

std::filesystem::path Platform::get_cache_directory() {
    return home_or(std::filesystem::path(".cache") / "tunebox");
}

std::string Platform::lowercase_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool Platform::is_audio_file(const std::filesystem::path& path) {
    static const std::array<std::string, 6> extensions = {
        ".mp3", ".flac", ".wav", ".ogg", ".m4a", ".aac"
    };
    auto ext = lowercase_extension(path);
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::string Platform::get_audio_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (ext.size() < 2) return "UNKNOWN";
    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return ext;
}

}  // namespace tunebox::util
