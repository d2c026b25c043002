#pragma once

#include <filesystem>
#include <string>

namespace tunebox::util {

class Platform {
public:
    static std::filesystem::path get_music_directory();
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();

    static bool is_audio_file(const std::filesystem::path& path);
    // Upper-case extension without the dot ("FLAC"), "UNKNOWN" when absent
    static std::string get_audio_format(const std::filesystem::path& path);
    static std::string lowercase_extension(const std::filesystem::path& path);
};

}  // namespace tunebox::util
