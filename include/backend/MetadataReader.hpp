#pragma once

#include "model/Track.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace tunebox::backend {

// Tags and stream properties; any field may be missing.
struct TrackMetadata {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<int> track_number;
    std::optional<double> duration;  // seconds
    std::optional<int> bitrate;      // kbps
    std::optional<int> sample_rate;
    std::optional<int> channels;
};

class MetadataReader {
public:
    // nullopt when the file cannot be opened by any of the tag readers
    static std::optional<TrackMetadata> read(const std::string& path);

    // Full Track for a library entry. Missing tags fall back to the file
    // stem, "Unknown Artist" and "Unknown Album".
    static model::Track build_track(const std::filesystem::path& path);

    // "03", "3/12", "3 of 12" -> 3
    static std::optional<int> parse_track_number(const std::string& text);

private:
    static std::optional<TrackMetadata> read_mp3(const std::string& path);
    static std::optional<TrackMetadata> read_sndfile(const std::string& path);
    static std::optional<TrackMetadata> read_vorbis(const std::string& path);
    static std::optional<TrackMetadata> read_ffmpeg(const std::string& path);
};

}  // namespace tunebox::backend
