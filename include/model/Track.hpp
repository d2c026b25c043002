#pragma once

#include <cstdint>
#include <string>

namespace tunebox::model {

// One playlist entry. Immutable once the library scan has produced it.
struct Track {
    std::string path;
    std::string title;
    std::string artist;
    std::string album;
    double duration = 0.0;  // seconds, 0 when unknown
    int track_number = 0;   // 0 when untagged

    int bitrate = 0;        // kbps, 0 when unknown
    int sample_rate = 0;
    int channels = 0;
    std::string format;     // "MP3", "FLAC", ...
    uint64_t file_size = 0;

    bool operator==(const Track&) const = default;
};

}  // namespace tunebox::model
