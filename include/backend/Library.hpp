#pragma once

#include "backend/TrackListStore.hpp"
#include "model/Track.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace tunebox::backend {

class Library {
public:
    // A single audio file yields one track; a directory is scanned
    // recursively, served from the store while its mtime has not moved.
    static std::vector<model::Track> scan(const std::filesystem::path& path,
                                          TrackListStore* store = nullptr);

    static std::vector<model::Track> scan_directory(const std::filesystem::path& dir,
                                                    TrackListStore* store = nullptr);

    // artist, album, track number, title; names compared case-insensitively
    static void sort_tracks(std::vector<model::Track>& tracks);

    // Cached list is usable unless the directory changed after it was stored
    static bool is_fresh(const CachedTrackList& cached, int64_t directory_mtime);

    static std::optional<int64_t> directory_mtime(const std::filesystem::path& dir);
};

}  // namespace tunebox::backend
