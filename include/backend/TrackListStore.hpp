#pragma once

#include "model/Track.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tunebox::backend {

// A scanned directory's track list, stamped with the directory's mtime
// (seconds since the epoch) at scan time.
struct CachedTrackList {
    std::string directory;
    int64_t modified_time = 0;
    std::vector<model::Track> tracks;
};

// Key-value store: directory -> last scan result.
class TrackListStore {
public:
    virtual ~TrackListStore() = default;

    virtual std::optional<CachedTrackList> load(const std::string& directory) = 0;
    virtual bool save(const CachedTrackList& entry) = 0;
};

// Single binary cache file holding the most recent scan.
class FileTrackListStore : public TrackListStore {
public:
    explicit FileTrackListStore(std::filesystem::path cache_file);

    // ~/.cache/tunebox/library.cache
    static std::filesystem::path default_path();

    std::optional<CachedTrackList> load(const std::string& directory) override;
    bool save(const CachedTrackList& entry) override;

private:
    std::filesystem::path cache_file_;
};

}  // namespace tunebox::backend
