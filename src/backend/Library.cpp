#include "backend/Library.hpp"
#include "backend/MetadataReader.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <sys/stat.h>
#include <tuple>

namespace tunebox::backend {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

std::optional<int64_t> Library::directory_mtime(const std::filesystem::path& dir) {
    struct stat st;
    if (::stat(dir.c_str(), &st) != 0) return std::nullopt;
    return static_cast<int64_t>(st.st_mtime);
}

bool Library::is_fresh(const CachedTrackList& cached, int64_t directory_mtime) {
    return directory_mtime <= cached.modified_time;
}

void Library::sort_tracks(std::vector<model::Track>& tracks) {
    std::stable_sort(tracks.begin(), tracks.end(), [](const model::Track& a, const model::Track& b) {
        auto key = [](const model::Track& t) {
            return std::make_tuple(to_lower(t.artist), to_lower(t.album), t.track_number, to_lower(t.title));
        };
        return key(a) < key(b);
    });
}

std::vector<model::Track> Library::scan(const std::filesystem::path& path, TrackListStore* store) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return scan_directory(path, store);
    }

    if (std::filesystem::is_regular_file(path, ec)) {
        if (!util::Platform::is_audio_file(path)) {
            util::Logger::warn("Library: Not a supported audio file: " + path.string());
            return {};
        }
        return {MetadataReader::build_track(path)};
    }

    util::Logger::error("Library: Path does not exist: " + path.string());
    return {};
}

std::vector<model::Track> Library::scan_directory(const std::filesystem::path& dir, TrackListStore* store) {
    auto mtime = directory_mtime(dir);

    if (store && mtime) {
        if (auto cached = store->load(dir.string()); cached && is_fresh(*cached, *mtime)) {
            util::Logger::info("Library: Using cached scan of " + dir.string() + " (" +
                               std::to_string(cached->tracks.size()) + " tracks)");
            return std::move(cached->tracks);
        }
    }

    util::Logger::info("Library: Scanning " + dir.string());
    std::vector<model::Track> tracks;

    std::error_code ec;
    auto options = std::filesystem::directory_options::follow_directory_symlink |
                   std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(dir, options, ec);
    if (ec) {
        util::Logger::error("Library: Cannot read " + dir.string() + ": " + ec.message());
        return tracks;
    }

    for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            util::Logger::warn("Library: Skipping unreadable entry: " + ec.message());
            ec.clear();
            continue;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !util::Platform::is_audio_file(it->path())) continue;
        tracks.push_back(MetadataReader::build_track(it->path()));
    }

    sort_tracks(tracks);
    util::Logger::info("Library: Found " + std::to_string(tracks.size()) + " tracks");

    if (store) {
        CachedTrackList entry{dir.string(), mtime.value_or(0), tracks};
        if (!store->save(entry)) {
            util::Logger::warn("Library: Scan cache not saved");
        }
    }
    return tracks;
}

}  // namespace tunebox::backend
