#include "backend/TrackListStore.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fstream>

namespace tunebox::backend {

namespace {
    constexpr uint32_t CACHE_MAGIC = 0x58424E54;  // 'TNBX'
    constexpr uint32_t CACHE_VERSION = 1;
    constexpr uint32_t MAX_STRING = 1 << 20;

    template <typename T>
    void write_pod(std::ofstream& out, const T& value) {
        out.write(reinterpret_cast<const char*>(&value), sizeof(value));
    }

    template <typename T>
    bool read_pod(std::ifstream& in, T& value) {
        in.read(reinterpret_cast<char*>(&value), sizeof(value));
        return static_cast<bool>(in);
    }

    void write_string(std::ofstream& out, const std::string& s) {
        uint32_t len = static_cast<uint32_t>(s.length());
        write_pod(out, len);
        if (len > 0) out.write(s.data(), len);
    }

    bool read_string(std::ifstream& in, std::string& s) {
        uint32_t len = 0;
        if (!read_pod(in, len) || len > MAX_STRING) return false;
        s.assign(len, '\0');
        if (len > 0) in.read(s.data(), len);
        return static_cast<bool>(in);
    }

    void write_track(std::ofstream& out, const model::Track& t) {
        write_string(out, t.path);
        write_string(out, t.title);
        write_string(out, t.artist);
        write_string(out, t.album);
        write_pod(out, t.duration);
        write_pod(out, static_cast<int32_t>(t.track_number));
        write_pod(out, static_cast<int32_t>(t.bitrate));
        write_pod(out, static_cast<int32_t>(t.sample_rate));
        write_pod(out, static_cast<int32_t>(t.channels));
        write_string(out, t.format);
        write_pod(out, t.file_size);
    }

    bool read_track(std::ifstream& in, model::Track& t) {
        int32_t track_number = 0, bitrate = 0, sample_rate = 0, channels = 0;
        bool ok = read_string(in, t.path) && read_string(in, t.title) &&
                  read_string(in, t.artist) && read_string(in, t.album) &&
                  read_pod(in, t.duration) && read_pod(in, track_number) &&
                  read_pod(in, bitrate) && read_pod(in, sample_rate) &&
                  read_pod(in, channels) && read_string(in, t.format) &&
                  read_pod(in, t.file_size);
        t.track_number = track_number;
        t.bitrate = bitrate;
        t.sample_rate = sample_rate;
        t.channels = channels;
        return ok;
    }
}

FileTrackListStore::FileTrackListStore(std::filesystem::path cache_file)
    : cache_file_(std::move(cache_file)) {
}

std::filesystem::path FileTrackListStore::default_path() {
    return util::Platform::get_cache_directory() / "library.cache";
}

std::optional<CachedTrackList> FileTrackListStore::load(const std::string& directory) {
    std::ifstream in(cache_file_, std::ios::binary);
    if (!in) return std::nullopt;

    uint32_t magic = 0, version = 0;
    if (!read_pod(in, magic) || !read_pod(in, version) ||
        magic != CACHE_MAGIC || version != CACHE_VERSION) {
        util::Logger::warn("TrackListStore: Ignoring cache with unknown header: " + cache_file_.string());
        return std::nullopt;
    }

    CachedTrackList entry;
    uint64_t count = 0;
    if (!read_string(in, entry.directory) || !read_pod(in, entry.modified_time) || !read_pod(in, count)) {
        util::Logger::warn("TrackListStore: Truncated cache header");
        return std::nullopt;
    }

    // The file holds one directory; a different one is a miss
    if (entry.directory != directory) return std::nullopt;

    entry.tracks.reserve(static_cast<size_t>(std::min<uint64_t>(count, 100000)));
    for (uint64_t i = 0; i < count; ++i) {
        model::Track track;
        if (!read_track(in, track)) {
            util::Logger::warn("TrackListStore: Corrupt cache entry " + std::to_string(i) + ", discarding cache");
            return std::nullopt;
        }
        entry.tracks.push_back(std::move(track));
    }

    util::Logger::debug("TrackListStore: Loaded " + std::to_string(entry.tracks.size()) + " cached tracks");
    return entry;
}

bool FileTrackListStore::save(const CachedTrackList& entry) {
    std::error_code ec;
    std::filesystem::create_directories(cache_file_.parent_path(), ec);
    if (ec) {
        util::Logger::warn("TrackListStore: Cannot create " + cache_file_.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::ofstream out(cache_file_, std::ios::binary | std::ios::trunc);
    if (!out) {
        util::Logger::warn("TrackListStore: Cannot write " + cache_file_.string());
        return false;
    }

    write_pod(out, CACHE_MAGIC);
    write_pod(out, CACHE_VERSION);
    write_string(out, entry.directory);
    write_pod(out, entry.modified_time);
    write_pod(out, static_cast<uint64_t>(entry.tracks.size()));
    for (const auto& track : entry.tracks) {
        write_track(out, track);
    }

    out.flush();
    if (!out) {
        util::Logger::warn("TrackListStore: Write to " + cache_file_.string() + " failed");
        return false;
    }
    return true;
}

}  // namespace tunebox::backend
