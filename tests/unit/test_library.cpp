#include "../framework/SimpleTest.hpp"
#include "backend/Library.hpp"
#include "backend/TrackListStore.hpp"
#include <fstream>
#include <map>
#include <unistd.h>

using namespace tunebox;

namespace {

std::filesystem::path scratch_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("tunebox_lib_" + std::to_string(::getpid())) / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void touch(const std::filesystem::path& path, const std::string& content = "not really audio") {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

model::Track track(const std::string& artist, const std::string& album, int number, const std::string& title) {
    model::Track t;
    t.path = "/m/" + title + ".flac";
    t.artist = artist;
    t.album = album;
    t.track_number = number;
    t.title = title;
    t.format = "FLAC";
    return t;
}

class MemoryTrackListStore : public backend::TrackListStore {
public:
    std::optional<backend::CachedTrackList> load(const std::string& directory) override {
        ++loads;
        auto it = entries.find(directory);
        if (it == entries.end()) return std::nullopt;
        return it->second;
    }
    bool save(const backend::CachedTrackList& entry) override {
        ++saves;
        entries[entry.directory] = entry;
        return true;
    }

    std::map<std::string, backend::CachedTrackList> entries;
    int loads = 0;
    int saves = 0;
};

}  // namespace

TEST_CASE(test_sort_order) {
    std::vector<model::Track> tracks = {
        track("beta", "Second", 2, "b2"),
        track("Alpha", "Zed", 1, "z1"),
        track("alpha", "album", 2, "a2"),
        track("ALPHA", "Album", 1, "a1"),
        track("Beta", "second", 1, "b1"),
        track("beta", "Second", 1, "B0"),
    };
    backend::Library::sort_tracks(tracks);

    std::vector<std::string> titles;
    for (const auto& t : tracks) titles.push_back(t.title);
    ASSERT_TRUE((titles == std::vector<std::string>{"a1", "a2", "z1", "B0", "b1", "b2"}));
}

TEST_CASE(test_freshness_rule) {
    backend::CachedTrackList cached{"/music", 1000, {}};
    ASSERT_TRUE(backend::Library::is_fresh(cached, 999));
    ASSERT_TRUE(backend::Library::is_fresh(cached, 1000));
    ASSERT_FALSE(backend::Library::is_fresh(cached, 1001));
}

TEST_CASE(test_file_store_round_trip) {
    auto dir = scratch_dir("store");
    backend::FileTrackListStore store(dir / "cache" / "library.cache");

    backend::CachedTrackList entry{"/music", 1700000000, {track("A", "B", 3, "C"), track("D", "E", 0, "F")}};
    entry.tracks[0].duration = 123.5;
    entry.tracks[0].file_size = 4096;
    entry.tracks[0].sample_rate = 44100;
    ASSERT_TRUE(store.save(entry));

    auto loaded = store.load("/music");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->modified_time, 1700000000);
    ASSERT_EQ(loaded->tracks.size(), 2u);
    ASSERT_TRUE(loaded->tracks[0] == entry.tracks[0]);
    ASSERT_TRUE(loaded->tracks[1] == entry.tracks[1]);

    // The cache belongs to one directory
    ASSERT_FALSE(store.load("/other").has_value());
}

TEST_CASE(test_file_store_rejects_garbage) {
    auto dir = scratch_dir("garbage");
    touch(dir / "library.cache", "definitely not a cache file");
    backend::FileTrackListStore store(dir / "library.cache");
    ASSERT_FALSE(store.load("/music").has_value());

    backend::FileTrackListStore missing(dir / "nope.cache");
    ASSERT_FALSE(missing.load("/music").has_value());
}

TEST_CASE(test_file_store_rejects_truncated) {
    auto dir = scratch_dir("truncated");
    auto path = dir / "library.cache";
    backend::FileTrackListStore store(path);
    backend::CachedTrackList entry{"/music", 5, {track("A", "B", 1, "C")}};
    ASSERT_TRUE(store.save(entry));

    auto size = std::filesystem::file_size(path);
    std::filesystem::resize_file(path, size - 6);
    ASSERT_FALSE(store.load("/music").has_value());
}

TEST_CASE(test_scan_directory_recursive) {
    auto dir = scratch_dir("scan");
    touch(dir / "b.wav");
    touch(dir / "notes.txt");
    touch(dir / "cover.jpg");
    touch(dir / "sub" / "a.FLAC");
    touch(dir / "sub" / "deeper" / "c.flac");

    auto tracks = backend::Library::scan(dir);
    ASSERT_EQ(tracks.size(), 3u);
    // Untagged: filename titles, shared placeholder artist and album
    ASSERT_EQ(tracks[0].title, std::string("a"));
    ASSERT_EQ(tracks[1].title, std::string("b"));
    ASSERT_EQ(tracks[2].title, std::string("c"));
    ASSERT_EQ(tracks[0].artist, std::string("Unknown Artist"));
    ASSERT_EQ(tracks[0].album, std::string("Unknown Album"));
    ASSERT_EQ(tracks[0].format, std::string("FLAC"));
    ASSERT_EQ(tracks[1].format, std::string("WAV"));
    ASSERT_TRUE(tracks[1].file_size > 0);
}

TEST_CASE(test_scan_single_file) {
    auto dir = scratch_dir("single");
    touch(dir / "only.wav");
    touch(dir / "readme.md");

    auto tracks = backend::Library::scan(dir / "only.wav");
    ASSERT_EQ(tracks.size(), 1u);
    ASSERT_EQ(tracks[0].title, std::string("only"));

    ASSERT_TRUE(backend::Library::scan(dir / "readme.md").empty());
    ASSERT_TRUE(backend::Library::scan(dir / "missing.wav").empty());
}

TEST_CASE(test_scan_saves_and_reuses_store) {
    auto dir = scratch_dir("cached");
    touch(dir / "x.wav");

    MemoryTrackListStore store;
    auto first = backend::Library::scan(dir, &store);
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(store.saves, 1);
    ASSERT_EQ(store.entries.at(dir.string()).tracks.size(), 1u);

    // A stored list stamped in the future is served without rescanning
    backend::CachedTrackList canned{dir.string(), *backend::Library::directory_mtime(dir) + 3600,
                                    {track("Cached", "Album", 1, "from cache")}};
    store.entries[dir.string()] = canned;
    auto second = backend::Library::scan(dir, &store);
    ASSERT_EQ(second.size(), 1u);
    ASSERT_EQ(second[0].title, std::string("from cache"));
    ASSERT_EQ(store.saves, 1);

    // A stale one is ignored and replaced
    store.entries[dir.string()].modified_time = 0;
    auto third = backend::Library::scan(dir, &store);
    ASSERT_EQ(third[0].title, std::string("x"));
    ASSERT_EQ(store.saves, 2);
}

int main() {
    int result = tunebox::test::TestRunner::instance().run_all("LIBRARY");
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path() /
                                ("tunebox_lib_" + std::to_string(::getpid())), ec);
    return result;
}
