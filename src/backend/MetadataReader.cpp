#include "backend/MetadataReader.hpp"
#include "audio/Mpg123Source.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <charconv>
#include <cstring>
#include <mpg123.h>
#include <sndfile.h>
#include <vorbis/vorbisfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

namespace tunebox::backend {

namespace {
    std::optional<std::string> clean(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::nullopt;
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::optional<std::string> clean(const char* str) {
        if (!str) return std::nullopt;
        return clean(std::string(str));
    }

    // Fixed-width, possibly unterminated ID3v1 field
    std::optional<std::string> clean_field(const char* field, size_t width) {
        return clean(std::string(field, strnlen(field, width)));
    }
}

std::optional<int> MetadataReader::parse_track_number(const std::string& text) {
    auto trimmed = clean(text);
    if (!trimmed) return std::nullopt;

    int number = 0;
    const char* begin = trimmed->data();
    const char* end = begin + trimmed->size();
    auto [ptr, ec] = std::from_chars(begin, end, number);
    if (ec != std::errc() || ptr == begin || number <= 0) return std::nullopt;
    return number;
}

std::optional<TrackMetadata> MetadataReader::read(const std::string& path) {
    std::string ext = util::Platform::lowercase_extension(path);

    if (ext == ".mp3") return read_mp3(path);
    if (ext == ".flac" || ext == ".wav") return read_sndfile(path);
    if (ext == ".ogg") return read_vorbis(path);
    if (ext == ".m4a" || ext == ".aac") return read_ffmpeg(path);

    util::Logger::debug("MetadataReader: No tag reader for " + path);
    return std::nullopt;
}

std::optional<TrackMetadata> MetadataReader::read_mp3(const std::string& path) {
    audio::ensure_mpg123_initialized();

    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return std::nullopt;

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        util::Logger::debug("MetadataReader: mpg123 cannot open " + path);
        mpg123_delete(mh);
        return std::nullopt;
    }

    // Full scan for an exact length and to pick up the ID3 tags
    mpg123_scan(mh);

    TrackMetadata meta;
    long rate = 0;
    int channels = 0, encoding = 0;
    if (mpg123_getformat(mh, &rate, &channels, &encoding) == MPG123_OK) {
        meta.sample_rate = static_cast<int>(rate);
        meta.channels = channels;

        mpg123_frameinfo info;
        if (mpg123_info(mh, &info) == MPG123_OK && info.bitrate > 0) {
            meta.bitrate = info.bitrate;
        }
    }

    off_t length = mpg123_length(mh);
    if (length > 0 && rate > 0) {
        meta.duration = static_cast<double>(length) / static_cast<double>(rate);
    }

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            if (v2->title) meta.title = clean(v2->title->p);
            if (v2->artist) meta.artist = clean(v2->artist->p);
            if (v2->album) meta.album = clean(v2->album->p);

            for (size_t i = 0; i < v2->texts; ++i) {
                if (std::strncmp(v2->text[i].id, "TRCK", 4) == 0 && v2->text[i].text.p) {
                    meta.track_number = parse_track_number(v2->text[i].text.p);
                    break;
                }
            }
        } else if (v1) {
            meta.title = clean_field(v1->title, sizeof(v1->title));
            meta.artist = clean_field(v1->artist, sizeof(v1->artist));
            meta.album = clean_field(v1->album, sizeof(v1->album));

            // ID3v1.1 keeps the track number in the last comment byte
            if (v1->comment[28] == 0 && v1->comment[29] != 0) {
                meta.track_number = static_cast<unsigned char>(v1->comment[29]);
            }
        }
    }

    mpg123_close(mh);
    mpg123_delete(mh);
    return meta;
}

std::optional<TrackMetadata> MetadataReader::read_sndfile(const std::string& path) {
    SF_INFO info;
    std::memset(&info, 0, sizeof(info));

    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) {
        util::Logger::debug("MetadataReader: libsndfile cannot open " + path);
        return std::nullopt;
    }

    TrackMetadata meta;
    meta.sample_rate = info.samplerate;
    meta.channels = info.channels;
    if (info.samplerate > 0 && info.frames > 0) {
        meta.duration = static_cast<double>(info.frames) / info.samplerate;
    }

    meta.title = clean(sf_get_string(file, SF_STR_TITLE));
    meta.artist = clean(sf_get_string(file, SF_STR_ARTIST));
    meta.album = clean(sf_get_string(file, SF_STR_ALBUM));
    if (const char* number = sf_get_string(file, SF_STR_TRACKNUMBER)) {
        meta.track_number = parse_track_number(number);
    }

    // Needs the file open; no extra I/O
    int byterate = sf_current_byterate(file);
    if (byterate > 0) {
        meta.bitrate = (byterate * 8) / 1000;
    }

    sf_close(file);
    return meta;
}

std::optional<TrackMetadata> MetadataReader::read_vorbis(const std::string& path) {
    OggVorbis_File vf;
    if (ov_fopen(path.c_str(), &vf) < 0) {
        util::Logger::debug("MetadataReader: vorbisfile cannot open " + path);
        return std::nullopt;
    }

    TrackMetadata meta;
    if (vorbis_info* info = ov_info(&vf, -1)) {
        meta.sample_rate = static_cast<int>(info->rate);
        meta.channels = info->channels;
    }
    double seconds = ov_time_total(&vf, -1);
    if (seconds > 0) meta.duration = seconds;
    long bitrate = ov_bitrate(&vf, -1);
    if (bitrate > 0) meta.bitrate = static_cast<int>(bitrate / 1000);

    if (vorbis_comment* vc = ov_comment(&vf, -1)) {
        // vorbis_comment_query wants non-const tag names
        char title_tag[] = "TITLE";
        char artist_tag[] = "ARTIST";
        char album_tag[] = "ALBUM";
        char number_tag[] = "TRACKNUMBER";
        meta.title = clean(vorbis_comment_query(vc, title_tag, 0));
        meta.artist = clean(vorbis_comment_query(vc, artist_tag, 0));
        meta.album = clean(vorbis_comment_query(vc, album_tag, 0));
        if (const char* number = vorbis_comment_query(vc, number_tag, 0)) {
            meta.track_number = parse_track_number(number);
        }
    }

    ov_clear(&vf);
    return meta;
}

std::optional<TrackMetadata> MetadataReader::read_ffmpeg(const std::string& path) {
    AVFormatContext* ctx = nullptr;
    if (avformat_open_input(&ctx, path.c_str(), nullptr, nullptr) < 0) {
        util::Logger::debug("MetadataReader: FFmpeg cannot open " + path);
        return std::nullopt;
    }
    if (avformat_find_stream_info(ctx, nullptr) < 0) {
        avformat_close_input(&ctx);
        return std::nullopt;
    }

    TrackMetadata meta;
    if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
        meta.duration = static_cast<double>(ctx->duration) / AV_TIME_BASE;
    }
    if (ctx->bit_rate > 0) {
        meta.bitrate = static_cast<int>(ctx->bit_rate / 1000);
    }

    int stream = av_find_best_stream(ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream >= 0) {
        const AVCodecParameters* par = ctx->streams[stream]->codecpar;
        meta.sample_rate = par->sample_rate;
        meta.channels = par->ch_layout.nb_channels;
    }

    auto tag = [ctx](const char* key) -> std::optional<std::string> {
        const AVDictionaryEntry* entry = av_dict_get(ctx->metadata, key, nullptr, 0);
        return entry ? clean(entry->value) : std::nullopt;
    };
    meta.title = tag("title");
    meta.artist = tag("artist");
    meta.album = tag("album");
    if (auto number = tag("track")) {
        meta.track_number = parse_track_number(*number);
    }

    avformat_close_input(&ctx);
    return meta;
}

model::Track MetadataReader::build_track(const std::filesystem::path& path) {
    model::Track track;
    track.path = path.string();
    track.format = util::Platform::get_audio_format(path);

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    track.file_size = ec ? 0 : static_cast<uint64_t>(size);

    auto meta = read(track.path);
    if (!meta) {
        util::Logger::debug("MetadataReader: Using filename defaults for " + track.path);
        meta = TrackMetadata{};
    }

    std::string stem = path.stem().string();
    track.title = meta->title.value_or(stem.empty() ? "Unknown" : stem);
    track.artist = meta->artist.value_or("Unknown Artist");
    track.album = meta->album.value_or("Unknown Album");
    track.track_number = meta->track_number.value_or(0);
    track.duration = meta->duration.value_or(0.0);
    track.bitrate = meta->bitrate.value_or(0);
    track.sample_rate = meta->sample_rate.value_or(0);
    track.channels = meta->channels.value_or(0);
    return track;
}

}  // namespace tunebox::backend
