#include "audio/SampleSource.hpp"
#include "audio/FFmpegSource.hpp"
#include "audio/Mpg123Source.hpp"
#include "audio/SndfileSource.hpp"
#include "audio/VorbisSource.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <filesystem>

namespace tunebox::audio {

namespace {
    std::unique_ptr<SampleSource> create_source_for(const std::string& ext) {
        if (ext == ".mp3") return std::make_unique<Mpg123Source>();
        if (ext == ".flac" || ext == ".wav") return std::make_unique<SndfileSource>();
        if (ext == ".ogg") return std::make_unique<VorbisSource>();
        if (ext == ".m4a" || ext == ".aac") return std::make_unique<FFmpegSource>();
        return nullptr;
    }
}

OpenResult open_sample_source(const std::string& path) {
    OpenResult result;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.error = "file not found";
        util::Logger::warn("open_sample_source: " + path + ": " + result.error);
        return result;
    }

    std::string ext = util::Platform::lowercase_extension(path);
    auto source = create_source_for(ext);
    if (!source) {
        result.error = "unsupported format '" + ext + "'";
        util::Logger::warn("open_sample_source: " + path + ": " + result.error);
        return result;
    }

    if (!source->open(path)) {
        result.error = source->last_error().empty() ? "cannot decode file" : source->last_error();
        return result;
    }

    result.source = std::move(source);
    return result;
}

}  // namespace tunebox::audio
