#include "audio/CaptureSource.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace tunebox::audio {

CaptureSource::CaptureSource(std::unique_ptr<SampleSource> source,
                             std::shared_ptr<PlaybackCounters> counters,
                             std::shared_ptr<SampleChannel> samples)
    : source_(std::move(source))
    , counters_(std::move(counters))
    , samples_(std::move(samples)) {
    if (source_) {
        sample_rate_ = source_->sample_rate();
        channels_ = source_->channels();
        duration_ = source_->total_duration();
    }

    // ~1/30 s of interleaved samples per visualizer chunk
    size_t capacity = static_cast<size_t>(sample_rate_) * static_cast<size_t>(channels_) / 30;
    chunk_capacity_ = capacity > 0 ? capacity : 1;
    pending_.reserve(chunk_capacity_);
}

int CaptureSource::read(float* buffer, int max_frames) {
    if (!source_ || exhausted_ || !buffer || max_frames <= 0) return 0;

    int frames = source_->read(buffer, max_frames);
    if (frames <= 0) {
        exhausted_ = true;
        counters_->finished.store(true, std::memory_order_release);
        util::Logger::debug("CaptureSource: End of stream");
        return 0;
    }

    size_t samples = static_cast<size_t>(frames) * static_cast<size_t>(channels_);
    counters_->samples_played.fetch_add(samples, std::memory_order_acq_rel);
    capture(buffer, samples);
    return frames;
}

void CaptureSource::capture(const float* data, size_t samples) {
    for (size_t i = 0; i < samples; ++i) {
        pending_.push_back(data[i]);
        if (pending_.size() >= chunk_capacity_) {
            flush_chunk();
        }
    }
}

void CaptureSource::flush_chunk() {
    if (!samples_ || channels_ <= 0) {
        pending_.clear();
        return;
    }

    SampleChunk mono;
    if (channels_ == 1) {
        mono = pending_;
    } else {
        size_t frames = pending_.size() / channels_;
        mono.reserve(frames);
        for (size_t f = 0; f < frames; ++f) {
            float sum = 0.0f;
            for (int ch = 0; ch < channels_; ++ch) {
                sum += pending_[f * channels_ + ch];
            }
            mono.push_back(sum / static_cast<float>(channels_));
        }
    }
    pending_.clear();

    samples_->push_latest(std::move(mono));

    // Overflow is expected when the UI is slow; only note it now and then
    uint64_t dropped = samples_->dropped();
    if (dropped >= dropped_logged_ + 100) {
        dropped_logged_ = dropped;
        util::Logger::debug("CaptureSource: " + std::to_string(dropped) + " visualizer chunks dropped");
    }
}

bool CaptureSource::seek(double seconds) {
    if (!source_) return false;
    if (!source_->seek(seconds)) return false;

    // Runs serialized with read(), so no pre-seek period lands on top of the target
    uint64_t frame = static_cast<uint64_t>(std::max(seconds, 0.0) * sample_rate_);
    counters_->samples_played.store(frame * static_cast<uint64_t>(channels_), std::memory_order_release);

    pending_.clear();
    exhausted_ = false;
    counters_->finished.store(false, std::memory_order_release);
    return true;
}

}  // namespace tunebox::audio
