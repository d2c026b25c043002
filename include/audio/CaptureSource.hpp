#pragma once

#include "audio/SampleSource.hpp"
#include "util/BoundedChannel.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace tunebox::audio {

// One block of mono samples handed to the visualizer.
using SampleChunk = std::vector<float>;
using SampleChannel = util::BoundedChannel<SampleChunk>;

// Written by the capture path, read by the engine's progress loop.
struct PlaybackCounters {
    std::atomic<uint64_t> samples_played{0};  // interleaved samples, not frames
    std::atomic<bool> finished{false};

    void reset() {
        samples_played.store(0, std::memory_order_release);
        finished.store(false, std::memory_order_release);
    }
};

// Sits between a SampleSource and the output device. Every sample pulled
// through read() advances the shared counter; every ~1/30 s of audio is
// downmixed to mono and pushed (latest-wins) to the visualizer channel.
// End of stream raises the finished flag.
//
// Not thread-safe: the output device serializes read() and seek().
class CaptureSource {
public:
    CaptureSource(std::unique_ptr<SampleSource> source,
                  std::shared_ptr<PlaybackCounters> counters,
                  std::shared_ptr<SampleChannel> samples);

    // Returns frames written to buffer; 0 once the source is exhausted.
    int read(float* buffer, int max_frames);

    bool seek(double seconds);

    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }
    std::optional<double> total_duration() const { return duration_; }
    bool exhausted() const { return exhausted_; }

    size_t chunk_capacity() const { return chunk_capacity_; }

private:
    void capture(const float* data, size_t samples);
    void flush_chunk();

    std::unique_ptr<SampleSource> source_;
    std::shared_ptr<PlaybackCounters> counters_;
    std::shared_ptr<SampleChannel> samples_;

    int sample_rate_ = 0;
    int channels_ = 0;
    std::optional<double> duration_;
    bool exhausted_ = false;

    size_t chunk_capacity_ = 0;
    std::vector<float> pending_;  // interleaved, up to chunk_capacity_
    uint64_t dropped_logged_ = 0;
};

}  // namespace tunebox::audio
