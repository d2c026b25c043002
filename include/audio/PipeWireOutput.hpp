#pragma once

#include "audio/AudioOutput.hpp"
#include "audio/PipeWireContext.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

struct pw_stream;
struct pw_buffer;

namespace tunebox::audio {

// PipeWire playback stream fed by the stream's process callback. The
// callback pulls from the attached CaptureSource, resamples by the speed
// factor, applies volume and hands the buffer to the graph.
//
// The attached source and resampler state are guarded by the thread loop
// lock; the process callback runs with that lock held.
class PipeWireOutput : public AudioOutput {
public:
    PipeWireOutput() = default;
    ~PipeWireOutput() override;

    [[nodiscard]] bool init() override;

    [[nodiscard]] bool start(std::shared_ptr<CaptureSource> source) override;
    void stop() override;
    void pause(bool paused) override;

    void set_volume(float volume) override;
    void set_speed(float speed) override;

    [[nodiscard]] bool seek(double seconds) override;
    [[nodiscard]] bool empty() const override;

    // Stream callbacks, invoked on the thread loop
    static void on_process(void* userdata);
    static void on_drained(void* userdata);

private:

    bool create_stream(int sample_rate, int channels);
    void destroy_stream();
    void fill_buffer(struct pw_buffer* buffer);
    size_t render(float* dst, size_t max_frames);
    void reset_resampler();

    PipeWireContext context_;
    struct pw_stream* stream_ = nullptr;
    int sample_rate_ = 0;
    int channels_ = 0;
    bool paused_ = false;

    std::shared_ptr<CaptureSource> source_;
    std::atomic<float> volume_{1.0f};
    std::atomic<float> speed_{1.0f};
    std::atomic<bool> drained_{true};

    // Resampler carry-over between callbacks
    std::vector<float> pending_;   // interleaved input frames not yet consumed
    std::vector<float> read_buf_;
    double phase_ = 0.0;           // fractional read position into pending_
    bool source_done_ = false;
    bool drain_requested_ = false;
    uint64_t nan_count_ = 0;
};

}  // namespace tunebox::audio
