#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace tunebox::audio {

namespace {
    void on_state_changed(void* userdata, enum pw_stream_state old_state,
                          enum pw_stream_state state, const char* error) {
        (void)userdata;
        (void)old_state;
        if (state == PW_STREAM_STATE_ERROR) {
            util::Logger::error(std::string("PipeWireOutput: Stream error: ") + (error ? error : "unknown"));
        } else {
            util::Logger::debug(std::string("PipeWireOutput: Stream state ") + pw_stream_state_as_string(state));
        }
    }
}

void PipeWireOutput::on_process(void* userdata) {
    auto* self = static_cast<PipeWireOutput*>(userdata);
    if (!self->stream_) return;

    struct pw_buffer* buffer = pw_stream_dequeue_buffer(self->stream_);
    if (!buffer) return;  // Graph is ahead of us; try next cycle
    self->fill_buffer(buffer);
}

void PipeWireOutput::on_drained(void* userdata) {
    auto* self = static_cast<PipeWireOutput*>(userdata);
    util::Logger::debug("PipeWireOutput: Stream drained");
    self->drained_.store(true, std::memory_order_release);
    if (self->stream_) {
        pw_stream_set_active(self->stream_, false);
    }
}

static const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .destroy = nullptr,
    .state_changed = on_state_changed,
    .control_info = nullptr,
    .io_changed = nullptr,
    .param_changed = nullptr,
    .add_buffer = nullptr,
    .remove_buffer = nullptr,
    .process = PipeWireOutput::on_process,
    .drained = PipeWireOutput::on_drained,
    .command = nullptr,
    .trigger_done = nullptr,
};

PipeWireOutput::~PipeWireOutput() {
    if (context_.get_loop()) {
        PipeWireLock lock(context_);
        destroy_stream();
        source_.reset();
    }
}

bool PipeWireOutput::init() {
    if (!context_.init()) {
        util::Logger::error("PipeWireOutput: No PipeWire connection available");
        return false;
    }
    util::Logger::info("PipeWireOutput: Initialized");
    return true;
}

bool PipeWireOutput::create_stream(int sample_rate, int channels) {
    util::Logger::debug("PipeWireOutput: Creating stream (" + std::to_string(sample_rate) + "Hz, " +
                        std::to_string(channels) + "ch)");

    struct pw_thread_loop* loop = context_.get_loop();
    if (!loop) {
        util::Logger::error("PipeWireOutput: Context loop is null");
        return false;
    }

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music",
        nullptr
    );

    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop), "tunebox", props,
                                   &stream_events, this);
    if (!stream_) {
        util::Logger::error("PipeWireOutput: Failed to create stream");
        return false;
    }

    uint8_t pod_buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_buffer, sizeof(pod_buffer));

    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = static_cast<uint32_t>(channels);
    info.rate = static_cast<uint32_t>(sample_rate);

    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    int result = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT |
            PW_STREAM_FLAG_MAP_BUFFERS
        ),
        params, 1
    );
    if (result < 0) {
        util::Logger::error("PipeWireOutput: Stream connect failed (result=" + std::to_string(result) + ")");
        destroy_stream();
        return false;
    }

    sample_rate_ = sample_rate;
    channels_ = channels;
    return true;
}

void PipeWireOutput::destroy_stream() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    sample_rate_ = 0;
    channels_ = 0;
}

void PipeWireOutput::reset_resampler() {
    pending_.clear();
    phase_ = 0.0;
    source_done_ = false;
    drain_requested_ = false;
}

bool PipeWireOutput::start(std::shared_ptr<CaptureSource> source) {
    if (!source) return false;

    int rate = source->sample_rate();
    int channels = source->channels();
    if (rate <= 0 || channels <= 0) {
        util::Logger::error("PipeWireOutput: Refusing source with invalid format");
        return false;
    }

    PipeWireLock lock(context_);

    // Same format keeps the stream alive between tracks
    if (!stream_ || rate != sample_rate_ || channels != channels_) {
        if (stream_) {
            util::Logger::debug("PipeWireOutput: Format change (" + std::to_string(sample_rate_) + "Hz/" +
                                std::to_string(channels_) + "ch -> " + std::to_string(rate) + "Hz/" +
                                std::to_string(channels) + "ch), recreating stream");
        }
        destroy_stream();
        if (!create_stream(rate, channels)) return false;
    } else {
        pw_stream_flush(stream_, false);
    }

    source_ = std::move(source);
    reset_resampler();
    paused_ = false;
    drained_.store(false, std::memory_order_release);
    pw_stream_set_active(stream_, true);
    return true;
}

void PipeWireOutput::stop() {
    PipeWireLock lock(context_);
    source_.reset();
    reset_resampler();
    if (stream_) {
        pw_stream_set_active(stream_, false);
        pw_stream_flush(stream_, false);
    }
    drained_.store(true, std::memory_order_release);
}

void PipeWireOutput::pause(bool paused) {
    PipeWireLock lock(context_);
    if (paused_ == paused) return;
    paused_ = paused;

    util::Logger::debug(std::string("PipeWireOutput: ") + (paused ? "Paused" : "Resumed"));
    if (stream_ && !drained_.load(std::memory_order_acquire)) {
        pw_stream_set_active(stream_, !paused);
    }
}

void PipeWireOutput::set_volume(float volume) {
    volume_.store(volume, std::memory_order_relaxed);
}

void PipeWireOutput::set_speed(float speed) {
    speed_.store(speed, std::memory_order_relaxed);
}

bool PipeWireOutput::seek(double seconds) {
    PipeWireLock lock(context_);
    if (!source_) return false;
    if (!source_->seek(seconds)) return false;

    // Drop what was decoded for the old position
    reset_resampler();
    if (stream_) {
        pw_stream_flush(stream_, false);
        if (!paused_) pw_stream_set_active(stream_, true);
    }
    drained_.store(false, std::memory_order_release);
    return true;
}

bool PipeWireOutput::empty() const {
    return drained_.load(std::memory_order_acquire);
}

void PipeWireOutput::fill_buffer(struct pw_buffer* buffer) {
    struct spa_buffer* buf = buffer->buffer;
    auto* dst = static_cast<float*>(buf->datas[0].data);
    if (!dst || channels_ <= 0) {
        pw_stream_queue_buffer(stream_, buffer);
        return;
    }

    const size_t stride = sizeof(float) * static_cast<size_t>(channels_);
    size_t max_frames = buf->datas[0].maxsize / stride;
    if (buffer->requested > 0) {
        max_frames = std::min<size_t>(max_frames, buffer->requested);
    }

    size_t frames = source_ ? render(dst, max_frames) : 0;

    if (frames == 0) {
        if (source_ && source_done_ && pending_.empty()) {
            if (!drain_requested_) {
                drain_requested_ = true;
                pw_stream_flush(stream_, true);
            }
        } else {
            // Nothing decoded yet; keep the graph fed with silence
            std::memset(dst, 0, max_frames * stride);
            frames = max_frames;
        }
    }

    buf->datas[0].chunk->offset = 0;
    buf->datas[0].chunk->stride = static_cast<int32_t>(stride);
    buf->datas[0].chunk->size = static_cast<uint32_t>(frames * stride);
    pw_stream_queue_buffer(stream_, buffer);
}

size_t PipeWireOutput::render(float* dst, size_t max_frames) {
    const size_t ch = static_cast<size_t>(channels_);
    double speed = speed_.load(std::memory_order_relaxed);
    if (!(speed > 0.0)) speed = 1.0;

    // Pull enough input to cover max_frames output frames plus the
    // interpolation neighbour
    size_t pending_frames = pending_.size() / ch;
    size_t needed = static_cast<size_t>(std::ceil(phase_ + static_cast<double>(max_frames) * speed)) + 2;
    while (!source_done_ && pending_frames < needed) {
        size_t want = needed - pending_frames;
        read_buf_.resize(want * ch);
        int got = source_->read(read_buf_.data(), static_cast<int>(want));
        if (got <= 0) {
            source_done_ = true;
            break;
        }
        pending_.insert(pending_.end(), read_buf_.begin(),
                        read_buf_.begin() + static_cast<long>(got) * static_cast<long>(ch));
        pending_frames += static_cast<size_t>(got);
    }

    const float volume = volume_.load(std::memory_order_relaxed);
    size_t produced = 0;

    while (produced < max_frames) {
        size_t index = static_cast<size_t>(phase_);
        if (index >= pending_frames) break;

        bool has_next = index + 1 < pending_frames;
        if (!has_next && !source_done_) break;  // Wait for the neighbour frame

        float frac = static_cast<float>(phase_ - static_cast<double>(index));
        for (size_t c = 0; c < ch; ++c) {
            float a = pending_[index * ch + c];
            float sample = has_next ? a + (pending_[(index + 1) * ch + c] - a) * frac : a;
            sample *= volume;

            if (!std::isfinite(sample)) {
                if (nan_count_++ % 1000 == 0) {
                    util::Logger::warn("PipeWireOutput: Non-finite sample replaced (count=" +
                                       std::to_string(nan_count_) + ")");
                }
                sample = 0.0f;
            } else {
                sample = std::clamp(sample, -1.0f, 1.0f);
            }
            dst[produced * ch + c] = sample;
        }

        ++produced;
        phase_ += speed;
    }

    size_t consumed = std::min(static_cast<size_t>(phase_), pending_frames);
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<long>(consumed * ch));
    phase_ -= static_cast<double>(consumed);
    return produced;
}

}  // namespace tunebox::audio
