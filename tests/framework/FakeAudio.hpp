#pragma once

#include "audio/AudioOutput.hpp"
#include "audio/CaptureSource.hpp"
#include "audio/SampleSource.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace tunebox::test {

// Synthesized sine source; nothing is stored, any length is cheap.
class MemorySource : public audio::SampleSource {
public:
    MemorySource(int sample_rate, int channels, long total_frames, float frequency = 440.0f)
        : sample_rate_(sample_rate), channels_(channels), total_frames_(total_frames), frequency_(frequency) {}

    bool open(const std::string&) override { return true; }
    void close() override {}

    int read(float* buffer, int max_frames) override {
        long frames = std::min<long>(max_frames, total_frames_ - position_);
        if (frames <= 0) return 0;
        for (long f = 0; f < frames; ++f) {
            float t = static_cast<float>(position_ + f) / static_cast<float>(sample_rate_);
            float v = 0.5f * std::sin(2.0f * 3.14159265f * frequency_ * t);
            for (int ch = 0; ch < channels_; ++ch) {
                buffer[f * channels_ + ch] = v;
            }
        }
        position_ += frames;
        return static_cast<int>(frames);
    }

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }
    long total_frames() const override { return total_frames_; }
    bool is_open() const override { return true; }

    bool seek_frame(long frame) override {
        if (fail_seek) return false;
        position_ = std::clamp(frame, 0L, total_frames_);
        return true;
    }

    long position() const { return position_; }

    bool fail_seek = false;

private:
    int sample_rate_;
    int channels_;
    long total_frames_;
    float frequency_;
    long position_ = 0;
};

// Scripted output device. Nothing plays by itself: the test pulls audio
// with pump()/drain_all(), standing in for the device callback.
class FakeOutput : public audio::AudioOutput {
public:
    bool init_fails = false;
    bool seek_fails = false;

    bool init() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++init_calls_;
        return !init_fails;
    }

    bool start(std::shared_ptr<audio::CaptureSource> source) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            source_ = std::move(source);
            paused_ = false;
            ++starts_;
        }
        cv_.notify_all();
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        source_.reset();
        ++stops_;
    }

    void pause(bool paused) override {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = paused;
    }

    void set_volume(float volume) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            volume_ = volume;
            ++volume_calls_;
        }
        cv_.notify_all();
    }

    void set_speed(float speed) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            speed_ = speed;
        }
        cv_.notify_all();
    }

    bool seek(double seconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        seeks_.push_back(seconds);
        if (seek_fails || !source_) return false;
        return source_->seek(seconds);
    }

    bool empty() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !source_ || source_->exhausted();
    }

    // Pulls up to `frames` frames like a device period would
    int pump(int frames) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!source_ || paused_) return 0;
        buffer_.resize(static_cast<size_t>(frames) * static_cast<size_t>(std::max(source_->channels(), 1)));
        return source_->read(buffer_.data(), frames);
    }

    // Plays the attached source to its end
    long drain_all(int period = 4096) {
        long total = 0;
        while (int n = pump(period)) total += n;
        return total;
    }

    bool wait_for_starts(int count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return starts_ >= count; });
    }

    bool wait_for_volume(float volume, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return volume_ == volume; });
    }

    bool wait_for_speed(float speed, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return speed_ == speed; });
    }

    float volume() const { std::lock_guard<std::mutex> lock(mutex_); return volume_; }
    float speed() const { std::lock_guard<std::mutex> lock(mutex_); return speed_; }
    bool paused() const { std::lock_guard<std::mutex> lock(mutex_); return paused_; }
    bool has_source() const { std::lock_guard<std::mutex> lock(mutex_); return source_ != nullptr; }
    int starts() const { std::lock_guard<std::mutex> lock(mutex_); return starts_; }
    int init_calls() const { std::lock_guard<std::mutex> lock(mutex_); return init_calls_; }
    std::vector<double> seeks() const { std::lock_guard<std::mutex> lock(mutex_); return seeks_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<audio::CaptureSource> source_;
    std::vector<float> buffer_;
    bool paused_ = false;
    float volume_ = -1.0f;
    float speed_ = -1.0f;
    int volume_calls_ = 0;
    int starts_ = 0;
    int stops_ = 0;
    int init_calls_ = 0;
    std::vector<double> seeks_;
};

}  // namespace tunebox::test
