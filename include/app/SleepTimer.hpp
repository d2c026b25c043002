#pragma once

#include <chrono>
#include <optional>

namespace tunebox::app {

// Pauses playback after a fixed number of minutes, fading the volume out
// linearly over the final minute.
struct SleepTimer {
    using Clock = std::chrono::steady_clock;
    static constexpr std::chrono::seconds FADE_DURATION{60};

    Clock::time_point end_time;
    Clock::time_point fade_start;
    float original_volume = 0.0f;
    int duration_minutes = 0;

    static SleepTimer start(int minutes, float original_volume, Clock::time_point now) {
        SleepTimer timer;
        timer.end_time = now + std::chrono::minutes(minutes);
        timer.fade_start = timer.end_time - FADE_DURATION;
        timer.original_volume = original_volume;
        timer.duration_minutes = minutes;
        return timer;
    }

    // Off -> 15 -> 30 -> 45 -> 60 -> Off
    static std::optional<int> next_duration(std::optional<int> current) {
        if (!current) return 15;
        switch (*current) {
            case 15: return 30;
            case 30: return 45;
            case 45: return 60;
            default: return std::nullopt;
        }
    }

    bool expired(Clock::time_point now) const { return now >= end_time; }
    bool fading(Clock::time_point now) const { return now >= fade_start && now < end_time; }

    // original_volume until fade_start, then linearly down to 0 at end_time
    float volume_at(Clock::time_point now) const {
        if (now < fade_start) return original_volume;
        if (now >= end_time) return 0.0f;
        std::chrono::duration<float> remaining = end_time - now;
        std::chrono::duration<float> fade_total = end_time - fade_start;
        return original_volume * (remaining.count() / fade_total.count());
    }

    std::chrono::seconds remaining(Clock::time_point now) const {
        if (now >= end_time) return std::chrono::seconds::zero();
        return std::chrono::duration_cast<std::chrono::seconds>(end_time - now);
    }
};

}  // namespace tunebox::app
