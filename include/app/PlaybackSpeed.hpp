#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <string>

namespace tunebox::app {

// Fixed speed ladder; stepping past either end stays put.
class PlaybackSpeed {
public:
    static constexpr std::array<float, 6> LADDER = {0.5f, 0.75f, 1.0f, 1.25f, 1.5f, 2.0f};
    static constexpr size_t NORMAL_INDEX = 2;

    PlaybackSpeed() = default;

    // Nearest ladder entry to an arbitrary multiplier
    static PlaybackSpeed nearest(double multiplier) {
        PlaybackSpeed speed;
        double best = 1e9;
        for (size_t i = 0; i < LADDER.size(); ++i) {
            double diff = std::fabs(LADDER[i] - multiplier);
            if (diff < best) {
                best = diff;
                speed.index_ = i;
            }
        }
        return speed;
    }

    PlaybackSpeed up() const {
        PlaybackSpeed next = *this;
        if (next.index_ + 1 < LADDER.size()) ++next.index_;
        return next;
    }

    PlaybackSpeed down() const {
        PlaybackSpeed next = *this;
        if (next.index_ > 0) --next.index_;
        return next;
    }

    float value() const { return LADDER[index_]; }

    std::string label() const {
        static const std::array<const char*, 6> labels = {"0.5x", "0.75x", "1x", "1.25x", "1.5x", "2x"};
        return labels[index_];
    }

    bool operator==(const PlaybackSpeed&) const = default;

private:
    size_t index_ = NORMAL_INDEX;
};

}  // namespace tunebox::app
