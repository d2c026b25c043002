#include "ui/VisualBlocks.hpp"
#include <algorithm>
#include <cmath>

namespace tunebox::ui::blocks {

namespace {
    const char* const BLOCKS[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};

    // Nearest-neighbour resample to `width` columns
    float sample_at(const std::vector<float>& values, int column, int width) {
        if (values.empty() || width <= 0) return 0.0f;
        size_t idx = static_cast<size_t>(column) * values.size() / static_cast<size_t>(width);
        return values[std::min(idx, values.size() - 1)];
    }
}

std::string level_block(float level) {
    if (!(level > 0.0f)) return " ";
    int idx = std::clamp(static_cast<int>(level * 8.0f), 0, 7);
    return BLOCKS[idx];
}

std::string progress_bar(double fraction, int width) {
    if (width <= 0) return "";
    fraction = std::clamp(fraction, 0.0, 1.0);

    int eighths = static_cast<int>(fraction * width * 8.0);
    int filled = eighths / 8;
    int partial = eighths % 8;

    std::string result;
    for (int i = 0; i < filled; ++i) result += "█";
    if (filled < width) {
        result += partial > 0 ? BLOCKS[partial - 1] : "░";
    }
    for (int i = filled + 1; i < width; ++i) result += "░";
    return result;
}

std::vector<std::string> spectrum_rows(const std::vector<float>& bars,
                                       const std::vector<float>& peaks,
                                       int width, int height) {
    std::vector<std::string> rows(static_cast<size_t>(std::max(height, 0)));
    if (width <= 0 || height <= 0) return rows;

    for (int row = 0; row < height; ++row) {
        // Row 0 is the top; each row covers 1/height of the range
        float floor = static_cast<float>(height - 1 - row) / static_cast<float>(height);
        float span = 1.0f / static_cast<float>(height);
        std::string& line = rows[static_cast<size_t>(row)];

        for (int col = 0; col < width; ++col) {
            float value = std::clamp(sample_at(bars, col, width), 0.0f, 1.0f);
            float fill = (value - floor) / span;
            if (fill >= 1.0f) {
                line += "█";
            } else if (fill > 0.0f) {
                line += level_block(fill);
            } else {
                float peak = sample_at(peaks, col, width);
                bool marker = peak > floor && peak <= floor + span && peak > value;
                line += marker ? "▔" : " ";
            }
        }
    }
    return rows;
}

std::vector<std::string> waveform_rows(const std::vector<float>& samples, int width, int height) {
    std::vector<std::string> rows(static_cast<size_t>(std::max(height, 0)));
    if (width <= 0 || height <= 0) return rows;

    std::vector<int> target(static_cast<size_t>(width));
    for (int col = 0; col < width; ++col) {
        float s = std::clamp(sample_at(samples, col, width), -1.0f, 1.0f);
        int row = static_cast<int>(std::lround((1.0f - s) * 0.5f * static_cast<float>(height - 1)));
        target[static_cast<size_t>(col)] = std::clamp(row, 0, height - 1);
    }

    int middle = (height - 1) / 2;
    for (int row = 0; row < height; ++row) {
        std::string& line = rows[static_cast<size_t>(row)];
        for (int col = 0; col < width; ++col) {
            int t = target[static_cast<size_t>(col)];
            if (row == t) {
                line += "•";
            } else if ((row > t && row <= middle) || (row < t && row >= middle)) {
                line += "│";
            } else {
                line += " ";
            }
        }
    }
    return rows;
}

}  // namespace tunebox::ui::blocks
