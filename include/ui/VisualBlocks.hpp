#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tunebox::ui::blocks {

constexpr std::string_view BLOCKS_8 = "▁▂▃▄▅▆▇█";

// level in [0,1] -> one of eight block glyphs, or a space at zero
std::string level_block(float level);

// Progress bar of exactly `width` columns, fraction clamped to [0,1]
std::string progress_bar(double fraction, int width);

// Vertical bar chart, `height` rows from top to bottom. Bars are resampled
// to `width` columns; peaks (optional) draw a marker above each column.
std::vector<std::string> spectrum_rows(const std::vector<float>& bars,
                                       const std::vector<float>& peaks,
                                       int width, int height);

// Oscilloscope trace of samples in [-1,1], `height` rows
std::vector<std::string> waveform_rows(const std::vector<float>& samples, int width, int height);

}  // namespace tunebox::ui::blocks
