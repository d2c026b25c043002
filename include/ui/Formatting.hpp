#pragma once

#include <string>
#include <vector>

namespace tunebox::ui {

// Display width of a string: CSI escape sequences take no columns, each
// UTF-8 code point takes one.
int display_cols(const std::string& s);

// Prefix of `s` covering at most `width` display columns; escapes are kept.
std::string take_cols(const std::string& s, int width);

// Exactly `width` columns: padded with spaces, or cut with an ellipsis.
std::string trunc_pad(const std::string& s, int width);

// left ... right, padded to `width` columns
std::string lr_align(int width, const std::string& left, const std::string& right);

// ┌─ title ─┐ frame around `lines`, padded to `min_height` rows
std::vector<std::string> make_box(const std::string& title,
                                  const std::vector<std::string>& lines,
                                  int width,
                                  int min_height = 0);

// 125.4 -> "2:05"; 3725 -> "1:02:05"
std::string format_time(double seconds);

}  // namespace tunebox::ui
