#include "ui/Formatting.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace tunebox::ui {

namespace {
    // Length of the CSI sequence starting at i, or 0
    size_t csi_length(const std::string& s, size_t i) {
        if (s[i] != '\x1B' || i + 1 >= s.size() || s[i + 1] != '[') return 0;
        size_t j = i + 2;
        while (j < s.size() && (s[j] < '@' || s[j] > '~')) ++j;
        if (j < s.size()) ++j;  // final byte
        return j - i;
    }

    size_t utf8_length(unsigned char c) {
        if ((c & 0x80) == 0) return 1;
        if ((c & 0xE0) == 0xC0) return 2;
        if ((c & 0xF0) == 0xE0) return 3;
        if ((c & 0xF8) == 0xF0) return 4;
        return 1;
    }
}

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size();) {
        if (size_t esc = csi_length(s, i)) {
            i += esc;
            continue;
        }
        i += utf8_length(static_cast<unsigned char>(s[i]));
        ++cols;
    }
    return cols;
}

std::string take_cols(const std::string& s, int width) {
    if (width <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    size_t i = 0;
    while (i < s.size() && seen < width) {
        if (size_t esc = csi_length(s, i)) {
            out.append(s, i, esc);
            i += esc;
            continue;
        }
        size_t len = std::min(utf8_length(static_cast<unsigned char>(s[i])), s.size() - i);
        out.append(s, i, len);
        i += len;
        ++seen;
    }
    return out;
}

std::string trunc_pad(const std::string& s, int width) {
    if (width <= 0) return "";

    int cols = display_cols(s);
    if (cols == width) return s;
    if (cols < width) return s + std::string(static_cast<size_t>(width - cols), ' ');
    if (width == 1) return take_cols(s, 1);
    return take_cols(s, width - 1) + "…";
}

std::string lr_align(int width, const std::string& left, const std::string& right) {
    if (width <= 0) return "";

    int rvis = display_cols(right);
    int left_max = std::max(width - rvis - 1, 0);
    std::string l = trunc_pad(left, left_max);
    int space = std::max(width - display_cols(l) - rvis, 0);
    return l + std::string(static_cast<size_t>(space), ' ') + right;
}

std::vector<std::string> make_box(const std::string& title,
                                  const std::vector<std::string>& lines,
                                  int width,
                                  int min_height) {
    std::vector<std::string> out;
    if (width < 3) {
        return std::vector<std::string>(static_cast<size_t>(std::max(1, min_height)), "");
    }

    int inner_width = width - 2;

    std::string top = "┌─ " + title + " ";
    for (int i = display_cols(top); i < width - 1; ++i) top += "─";
    top += "┐";
    out.push_back(take_cols(top, width));

    int content_lines = std::max(static_cast<int>(lines.size()), min_height);
    for (int i = 0; i < content_lines; ++i) {
        const std::string& content = i < static_cast<int>(lines.size()) ? lines[static_cast<size_t>(i)] : "";
        out.push_back("│" + trunc_pad(content, inner_width) + "\033[0m│");
    }

    std::string bottom = "└";
    for (int i = 0; i < inner_width; ++i) bottom += "─";
    bottom += "┘";
    out.push_back(bottom);
    return out;
}

std::string format_time(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    auto total = static_cast<long>(std::floor(seconds));
    long h = total / 3600;
    long m = (total % 3600) / 60;
    long s = total % 60;
    if (h > 0) return std::format("{}:{:02}:{:02}", h, m, s);
    return std::format("{}:{:02}", m, s);
}

}  // namespace tunebox::ui
