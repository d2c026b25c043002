#include "visualizer/Visualizer.hpp"
#include "util/Logger.hpp"
#include <kiss_fftr.h>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace tunebox::visualizer {

VisualizerMode next_mode(VisualizerMode mode) {
    switch (mode) {
        case VisualizerMode::FrequencyBars: return VisualizerMode::Waveform;
        case VisualizerMode::Waveform: return VisualizerMode::Off;
        case VisualizerMode::Off: return VisualizerMode::FrequencyBars;
    }
    return VisualizerMode::FrequencyBars;
}

std::string mode_label(VisualizerMode mode) {
    switch (mode) {
        case VisualizerMode::FrequencyBars: return "Spectrum";
        case VisualizerMode::Waveform: return "Waveform";
        case VisualizerMode::Off: return "Off";
    }
    return "Off";
}

void Visualizer::FftDeleter::operator()(kiss_fftr_state* cfg) const {
    kiss_fftr_free(cfg);
}

Visualizer::Visualizer()
    : bars_(NUM_BANDS, 0.0f)
    , peak_bars_(NUM_BANDS, 0.0f)
    , left_bars_(NUM_BANDS, 0.0f)
    , right_bars_(NUM_BANDS, 0.0f)
    , waveform_(WAVEFORM_WIDTH, 0.0f)
    , prev_bars_(NUM_BANDS, 0.0f)
    , prev_left_(NUM_BANDS, 0.0f)
    , prev_right_(NUM_BANDS, 0.0f)
    , history_(FFT_SIZE, 0.0f)
    , window_(FFT_SIZE)
    , fft_in_(FFT_SIZE)
    , magnitudes_(FFT_SIZE / 2)
    , fft_cfg_(kiss_fftr_alloc(static_cast<int>(FFT_SIZE), 0, nullptr, nullptr)) {
    for (size_t i = 0; i < FFT_SIZE; ++i) {
        window_[i] = 0.5f * (1.0f - std::cos(2.0f * std::numbers::pi_v<float> * static_cast<float>(i) /
                                             static_cast<float>(FFT_SIZE - 1)));
    }
    if (!fft_cfg_) {
        util::Logger::error("Visualizer: kiss_fftr_alloc failed, spectrum disabled");
    }
}

Visualizer::~Visualizer() = default;

std::pair<size_t, size_t> Visualizer::band_range(size_t band, size_t num_bins) {
    auto bin_start = [num_bins](size_t b) -> size_t {
        if (b == 0) return 1;  // Skip DC
        float log_max = std::log(static_cast<float>(num_bins));
        float log_pos = log_max * (static_cast<float>(b) / static_cast<float>(NUM_BANDS));
        return static_cast<size_t>(std::exp(log_pos));
    };

    size_t lo = std::min(bin_start(band), num_bins - 1);
    size_t hi = std::max(std::min(bin_start(band + 1), num_bins), lo + 1);
    return {lo, hi};
}

void Visualizer::process_samples(const std::vector<float>& chunk) {
    switch (mode_) {
        case VisualizerMode::FrequencyBars:
            process_fft(chunk);
            break;
        case VisualizerMode::Waveform:
            process_waveform(chunk);
            break;
        case VisualizerMode::Off:
            break;
    }
}

void Visualizer::process_fft(const std::vector<float>& chunk) {
    if (!fft_cfg_) return;

    // Slide the chunk into the trailing FFT_SIZE samples
    if (chunk.size() >= FFT_SIZE) {
        std::copy(chunk.end() - static_cast<long>(FFT_SIZE), chunk.end(), history_.begin());
    } else if (!chunk.empty()) {
        std::move(history_.begin() + static_cast<long>(chunk.size()), history_.end(), history_.begin());
        std::copy(chunk.begin(), chunk.end(), history_.end() - static_cast<long>(chunk.size()));
    }

    for (size_t i = 0; i < FFT_SIZE; ++i) {
        fft_in_[i] = history_[i] * window_[i];
    }

    std::vector<kiss_fft_cpx> out(FFT_SIZE / 2 + 1);
    kiss_fftr(fft_cfg_.get(), fft_in_.data(), out.data());

    const size_t half = FFT_SIZE / 2;
    for (size_t i = 0; i < half; ++i) {
        magnitudes_[i] = std::sqrt(out[i].r * out[i].r + out[i].i * out[i].i) / static_cast<float>(half);
    }

    for (size_t band = 0; band < NUM_BANDS; ++band) {
        auto [lo, hi] = band_range(band, half);
        float sum = 0.0f;
        for (size_t bin = lo; bin < hi; ++bin) sum += magnitudes_[bin];
        float value = sum / static_cast<float>(hi - lo);

        bars_[band] = prev_bars_[band] * (1.0f - SMOOTHING_FACTOR) + value * SMOOTHING_FACTOR;
    }
    prev_bars_ = bars_;

    // Near-silence stays unnormalized so noise is not blown up to full scale
    float max = *std::max_element(bars_.begin(), bars_.end());
    if (max > 0.001f) {
        for (auto& bar : bars_) {
            bar = std::min(bar / max, 1.0f);
        }
    }

    update_stereo();
    update_peaks();
}

void Visualizer::update_stereo() {
    // Left leans on the low end, right on the high end
    for (size_t i = 0; i < NUM_BANDS; ++i) {
        float position = static_cast<float>(i) / static_cast<float>(NUM_BANDS);
        float left = bars_[i] * (1.0f - position * 0.3f);
        float right = bars_[i] * (0.7f + position * 0.3f);

        left_bars_[i] = prev_left_[i] * 0.7f + left * 0.3f;
        right_bars_[i] = prev_right_[i] * 0.7f + right * 0.3f;
    }
    prev_left_ = left_bars_;
    prev_right_ = right_bars_;
}

void Visualizer::update_peaks() {
    for (size_t i = 0; i < NUM_BANDS; ++i) {
        peak_bars_[i] = std::max(peak_bars_[i], bars_[i]);
    }
}

void Visualizer::process_waveform(const std::vector<float>& chunk) {
    waveform_.resize(WAVEFORM_WIDTH, 0.0f);

    if (chunk.empty()) {
        std::fill(waveform_.begin(), waveform_.end(), 0.0f);
        return;
    }

    const float step = static_cast<float>(chunk.size()) / static_cast<float>(WAVEFORM_WIDTH);
    for (size_t i = 0; i < WAVEFORM_WIDTH; ++i) {
        size_t start = static_cast<size_t>(static_cast<float>(i) * step);
        size_t end = std::min(static_cast<size_t>(static_cast<float>(i + 1) * step), chunk.size());
        if (start >= chunk.size()) continue;

        float sum = 0.0f;
        for (size_t j = start; j < end; ++j) sum += chunk[j];
        size_t count = std::max<size_t>(end > start ? end - start : 0, 1);
        waveform_[i] = sum / static_cast<float>(count);
    }
}

void Visualizer::decay() {
    for (auto& bar : bars_) bar *= 0.85f;
    for (auto& bar : left_bars_) bar *= 0.85f;
    for (auto& bar : right_bars_) bar *= 0.85f;
    for (auto& peak : peak_bars_) peak *= 0.92f;  // Peaks fall slower
    for (auto& sample : waveform_) sample *= 0.85f;

    prev_bars_ = bars_;
    prev_left_ = left_bars_;
    prev_right_ = right_bars_;
}

}  // namespace tunebox::visualizer
