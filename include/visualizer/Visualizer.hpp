#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct kiss_fftr_state;

namespace tunebox::visualizer {

enum class VisualizerMode {
    FrequencyBars,
    Waveform,
    Off,
};

// FrequencyBars -> Waveform -> Off -> FrequencyBars
VisualizerMode next_mode(VisualizerMode mode);
std::string mode_label(VisualizerMode mode);

// Turns mono sample chunks into display state: 64 log-spaced spectrum
// bars with peak hold, a pseudo-stereo split of those bars, and a 200
// point waveform. Single-threaded; lives on the UI thread.
//
// Mode changes never clear state, so stale bars linger until new data
// overwrites them or decay() fades them.
class Visualizer {
public:
    static constexpr size_t NUM_BANDS = 64;
    static constexpr size_t FFT_SIZE = 2048;
    static constexpr size_t WAVEFORM_WIDTH = 200;
    static constexpr float SMOOTHING_FACTOR = 0.35f;

    Visualizer();
    ~Visualizer();

    Visualizer(const Visualizer&) = delete;
    Visualizer& operator=(const Visualizer&) = delete;

    void process_samples(const std::vector<float>& chunk);

    // Call once per UI tick that brought no new chunk.
    void decay();

    void cycle() { mode_ = next_mode(mode_); }
    void set_mode(VisualizerMode mode) { mode_ = mode; }
    VisualizerMode mode() const { return mode_; }

    const std::vector<float>& bars() const { return bars_; }
    const std::vector<float>& peaks() const { return peak_bars_; }
    const std::vector<float>& left_bars() const { return left_bars_; }
    const std::vector<float>& right_bars() const { return right_bars_; }
    const std::vector<float>& waveform() const { return waveform_; }

    // Half-open bin range [first, second) averaged into one band. Low bands
    // may share a bin; ranges never go backwards and never exceed num_bins.
    static std::pair<size_t, size_t> band_range(size_t band, size_t num_bins);

private:
    struct FftDeleter {
        void operator()(kiss_fftr_state* cfg) const;
    };

    void process_fft(const std::vector<float>& chunk);
    void process_waveform(const std::vector<float>& chunk);
    void update_stereo();
    void update_peaks();

    VisualizerMode mode_ = VisualizerMode::FrequencyBars;

    std::vector<float> bars_;
    std::vector<float> peak_bars_;
    std::vector<float> left_bars_;
    std::vector<float> right_bars_;
    std::vector<float> waveform_;

    // Smoothed band values before normalization
    std::vector<float> prev_bars_;
    std::vector<float> prev_left_;
    std::vector<float> prev_right_;

    std::vector<float> history_;  // last FFT_SIZE samples seen, oldest first
    std::vector<float> window_;   // Hanning coefficients
    std::vector<float> fft_in_;
    std::vector<float> magnitudes_;
    std::unique_ptr<kiss_fftr_state, FftDeleter> fft_cfg_;
};

}  // namespace tunebox::visualizer
