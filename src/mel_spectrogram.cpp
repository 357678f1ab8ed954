#include "speechtext/mel_spectrogram.h"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace speechtext {

MelSpectrogram::MelSpectrogram(int sample_rate, int n_fft, int n_mels, int hop_length)
    : sample_rate_(sample_rate)
    , n_fft_(n_fft)
    , n_mels_(n_mels)
    , hop_length_(hop_length)
{
    // Periodic Hann window, as torch.hann_window
    window_.resize(n_fft_);
    for (int i = 0; i < n_fft_; i++) {
        window_[i] = 0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * i / n_fft_));
    }

    build_filters();
    build_twiddles();
}

// Slaney mel scale: linear below 1kHz, logarithmic above
float MelSpectrogram::hz_to_mel(float hz)
{
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (hz >= min_log_hz) {
        return min_log_mel + std::log(hz / min_log_hz) / logstep;
    }
    return hz / f_sp;
}

float MelSpectrogram::mel_to_hz(float mel)
{
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (mel >= min_log_mel) {
        return min_log_hz * std::exp(logstep * (mel - min_log_mel));
    }
    return f_sp * mel;
}

void MelSpectrogram::build_filters()
{
    const int n_freqs = n_fft_ / 2 + 1;
    filters_.assign(n_mels_, std::vector<float>(n_freqs, 0.0f));

    std::vector<float> fft_freqs(n_freqs);
    for (int i = 0; i < n_freqs; i++) {
        fft_freqs[i] = i * sample_rate_ / static_cast<float>(n_fft_);
    }

    const float max_mel = hz_to_mel(sample_rate_ / 2.0f);
    std::vector<float> edges(n_mels_ + 2);
    for (int i = 0; i < n_mels_ + 2; i++) {
        edges[i] = mel_to_hz(max_mel * i / (n_mels_ + 1));
    }

    for (int m = 0; m < n_mels_; m++) {
        const float left = edges[m];
        const float center = edges[m + 1];
        const float right = edges[m + 2];
        const float norm = 2.0f / (right - left);  // Slaney area normalization

        for (int f = 0; f < n_freqs; f++) {
            const float freq = fft_freqs[f];
            float weight = 0.0f;
            if (freq >= left && freq <= center) {
                weight = (freq - left) / (center - left);
            } else if (freq > center && freq <= right) {
                weight = (right - freq) / (right - center);
            }
            filters_[m][f] = weight * norm;
        }
    }
}

void MelSpectrogram::build_twiddles()
{
    const int n_freqs = n_fft_ / 2 + 1;
    cos_table_.resize(static_cast<size_t>(n_freqs) * n_fft_);
    sin_table_.resize(static_cast<size_t>(n_freqs) * n_fft_);

    for (int k = 0; k < n_freqs; k++) {
        for (int n = 0; n < n_fft_; n++) {
            const double angle = -2.0 * M_PI * k * n / n_fft_;
            cos_table_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(std::cos(angle));
            sin_table_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(std::sin(angle));
        }
    }
}

int MelSpectrogram::compute(const std::vector<float>& samples,
                            std::vector<std::vector<float>>& mel_output) const
{
    mel_output.clear();
    if (samples.empty()) {
        return 0;
    }

    // Centered frames: reflect-pad n_fft/2 on both sides
    const int pad = n_fft_ / 2;
    const int n_samples = static_cast<int>(samples.size());
    std::vector<float> padded(n_samples + 2 * pad);
    for (int i = 0; i < static_cast<int>(padded.size()); i++) {
        int src = i - pad;
        if (src < 0) src = -src;
        if (src >= n_samples) src = 2 * (n_samples - 1) - src;
        src = std::clamp(src, 0, n_samples - 1);
        padded[i] = samples[src];
    }

    // Whisper drops the final STFT frame
    const int n_frames = n_samples / hop_length_;
    if (n_frames <= 0) {
        return 0;
    }

    const int n_freqs = n_fft_ / 2 + 1;
    std::vector<float> power(n_freqs);
    std::vector<float> frame(n_fft_);
    mel_output.assign(n_frames, std::vector<float>(n_mels_));

    float max_log = -100.0f;

    for (int t = 0; t < n_frames; t++) {
        const int offset = t * hop_length_;
        for (int n = 0; n < n_fft_; n++) {
            frame[n] = padded[offset + n] * window_[n];
        }

        for (int k = 0; k < n_freqs; k++) {
            const float* c = &cos_table_[static_cast<size_t>(k) * n_fft_];
            const float* s = &sin_table_[static_cast<size_t>(k) * n_fft_];
            float re = 0.0f;
            float im = 0.0f;
            for (int n = 0; n < n_fft_; n++) {
                re += frame[n] * c[n];
                im += frame[n] * s[n];
            }
            power[k] = re * re + im * im;
        }

        for (int m = 0; m < n_mels_; m++) {
            const std::vector<float>& filter = filters_[m];
            float value = 0.0f;
            for (int k = 0; k < n_freqs; k++) {
                value += filter[k] * power[k];
            }
            const float log_value = std::log10(std::max(value, 1e-10f));
            mel_output[t][m] = log_value;
            max_log = std::max(max_log, log_value);
        }
    }

    // Dynamic range clamp relative to the loudest bin, then scale
    const float floor_value = max_log - 8.0f;
    for (auto& row : mel_output) {
        for (float& v : row) {
            v = (std::max(v, floor_value) + 4.0f) / 4.0f;
        }
    }
    silence_value_ = (std::max(-10.0f, floor_value) + 4.0f) / 4.0f;

    return n_frames;
}

} // namespace speechtext
