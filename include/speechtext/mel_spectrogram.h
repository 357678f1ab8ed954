#pragma once

#include <vector>

namespace speechtext {

/**
 * @brief Whisper-compatible log-mel spectrogram
 *
 * Mirrors OpenAI Whisper's feature extraction: centered STFT with reflection
 * padding, Hann window, Slaney mel filterbank, log10 with an 8-decade dynamic
 * range clamp relative to the loudest bin, then (x + 4) / 4 scaling.
 *
 * Defaults match Whisper:
 * - 80 mel bins (tiny/base/small/medium; large-v3 uses 128)
 * - 16kHz sample rate
 * - 400-point FFT (25ms @ 16kHz)
 * - 160-sample hop (10ms @ 16kHz)
 */
class MelSpectrogram {
public:
    MelSpectrogram(int sample_rate = 16000,
                   int n_fft = 400,
                   int n_mels = 80,
                   int hop_length = 160);

    /**
     * @brief Convert audio samples to log-mel features
     *
     * @param samples Audio samples (mono, float32, normalized to [-1, 1])
     * @param mel_output Output features (n_frames x n_mels)
     * @return Number of frames generated
     */
    int compute(const std::vector<float>& samples,
                std::vector<std::vector<float>>& mel_output) const;

    /**
     * @brief Feature value a frame of pure silence maps to for the last compute() call
     *
     * Used to pad short windows up to the 30 second input the model expects.
     */
    float silence_value() const { return silence_value_; }

    int mel_bins() const { return n_mels_; }
    int hop_length() const { return hop_length_; }

private:
    void build_filters();
    void build_twiddles();

    static float hz_to_mel(float hz);
    static float mel_to_hz(float mel);

    int sample_rate_;
    int n_fft_;
    int n_mels_;
    int hop_length_;
    std::vector<float> window_;
    std::vector<std::vector<float>> filters_;   // n_mels x n_freqs
    std::vector<float> cos_table_;              // n_freqs x n_fft
    std::vector<float> sin_table_;
    mutable float silence_value_ = -1.5f;
};

} // namespace speechtext
