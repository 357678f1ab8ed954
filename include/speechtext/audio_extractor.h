#pragma once

#include "speechtext/export.h"
#include <memory>
#include <string>
#include <vector>

namespace speechtext {

/**
 * @brief AudioExtractor - FFmpeg-backed audio loading
 *
 * Decodes the first audio stream of a file and prepares it for Whisper:
 * - 16kHz sample rate
 * - Mono channel
 * - Float32 samples normalized to [-1, 1]
 */
class SPEECHTEXT_API AudioExtractor {
public:
    static constexpr int WHISPER_SAMPLE_RATE = 16000;

    AudioExtractor();
    ~AudioExtractor();

    AudioExtractor(const AudioExtractor&) = delete;
    AudioExtractor& operator=(const AudioExtractor&) = delete;

    /**
     * @brief Open a file and locate its first audio stream
     * @param file_path Path to audio/video file
     * @return True if successful
     */
    bool open(const std::string& file_path);

    /**
     * @brief Close the currently open file
     */
    void close();

    /**
     * @brief Get duration in seconds (0 if no file open)
     */
    float get_duration() const;

    /**
     * @brief Decode the whole audio stream
     *
     * Handles any container/codec FFmpeg supports (MP3, WAV, M4A, FLAC, MP4, ...),
     * resampling to 16kHz and downmixing to mono.
     *
     * @param samples Output buffer for float32 samples
     * @return True if at least one sample was decoded
     */
    bool extract(std::vector<float>& samples);

    /**
     * @brief Open, decode and close in one call
     */
    bool extract_audio(const std::string& file_path,
                       std::vector<float>& samples,
                       float& duration);

    /**
     * @brief Get last error message
     */
    std::string get_last_error() const { return last_error_; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string last_error_;
};

} // namespace speechtext
