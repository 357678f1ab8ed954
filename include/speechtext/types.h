#pragma once

#include "export.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace speechtext {

/// Fixed location of the CTranslate2 Whisper model, relative to the working directory
constexpr const char* DEFAULT_MODEL_DIRECTORY = "models/whisper-base";

/// File whose presence marks a usable model directory
constexpr const char* MODEL_WEIGHTS_FILE = "model.bin";

/// Language code the script converter acts on
constexpr const char* CHINESE_LANGUAGE_CODE = "zh";

/**
 * @brief Device type for inference
 */
enum class DeviceType {
    Auto,           // Prefer CUDA when a device is visible at call time
    CUDA,           // NVIDIA GPU
    CPU             // CPU only
};

/**
 * @brief Chinese script targets
 */
enum class ScriptVariant {
    Simplified,     // Traditional -> Simplified (OpenCC t2s)
    Traditional     // Simplified -> Traditional (OpenCC s2t)
};

/**
 * @brief One time-bounded span of recognized text
 */
struct Segment {
    double start;                   // Start time in seconds
    double end;                     // End time in seconds
    std::string text;               // Recognized (possibly script-converted) text

    Segment() : start(0.0), end(0.0) {}
    Segment(double start_s, double end_s, std::string segment_text)
        : start(start_s), end(end_s), text(std::move(segment_text)) {}
};

/**
 * @brief Complete transcription result
 */
struct TranscribeResult {
    std::string language = "unknown";   // Detected or declared language code
    std::string full_text;              // All segment texts joined
    std::vector<Segment> segments;      // Engine order, by start time

    auto begin() const { return segments.begin(); }
    auto end() const { return segments.end(); }
    auto begin() { return segments.begin(); }
    auto end() { return segments.end(); }
};

/**
 * @brief A single transcription job as submitted by a caller
 */
struct TranscriptionRequest {
    std::string audio_path;
    std::optional<std::string> language_hint;        // nullopt = auto-detect
    bool want_timestamps = false;
    std::optional<ScriptVariant> script_conversion;  // Only honored for Chinese audio
};

/**
 * @brief File identity metadata written into transcript headers
 */
struct FileFingerprint {
    std::string filename;           // Basename of the source file
    std::uintmax_t size_bytes = 0;  // 0 when the size could not be read
    std::string sha1;               // Lowercase hex, empty on read failure
};

/**
 * @brief Progress callback for callers
 *
 * @param units_done Mel frames decoded so far
 * @param units_total Mel frames in the whole file
 * @param percent units_done / units_total * 100
 */
using ProgressCallback = std::function<void(std::int64_t units_done, std::int64_t units_total, double percent)>;

/**
 * @brief Model initialization options
 */
struct ModelOptions {
    std::string model_path = DEFAULT_MODEL_DIRECTORY;  // CTranslate2 model directory

    // Device configuration
    DeviceType device = DeviceType::Auto;
    std::string compute_type = "default";   // "default", "float16", "int8", "float32", ...

    // Threading (0 = auto-detect)
    int intra_threads = 0;

    // GPU options
    int device_index = 0;

    std::string device_string() const {
        switch (device) {
            case DeviceType::CUDA: return "cuda";
            case DeviceType::CPU: return "cpu";
            default: return "auto";
        }
    }
};

/**
 * @brief Decoding options passed from the adapter to the engine
 */
struct DecodeOptions {
    std::optional<std::string> language;   // nullopt = auto-detect
    std::string initial_prompt;            // Empty = no prompt

    int beam_size = 5;
    float patience = 1.0f;
    int max_length = 448;                  // Maximum tokens per window
    bool condition_on_previous = true;     // Feed previous window text as context
};

SPEECHTEXT_API std::string to_string(ScriptVariant variant);
SPEECHTEXT_API std::string to_string(DeviceType device);

/**
 * @brief Parse "simplified" / "traditional" (case-insensitive)
 * @return nullopt for any other value
 */
SPEECHTEXT_API std::optional<ScriptVariant> parse_script_variant(const std::string& value);

} // namespace speechtext
