#pragma once

#include "export.h"
#include "recognition_engine.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace speechtext {

/**
 * @brief Creates an engine for fully resolved options (device is never Auto)
 */
using EngineLoader = std::function<std::unique_ptr<RecognitionEngine>(const ModelOptions& options)>;

/**
 * @brief Returns the device a request should run on right now
 */
using DeviceProbe = std::function<DeviceType()>;

/**
 * @brief Attaches a progress observer to an engine for one scope
 *
 * The observer is detached when the guard goes out of scope, whether the
 * engine call returned or threw.
 *
 * @throws std::logic_error if the engine already has an observer attached
 */
class SPEECHTEXT_API ScopedProgressObserver {
public:
    ScopedProgressObserver(RecognitionEngine& engine, ProgressObserver observer);
    ~ScopedProgressObserver();

    ScopedProgressObserver(const ScopedProgressObserver&) = delete;
    ScopedProgressObserver& operator=(const ScopedProgressObserver&) = delete;

private:
    RecognitionEngine& engine_;
};

/**
 * @brief High-level transcription API
 *
 * Wraps a RecognitionEngine with the request-level policy:
 *
 * - Device is probed at the start of every request (CUDA when visible, CPU otherwise)
 * - The loaded engine is reused while the device stays the same
 * - The model directory must exist; it is never downloaded implicitly
 * - The audio file name seeds the decoder prompt
 * - Engine failures surface as a single TranscriptionError
 *
 * Example:
 * @code
 *   speechtext::Transcriber transcriber;
 *   auto result = transcriber.transcribe("lecture_01.mp3", std::nullopt,
 *       [](int64_t done, int64_t total, double percent) {
 *           std::cout << percent << "%\n";
 *       });
 * @endcode
 */
class SPEECHTEXT_API Transcriber {
public:
    /**
     * @brief Use WhisperEngine on the device reported by cuda_available()
     */
    explicit Transcriber(const ModelOptions& options = {});

    /**
     * @brief Use a custom engine factory and device probe
     */
    Transcriber(const ModelOptions& options, EngineLoader loader, DeviceProbe probe);

    ~Transcriber();

    // Move-only (no copying)
    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;
    Transcriber(Transcriber&&) noexcept;
    Transcriber& operator=(Transcriber&&) noexcept;

    /**
     * @brief Transcribe an audio file
     *
     * @param audio_path Path to audio/video file
     * @param language_hint Language code, or nullopt to auto-detect
     * @param progress_callback Optional progress receiver, called on this thread
     * @return Detected language, full text and ordered segments
     *
     * @throws ModelNotFoundError if the model directory has no model.bin
     * @throws TranscriptionError if the engine fails to load or decode
     * @throws std::logic_error if another observer is live on the engine
     */
    TranscribeResult transcribe(const std::string& audio_path,
                                const std::optional<std::string>& language_hint = std::nullopt,
                                ProgressCallback progress_callback = nullptr);

    /**
     * @brief Load the engine for the current device ahead of the first request
     */
    void preload();

    /// Whether an engine is currently loaded
    bool is_loaded() const;

    /// Device of the loaded engine (meaningful only when is_loaded())
    DeviceType loaded_device() const;

    /**
     * @brief Derive the decoder prompt from a file name
     *
     * "my_lecture-notes (v2).mp3" -> "my lecture notes v2". Non-ASCII
     * characters are kept.
     */
    static std::string build_initial_prompt(const std::string& audio_path);

    /**
     * @brief CUDA if a device is visible, CPU otherwise
     */
    static DeviceType probe_device();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace speechtext
