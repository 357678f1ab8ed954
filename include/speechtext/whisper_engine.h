#pragma once

#include "export.h"
#include "recognition_engine.h"
#include "types.h"
#include <memory>
#include <string>

namespace speechtext {

/**
 * @brief Whisper recognition engine on CTranslate2
 *
 * Loads a CTranslate2-converted Whisper model directory (model.bin,
 * config.json, vocabulary.txt), decodes audio with FFmpeg, and transcribes it
 * in consecutive 30 second windows with timestamp tokens enabled.
 *
 * Example:
 * @code
 *   speechtext::ModelOptions options;
 *   options.device = speechtext::DeviceType::CPU;
 *   speechtext::WhisperEngine engine(options);
 *   auto result = engine.transcribe("talk.mp3", {});
 * @endcode
 */
class SPEECHTEXT_API WhisperEngine : public RecognitionEngine {
public:
    /**
     * @brief Load the model
     *
     * @param options Model directory and device. DeviceType::Auto resolves
     *                through cuda_available() at construction time.
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit WhisperEngine(const ModelOptions& options);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;
    WhisperEngine(WhisperEngine&&) noexcept;
    WhisperEngine& operator=(WhisperEngine&&) noexcept;

    TranscribeResult transcribe(const std::string& audio_path,
                                const DecodeOptions& options) override;

    void set_progress_observer(ProgressObserver observer) override;
    bool has_progress_observer() const override;
    DeviceType device() const override;

    bool is_multilingual() const;

private:
    class Impl;  // Forward declaration for pimpl idiom
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Number of CUDA devices CTranslate2 can see right now
 */
SPEECHTEXT_API int cuda_device_count();

/**
 * @brief True when at least one CUDA device is usable
 */
SPEECHTEXT_API bool cuda_available();

/**
 * @brief CTranslate2 version the library was built against ("unknown" if not recorded)
 */
SPEECHTEXT_API std::string engine_version();

} // namespace speechtext
