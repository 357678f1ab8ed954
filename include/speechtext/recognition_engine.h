#pragma once

#include "export.h"
#include "types.h"
#include <cstdint>
#include <functional>
#include <string>

namespace speechtext {

/**
 * @brief Receives the engine's decoding counters
 *
 * @param done Units (mel frames) decoded so far
 * @param total Units in the whole input
 */
using ProgressObserver = std::function<void(std::int64_t done, std::int64_t total)>;

/**
 * @brief Speech recognition backend
 *
 * Implementations turn an audio file into a TranscribeResult. While decoding
 * they report progress through the attached observer, or through their own
 * default reporting (console lines) when none is attached.
 *
 * Engines are not thread-safe; one request at a time per instance.
 */
class SPEECHTEXT_API RecognitionEngine {
public:
    virtual ~RecognitionEngine() = default;

    /**
     * @brief Transcribe a file
     *
     * @param audio_path Path to audio/video file
     * @param options Language, prompt and decoding parameters
     * @return Result with detected language and ordered segments
     *
     * @throws std::exception on decode or inference failure
     */
    virtual TranscribeResult transcribe(const std::string& audio_path,
                                        const DecodeOptions& options) = 0;

    /**
     * @brief Route progress to an observer; an empty observer restores default reporting
     */
    virtual void set_progress_observer(ProgressObserver observer) = 0;

    /**
     * @brief Whether a caller-supplied observer is currently attached
     */
    virtual bool has_progress_observer() const = 0;

    /**
     * @brief Device the engine runs on
     */
    virtual DeviceType device() const = 0;
};

} // namespace speechtext
