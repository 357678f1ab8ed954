#pragma once

#include "export.h"
#include "script_converter.h"
#include "transcriber.h"
#include "types.h"
#include <memory>
#include <string>

namespace speechtext {

/**
 * @brief One request from audio file to transcript file
 *
 * Runs the Transcriber, applies optional Chinese script conversion and writes
 * "<audio>_transcription.txt" next to the audio. The file is only written
 * after a successful transcription.
 *
 * Example:
 * @code
 *   speechtext::Transcriber transcriber;
 *   speechtext::TranscriptionPipeline pipeline(transcriber);
 *
 *   speechtext::TranscriptionRequest request;
 *   request.audio_path = "interview.m4a";
 *   request.want_timestamps = true;
 *   std::string written = pipeline.run(request);
 * @endcode
 */
class SPEECHTEXT_API TranscriptionPipeline {
public:
    /**
     * @brief Use OpenCCScriptConverter for script conversion
     */
    explicit TranscriptionPipeline(Transcriber& transcriber);

    /**
     * @brief Use a caller-owned converter (must outlive the pipeline)
     */
    TranscriptionPipeline(Transcriber& transcriber, ScriptConverter& converter);

    ~TranscriptionPipeline();

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    /**
     * @brief Transcribe, convert and write
     *
     * @param request Audio path, language hint, timestamp flag and script target
     * @param progress Optional progress receiver
     * @return Path of the written transcript
     *
     * @throws ModelNotFoundError, TranscriptionError, std::runtime_error (write failure)
     */
    std::string run(const TranscriptionRequest& request, ProgressCallback progress = nullptr);

private:
    Transcriber& transcriber_;
    std::unique_ptr<ScriptConverter> owned_converter_;
    ScriptConverter* converter_;
};

} // namespace speechtext
