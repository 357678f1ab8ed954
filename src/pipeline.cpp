#include "speechtext/pipeline.h"
#include "speechtext/transcript_writer.h"
#include <iostream>

namespace speechtext {

TranscriptionPipeline::TranscriptionPipeline(Transcriber& transcriber)
    : transcriber_(transcriber)
    , owned_converter_(std::make_unique<OpenCCScriptConverter>())
    , converter_(owned_converter_.get()) {
}

TranscriptionPipeline::TranscriptionPipeline(Transcriber& transcriber, ScriptConverter& converter)
    : transcriber_(transcriber)
    , converter_(&converter) {
}

TranscriptionPipeline::~TranscriptionPipeline() = default;

std::string TranscriptionPipeline::run(const TranscriptionRequest& request, ProgressCallback progress) {
    TranscribeResult result = transcriber_.transcribe(request.audio_path, request.language_hint,
                                                      std::move(progress));

    maybe_convert(result, request.script_conversion, *converter_);

    const std::string output_path = transcript_output_path(request.audio_path);
    write_transcript(result, output_path, request.audio_path, request.want_timestamps);

    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "TRANSCRIPTION COMPLETE\n";
    std::cout << "Language: " << result.language << "\n";
    std::cout << "Segments: " << result.segments.size() << "\n";
    std::cout << "Output: " << output_path << "\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    return output_path;
}

} // namespace speechtext
