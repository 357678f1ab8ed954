#pragma once

#include "export.h"
#include "types.h"
#include <optional>
#include <ostream>
#include <string>

namespace speechtext {

class ScriptConverter;

/**
 * @brief Output path for an audio file: "<path without extension>_transcription.txt"
 */
SPEECHTEXT_API std::string transcript_output_path(const std::string& audio_path);

/**
 * @brief Render a transcript document
 *
 * Layout:
 * @code
 *   filename: <basename>
 *   file_size: <bytes> bytes
 *   sha1: <hex or empty>
 *
 *   language: <code>
 *   segments: <count>
 *
 *   <body>
 * @endcode
 *
 * With timestamps the body is "[start --> end]", the trimmed text and a blank
 * line per segment. Without timestamps it is one line per segment whose
 * trimmed text is non-empty.
 */
SPEECHTEXT_API void render_transcript(std::ostream& out,
                                      const TranscribeResult& result,
                                      const FileFingerprint& fingerprint,
                                      bool want_timestamps);

/**
 * @brief Write a transcript file, truncating any previous content
 *
 * @param result Transcription result (already script-converted if needed)
 * @param output_path Destination file
 * @param source_audio_path Audio file the header fingerprint is taken from
 * @param want_timestamps Emit per-segment time ranges
 *
 * @throws std::runtime_error if the output file cannot be opened or written
 */
SPEECHTEXT_API void write_transcript(const TranscribeResult& result,
                                     const std::string& output_path,
                                     const std::string& source_audio_path,
                                     bool want_timestamps);

/**
 * @brief Write a transcript, converting a copy of the result's script first
 *
 * The conversion follows maybe_convert(): it only applies to Chinese results.
 * A null converter with a requested variant uses OpenCCScriptConverter.
 */
SPEECHTEXT_API void write_transcript(const TranscribeResult& result,
                                     const std::string& output_path,
                                     const std::string& source_audio_path,
                                     bool want_timestamps,
                                     const std::optional<ScriptVariant>& script_variant,
                                     ScriptConverter* converter);

} // namespace speechtext
