#include "speechtext/transcript_writer.h"
#include "speechtext/fingerprint.h"
#include "speechtext/script_converter.h"
#include "speechtext/timestamp.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

namespace speechtext {

std::string transcript_output_path(const std::string& audio_path) {
    fs::path path(audio_path);
    fs::path stem_path = path.parent_path() / path.stem();
    return stem_path.string() + "_transcription.txt";
}

void render_transcript(std::ostream& out,
                       const TranscribeResult& result,
                       const FileFingerprint& fingerprint,
                       bool want_timestamps) {
    // ═══════════════════════════════════════════════════════════
    // Header: file identity, then language and segment count
    // ═══════════════════════════════════════════════════════════
    out << "filename: " << fingerprint.filename << "\n";
    out << "file_size: " << fingerprint.size_bytes << " bytes\n";
    out << "sha1: " << fingerprint.sha1 << "\n\n";

    out << "language: " << result.language << "\n";
    out << "segments: " << result.segments.size() << "\n\n";

    // ═══════════════════════════════════════════════════════════
    // Body
    // ═══════════════════════════════════════════════════════════
    for (const auto& segment : result.segments) {
        std::string text = trim(segment.text);
        if (want_timestamps) {
            out << "[" << format_timestamp(segment.start) << " --> "
                << format_timestamp(segment.end) << "]\n";
            out << text << "\n\n";
        } else if (!text.empty()) {
            out << text << "\n";
        }
    }
}

void write_transcript(const TranscribeResult& result,
                      const std::string& output_path,
                      const std::string& source_audio_path,
                      bool want_timestamps) {
    FileFingerprint fingerprint = fingerprint_file(source_audio_path);

    // Binary mode keeps "\n" line endings on every platform
    std::ofstream file(output_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create transcript file: " + output_path);
    }

    render_transcript(file, result, fingerprint, want_timestamps);

    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write transcript file: " + output_path);
    }

    std::cout << "[SpeechText] Transcript saved to " << output_path << "\n";
}

void write_transcript(const TranscribeResult& result,
                      const std::string& output_path,
                      const std::string& source_audio_path,
                      bool want_timestamps,
                      const std::optional<ScriptVariant>& script_variant,
                      ScriptConverter* converter) {
    if (!script_variant) {
        write_transcript(result, output_path, source_audio_path, want_timestamps);
        return;
    }

    std::unique_ptr<OpenCCScriptConverter> fallback;
    if (!converter) {
        fallback = std::make_unique<OpenCCScriptConverter>();
        converter = fallback.get();
    }

    TranscribeResult converted = result;
    maybe_convert(converted, script_variant, *converter);
    write_transcript(converted, output_path, source_audio_path, want_timestamps);
}

} // namespace speechtext
