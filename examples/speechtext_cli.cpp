#include "speechtext/command_line.h"
#include "speechtext/diagnostics.h"
#include "speechtext/errors.h"
#include "speechtext/languages.h"
#include "speechtext/model_manager.h"
#include "speechtext/pipeline.h"
#include "speechtext/transcript_writer.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> SUPPORTED_EXTENSIONS = {".mp3", ".wav", ".m4a", ".flac", ".ogg", ".mp4"};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void print_usage(const char* program) {
    std::cout << "\nUsage: " << program << " <audio_file> [language] [--timestamps] [--chinese=simplified|traditional]\n";
    std::cout << "       " << program << " --update-model\n";
    std::cout << "       " << program << " --diagnose\n";
    std::cout << "       " << program << " --list-languages\n";
    std::cout << "\nArguments:\n";
    std::cout << "  audio_file: Path to an audio file (.mp3, .wav, .m4a, .flac, .ogg, .mp4)\n";
    std::cout << "  language: Optional Whisper language code or 'auto'\n";
    std::cout << "            Codes: english=en, chinese=zh, french=fr, auto=auto\n";
    std::cout << "  --timestamps: Include timestamps in output (disabled by default)\n";
    std::cout << "  --chinese=simplified|traditional: Convert Chinese output (only if language is zh)\n";
    std::cout << "  --update-model: Download the Whisper base model into " << speechtext::DEFAULT_MODEL_DIRECTORY << "\n";
    std::cout << "  --diagnose: Print platform/GPU/CUDA/CTranslate2/FFmpeg/model diagnostics\n";
    std::cout << "  --list-languages: Print all supported Whisper language codes and names\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " audio.mp3 zh --chinese=simplified\n";
    std::cout << "  " << program << " audio.mp3 zh --chinese=traditional --timestamps\n";
    std::cout << "  " << program << " audio.mp3 en\n";
    std::cout << "  " << program << " audio.mp3 auto --timestamps\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const char* program = argc > 0 ? argv[0] : "speechtext";

    // ═══════════════════════════════════════════════════════════
    // Argument parsing
    // ═══════════════════════════════════════════════════════════
    speechtext::CommandLine command_line;
    try {
        command_line = speechtext::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const speechtext::UsageError& e) {
        std::cout << "Error: " << e.what() << "\n";
        print_usage(program);
        return 1;
    }

    switch (command_line.command) {
        case speechtext::CliCommand::UpdateModel: {
            speechtext::HttpModelFetcher fetcher;
            return speechtext::update_model(fetcher, speechtext::ModelUpdateOptions{}, std::cout);
        }
        case speechtext::CliCommand::Diagnose:
            return speechtext::run_diagnostics(std::cout, speechtext::default_probes(speechtext::DEFAULT_MODEL_DIRECTORY));
        case speechtext::CliCommand::ListLanguages:
            return speechtext::list_languages(std::cout);
        case speechtext::CliCommand::Transcribe:
            break;
    }

    const speechtext::TranscriptionRequest& request = command_line.request;

    std::error_code ec;
    if (!fs::exists(request.audio_path, ec)) {
        std::cout << "Error: Audio file '" << request.audio_path << "' not found\n";
        return 1;
    }

    const std::string extension = to_lower(fs::path(request.audio_path).extension().string());
    if (std::find(SUPPORTED_EXTENSIONS.begin(), SUPPORTED_EXTENSIONS.end(), extension) == SUPPORTED_EXTENSIONS.end()) {
        std::cout << "Error: File '" << request.audio_path << "' is not a supported audio file\n";
        std::cout << "Supported extensions: .mp3 .wav .m4a .flac .ogg .mp4\n";
        return 1;
    }

    const std::string output_path = speechtext::transcript_output_path(request.audio_path);
    if (fs::exists(output_path, ec)) {
        std::cout << "Warning: " << output_path << " already exists and will be overwritten\n";
    }

    // ═══════════════════════════════════════════════════════════
    // Transcription
    // ═══════════════════════════════════════════════════════════
    try {
        speechtext::Transcriber transcriber;
        speechtext::TranscriptionPipeline pipeline(transcriber);

        auto progress = [](int64_t done, int64_t total, double percent) {
            std::cout << "Progress: " << std::fixed << std::setprecision(1) << percent << "% ("
                      << done << "/" << total << ")\n";
        };

        std::string written = pipeline.run(request, progress);

        std::cout << "\nTranscription completed successfully!\n";
        std::cout << "Output written to: " << written << "\n";

    } catch (const speechtext::ModelNotFoundError& e) {
        std::cout << "\nError: " << e.what() << "\n";
        std::cout << "Run '" << program << " --update-model' to download it.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cout << "\nError during transcription: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
