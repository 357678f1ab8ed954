#pragma once

#include "speechtext/export.h"
#include "speechtext/types.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace speechtext {

enum class CliCommand {
    Transcribe,
    UpdateModel,
    Diagnose,
    ListLanguages
};

struct CommandLine {
    CliCommand command = CliCommand::Transcribe;
    TranscriptionRequest request;  // Only filled for Transcribe
};

/**
 * @brief Malformed command line; the front end prints usage and exits 1
 */
class SPEECHTEXT_API UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Parse arguments (argv without the program name)
 *
 * Maintenance commands must be the only argument. Any other "--" argument
 * that is not a known transcription flag is rejected rather than taken as
 * the audio path or language.
 *
 * @throws UsageError
 */
SPEECHTEXT_API CommandLine parse_command_line(const std::vector<std::string>& args);

} // namespace speechtext
