#pragma once

#include "export.h"
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace speechtext {

/**
 * @brief One section of the diagnostics report
 *
 * run() returns the section body, or throws when the probed component is not
 * available. The exception message is printed as "Not available: <cause>".
 */
struct DiagnosticProbe {
    std::string name;
    std::function<std::string()> run;
};

/**
 * @brief Platform, NVIDIA driver, CUDA toolkit, CTranslate2, FFmpeg and model probes
 *
 * @param model_path Model directory to report on
 */
SPEECHTEXT_API std::vector<DiagnosticProbe> default_probes(const std::string& model_path);

/**
 * @brief Run a shell command and capture stdout and stderr
 * @throws std::runtime_error if the command cannot start or exits non-zero
 */
SPEECHTEXT_API std::string run_command(const std::string& command);

/**
 * @brief Print "=== Speech-to-Text Diagnostics ===" followed by every probe section
 *
 * Probe failures are reported inline and never stop the report.
 *
 * @return Process exit code (always 0)
 */
SPEECHTEXT_API int run_diagnostics(std::ostream& out, const std::vector<DiagnosticProbe>& probes);

} // namespace speechtext
