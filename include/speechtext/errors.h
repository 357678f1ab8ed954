#pragma once

#include "export.h"
#include <stdexcept>
#include <string>

namespace speechtext {

/**
 * @brief The model directory is missing or incomplete
 *
 * Raised before any decoding starts. Fetching the model is an explicit
 * maintenance step (see model_manager.h), never a side effect of transcribing.
 */
class SPEECHTEXT_API ModelNotFoundError : public std::runtime_error {
public:
    explicit ModelNotFoundError(const std::string& model_path)
        : std::runtime_error("Model not found: " + model_path)
        , model_path_(model_path) {}

    const std::string& model_path() const { return model_path_; }

private:
    std::string model_path_;
};

/**
 * @brief Model load or decode failed for one request
 */
class SPEECHTEXT_API TranscriptionError : public std::runtime_error {
public:
    explicit TranscriptionError(const std::string& cause)
        : std::runtime_error("transcription failed: " + cause) {}
};

} // namespace speechtext
