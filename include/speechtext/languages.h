#pragma once

#include "export.h"
#include <map>
#include <ostream>
#include <string>

namespace speechtext {

/**
 * @brief Whisper language codes mapped to their English names, sorted by code
 */
SPEECHTEXT_API const std::map<std::string, std::string>& supported_languages();

/**
 * @brief Whether a code is one Whisper can decode
 */
SPEECHTEXT_API bool is_supported_language(const std::string& code);

/**
 * @brief Print "Supported Whisper languages:" and one "code: name" line per language
 * @return Process exit code (always 0)
 */
SPEECHTEXT_API int list_languages(std::ostream& out);

} // namespace speechtext
