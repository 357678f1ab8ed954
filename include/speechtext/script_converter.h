#pragma once

#include "export.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>

namespace speechtext {

/**
 * @brief Converts text between Chinese script variants
 */
class SPEECHTEXT_API ScriptConverter {
public:
    virtual ~ScriptConverter() = default;

    /**
     * @brief Convert UTF-8 text to the requested variant
     * @throws std::runtime_error if the conversion tables cannot be loaded
     */
    virtual std::string convert(const std::string& text, ScriptVariant target) = 0;
};

/**
 * @brief OpenCC-backed converter
 *
 * Simplified uses the t2s.json configuration, Traditional uses s2t.json.
 * Each configuration is loaded on first use and kept for later calls.
 */
class SPEECHTEXT_API OpenCCScriptConverter : public ScriptConverter {
public:
    OpenCCScriptConverter();
    ~OpenCCScriptConverter() override;

    OpenCCScriptConverter(const OpenCCScriptConverter&) = delete;
    OpenCCScriptConverter& operator=(const OpenCCScriptConverter&) = delete;

    std::string convert(const std::string& text, ScriptVariant target) override;

    /// OpenCC configuration file used for a variant
    static const char* config_for(ScriptVariant target);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Apply script conversion to a result when it is Chinese
 *
 * Converts every segment text and the full text in place when a variant is
 * requested and result.language is "zh". When a variant is requested for any
 * other language a warning is printed and the result is left untouched.
 *
 * @return True if conversion was applied
 */
SPEECHTEXT_API bool maybe_convert(TranscribeResult& result,
                                  const std::optional<ScriptVariant>& variant,
                                  ScriptConverter& converter);

} // namespace speechtext
