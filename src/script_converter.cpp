#include "speechtext/script_converter.h"
#include <opencc/opencc.h>
#include <iostream>

namespace speechtext {

// =======================
// OpenCCScriptConverter::Impl
// =======================

class OpenCCScriptConverter::Impl {
public:
    std::unique_ptr<opencc::SimpleConverter> to_simplified;
    std::unique_ptr<opencc::SimpleConverter> to_traditional;

    opencc::SimpleConverter& converter_for(ScriptVariant target) {
        auto& slot = target == ScriptVariant::Simplified ? to_simplified : to_traditional;
        if (!slot) {
            std::cout << "[SpeechText] Loading OpenCC configuration " << config_for(target) << "\n";
            slot = std::make_unique<opencc::SimpleConverter>(config_for(target));
        }
        return *slot;
    }
};

OpenCCScriptConverter::OpenCCScriptConverter()
    : pimpl_(std::make_unique<Impl>()) {
}

OpenCCScriptConverter::~OpenCCScriptConverter() = default;

std::string OpenCCScriptConverter::convert(const std::string& text, ScriptVariant target) {
    if (text.empty()) {
        return text;
    }
    return pimpl_->converter_for(target).Convert(text);
}

const char* OpenCCScriptConverter::config_for(ScriptVariant target) {
    return target == ScriptVariant::Simplified ? "t2s.json" : "s2t.json";
}

bool maybe_convert(TranscribeResult& result,
                   const std::optional<ScriptVariant>& variant,
                   ScriptConverter& converter) {
    if (!variant) {
        return false;
    }

    if (result.language != CHINESE_LANGUAGE_CODE) {
        std::cerr << "Warning: Chinese conversion ignored (language is not Chinese)\n";
        return false;
    }

    for (auto& segment : result.segments) {
        segment.text = converter.convert(segment.text, *variant);
    }
    result.full_text = converter.convert(result.full_text, *variant);

    std::cout << "[SpeechText] Converted " << result.segments.size() << " segment(s) to "
              << to_string(*variant) << " Chinese\n";
    return true;
}

} // namespace speechtext
