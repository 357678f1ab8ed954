#include "speechtext/types.h"
#include <algorithm>
#include <cctype>

namespace speechtext {

std::string to_string(ScriptVariant variant) {
    switch (variant) {
        case ScriptVariant::Simplified: return "simplified";
        case ScriptVariant::Traditional: return "traditional";
    }
    return "simplified";
}

std::string to_string(DeviceType device) {
    switch (device) {
        case DeviceType::CUDA: return "cuda";
        case DeviceType::CPU: return "cpu";
        case DeviceType::Auto: return "auto";
    }
    return "auto";
}

std::optional<ScriptVariant> parse_script_variant(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "simplified") return ScriptVariant::Simplified;
    if (lower == "traditional") return ScriptVariant::Traditional;
    return std::nullopt;
}

} // namespace speechtext
