#include "speechtext/command_line.h"
#include <algorithm>
#include <cctype>

namespace speechtext {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool maintenance_command(const std::string& arg, CliCommand& command) {
    if (arg == "--update-model") {
        command = CliCommand::UpdateModel;
    } else if (arg == "--diagnose") {
        command = CliCommand::Diagnose;
    } else if (arg == "--list-languages") {
        command = CliCommand::ListLanguages;
    } else {
        return false;
    }
    return true;
}

} // anonymous namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine parsed;
    std::vector<std::string> positional;

    for (const auto& arg : args) {
        CliCommand command;
        if (maintenance_command(arg, command)) {
            if (args.size() != 1) {
                throw UsageError(arg + " takes no other arguments");
            }
            parsed.command = command;
            return parsed;
        }

        if (arg == "--timestamps") {
            parsed.request.want_timestamps = true;
        } else if (arg.rfind("--chinese=", 0) == 0) {
            auto variant = parse_script_variant(arg.substr(10));
            if (!variant) {
                throw UsageError("--chinese must be 'simplified' or 'traditional'");
            }
            parsed.request.script_conversion = variant;
        } else if (arg.rfind("--", 0) == 0) {
            throw UsageError("Unknown option '" + arg + "'");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        throw UsageError("Invalid number of arguments");
    }

    parsed.request.audio_path = positional[0];
    const std::string language = positional.size() == 2 ? to_lower(positional[1]) : "auto";
    if (language != "auto") {
        parsed.request.language_hint = language;
    }
    return parsed;
}

} // namespace speechtext
