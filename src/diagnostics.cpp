#include "speechtext/diagnostics.h"
#include "speechtext/types.h"
#include "speechtext/whisper_engine.h"
#include <array>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <sys/utsname.h>
#include <sys/wait.h>

extern "C" {
    #include <libavformat/avformat.h>
    #include <libavutil/avutil.h>
}

namespace fs = std::filesystem;

namespace {

std::string trim_trailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::string format_lib_version(unsigned version) {
    std::ostringstream ss;
    ss << AV_VERSION_MAJOR(version) << "." << AV_VERSION_MINOR(version) << "." << AV_VERSION_MICRO(version);
    return ss.str();
}

std::string probe_platform() {
    struct utsname info;
    if (uname(&info) != 0) {
        throw std::runtime_error("uname failed");
    }
    std::ostringstream ss;
    ss << "  System: " << info.sysname << " " << info.release << "\n";
    ss << "  Machine: " << info.machine;
    return ss.str();
}

std::string probe_ctranslate2() {
    std::ostringstream ss;
    int count = speechtext::cuda_device_count();
    ss << "  Version: " << speechtext::engine_version() << "\n";
    ss << "  CUDA available: " << (count > 0 ? "true" : "false") << "\n";
    ss << "  Device count: " << count;

    if (count > 0) {
        std::istringstream names(speechtext::run_command("nvidia-smi --query-gpu=name --format=csv,noheader"));
        std::string name;
        int index = 0;
        while (std::getline(names, name) && index < count) {
            ss << "\n  GPU " << index++ << ": " << name;
        }
    }
    return ss.str();
}

std::string probe_ffmpeg() {
    std::ostringstream ss;
    ss << "  Version: " << av_version_info() << "\n";
    ss << "  libavformat: " << format_lib_version(avformat_version()) << "\n";
    ss << "  libavutil: " << format_lib_version(avutil_version());
    return ss.str();
}

std::string probe_model(const std::string& model_path) {
    std::error_code ec;
    fs::path dir = fs::absolute(model_path, ec);
    if (ec) dir = model_path;
    fs::path weights = dir / speechtext::MODEL_WEIGHTS_FILE;

    std::ostringstream ss;
    if (!fs::exists(weights, ec)) {
        ss << "  Not found: " << weights.string();
        return ss.str();
    }

    auto size = fs::file_size(weights, ec);
    if (ec) {
        ss << "  Found but could not stat: " << weights.string() << " (" << ec.message() << ")";
        return ss.str();
    }

    ss << "  Found: " << weights.string() << "\n";
    ss << "  Size: " << size << " bytes";
    return ss.str();
}

} // anonymous namespace

namespace speechtext {

std::string run_command(const std::string& command) {
    struct PipeCloser {
        void operator()(FILE* pipe) const { pclose(pipe); }
    };

    const std::string full = command + " 2>&1";
    FILE* raw = popen(full.c_str(), "r");
    if (!raw) {
        throw std::runtime_error("cannot run " + command);
    }
    std::unique_ptr<FILE, PipeCloser> pipe(raw);

    std::string output;
    std::array<char, 256> buffer;
    size_t got = 0;
    while ((got = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        output.append(buffer.data(), got);
    }

    int status = pclose(pipe.release());
    if (status == -1) {
        throw std::runtime_error("cannot wait for " + command);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw std::runtime_error(command + " exited with status " + std::to_string(code));
    }
    return trim_trailing(output);
}

std::vector<DiagnosticProbe> default_probes(const std::string& model_path) {
    return {
        {"Platform", probe_platform},
        {"nvidia-smi", [] { return run_command("nvidia-smi"); }},
        {"nvcc --version", [] { return run_command("nvcc --version"); }},
        {"CTranslate2", probe_ctranslate2},
        {"FFmpeg", probe_ffmpeg},
        {"Model file", [model_path] { return probe_model(model_path); }},
    };
}

int run_diagnostics(std::ostream& out, const std::vector<DiagnosticProbe>& probes) {
    out << "=== Speech-to-Text Diagnostics ===\n";

    for (const auto& probe : probes) {
        try {
            std::string body = probe.run ? probe.run() : std::string();
            out << "\n[" << probe.name << "]\n" << body << "\n";
        } catch (const std::exception& e) {
            out << "\n[" << probe.name << "] Not available: " << e.what() << "\n";
        }
    }

    out.flush();
    return 0;
}

} // namespace speechtext
