#include "speechtext/transcriber.h"
#include "speechtext/errors.h"
#include "speechtext/whisper_engine.h"
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

bool is_prompt_char(unsigned char c) {
    // Bytes of multi-byte UTF-8 sequences count as word characters
    return c >= 0x80 || std::isalnum(c) || c == '_';
}

bool is_space(unsigned char c) {
    return std::isspace(c) != 0;
}

} // anonymous namespace

namespace speechtext {

// =======================
// ScopedProgressObserver
// =======================

ScopedProgressObserver::ScopedProgressObserver(RecognitionEngine& engine, ProgressObserver observer)
    : engine_(engine) {
    if (engine_.has_progress_observer()) {
        throw std::logic_error("a progress observer is already attached to this engine");
    }
    engine_.set_progress_observer(std::move(observer));
}

ScopedProgressObserver::~ScopedProgressObserver() {
    engine_.set_progress_observer(nullptr);
}

// =======================
// Transcriber::Impl
// =======================

class Transcriber::Impl {
public:
    ModelOptions options;
    EngineLoader loader;
    DeviceProbe probe;

    std::unique_ptr<RecognitionEngine> engine;
    DeviceType engine_device = DeviceType::CPU;

    void require_model() const {
        const fs::path marker = fs::path(options.model_path) / MODEL_WEIGHTS_FILE;
        std::error_code ec;
        if (!fs::is_regular_file(marker, ec)) {
            throw ModelNotFoundError(options.model_path);
        }
    }

    // Returns an engine for the device in use right now, reloading on change
    RecognitionEngine& engine_for_current_device() {
        DeviceType device = probe ? probe() : DeviceType::CPU;
        if (device == DeviceType::Auto) {
            device = DeviceType::CPU;
        }

        if (engine && engine_device == device) {
            return *engine;
        }

        if (engine) {
            std::cout << "[SpeechText] Device changed to " << to_string(device) << ", reloading model\n";
            engine.reset();
        }

        ModelOptions resolved = options;
        resolved.device = device;

        try {
            engine = loader(resolved);
        } catch (const std::exception& e) {
            throw TranscriptionError(e.what());
        }
        if (!engine) {
            throw TranscriptionError("engine loader returned no engine");
        }

        engine_device = device;
        return *engine;
    }
};

// =======================
// Transcriber Public API
// =======================

Transcriber::Transcriber(const ModelOptions& options)
    : Transcriber(options,
                  [](const ModelOptions& resolved) -> std::unique_ptr<RecognitionEngine> {
                      return std::make_unique<WhisperEngine>(resolved);
                  },
                  &Transcriber::probe_device) {
}

Transcriber::Transcriber(const ModelOptions& options, EngineLoader loader, DeviceProbe probe)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->options = options;
    pimpl_->loader = std::move(loader);
    pimpl_->probe = std::move(probe);

    if (!pimpl_->loader) {
        throw std::invalid_argument("Transcriber requires an engine loader");
    }
}

Transcriber::~Transcriber() = default;

Transcriber::Transcriber(Transcriber&&) noexcept = default;
Transcriber& Transcriber::operator=(Transcriber&&) noexcept = default;

TranscribeResult Transcriber::transcribe(const std::string& audio_path,
                                         const std::optional<std::string>& language_hint,
                                         ProgressCallback progress_callback) {
    pimpl_->require_model();

    RecognitionEngine& engine = pimpl_->engine_for_current_device();

    DecodeOptions decode_options;
    decode_options.language = language_hint;
    decode_options.initial_prompt = build_initial_prompt(audio_path);

    std::cout << "[SpeechText] Transcribing " << audio_path << " on " << to_string(engine.device())
              << " (language: " << language_hint.value_or("auto") << ")\n";
    if (!decode_options.initial_prompt.empty()) {
        std::cout << "[SpeechText] Initial prompt: \"" << decode_options.initial_prompt << "\"\n";
    }

    std::unique_ptr<ScopedProgressObserver> guard;
    if (progress_callback) {
        guard = std::make_unique<ScopedProgressObserver>(engine,
            [callback = std::move(progress_callback)](std::int64_t done, std::int64_t total) {
                double percent = total > 0
                    ? 100.0 * static_cast<double>(done) / static_cast<double>(total)
                    : 100.0;
                callback(done, total, percent);
            });
    }

    try {
        return engine.transcribe(audio_path, decode_options);
    } catch (const std::exception& e) {
        throw TranscriptionError(e.what());
    }
}

void Transcriber::preload() {
    pimpl_->require_model();
    pimpl_->engine_for_current_device();
}

bool Transcriber::is_loaded() const {
    return static_cast<bool>(pimpl_->engine);
}

DeviceType Transcriber::loaded_device() const {
    return pimpl_->engine_device;
}

std::string Transcriber::build_initial_prompt(const std::string& audio_path) {
    const std::string stem = fs::path(audio_path).stem().string();

    // Runs of '_' / '-' become one space, other punctuation becomes a space
    std::string cleaned;
    cleaned.reserve(stem.size());
    for (size_t i = 0; i < stem.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(stem[i]);
        if (c == '_' || c == '-') {
            while (i + 1 < stem.size() && (stem[i + 1] == '_' || stem[i + 1] == '-')) {
                ++i;
            }
            cleaned += ' ';
        } else if (is_prompt_char(c) || is_space(c)) {
            cleaned += static_cast<char>(c);
        } else {
            cleaned += ' ';
        }
    }

    // Collapse whitespace and trim
    std::string prompt;
    bool pending_space = false;
    for (char ch : cleaned) {
        if (is_space(static_cast<unsigned char>(ch))) {
            pending_space = !prompt.empty();
            continue;
        }
        if (pending_space) {
            prompt += ' ';
            pending_space = false;
        }
        prompt += ch;
    }
    return prompt;
}

DeviceType Transcriber::probe_device() {
    return cuda_available() ? DeviceType::CUDA : DeviceType::CPU;
}

} // namespace speechtext
