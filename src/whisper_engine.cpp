#include "speechtext/whisper_engine.h"
#include "speechtext/audio_extractor.h"
#include "speechtext/mel_spectrogram.h"
#include "speechtext/segment_parser.h"
#include "speechtext/whisper_tokenizer.h"
#include <ctranslate2/devices.h>
#include <ctranslate2/models/whisper.h>
#include <ctranslate2/replica_pool.h>
#include <ctranslate2/storage_view.h>
#include <ctranslate2/types.h>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

// Whisper consumes 30 second windows of 10ms frames
constexpr int WINDOW_FRAMES = 3000;
constexpr double FRAME_SECONDS = 0.01;

// "<|en|>" -> "en"
std::string strip_token_markers(const std::string& token) {
    if (speechtext::WhisperTokenizer::is_special_token(token)) {
        return token.substr(2, token.size() - 4);
    }
    return token;
}

std::string trim(const std::string& text) {
    const char* ws = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

ctranslate2::Device to_ct2_device(speechtext::DeviceType device) {
    return device == speechtext::DeviceType::CUDA ? ctranslate2::Device::CUDA : ctranslate2::Device::CPU;
}

} // anonymous namespace

namespace speechtext {

// =======================
// WhisperEngine::Impl
// =======================

class WhisperEngine::Impl {
public:
    std::unique_ptr<ctranslate2::models::Whisper> model;
    MelSpectrogram mel_converter;
    WhisperTokenizer tokenizer;
    bool has_vocabulary = false;
    DeviceType device = DeviceType::CPU;
    ProgressObserver observer;

    // Default reporting when no observer is attached
    void report_progress(std::int64_t done, std::int64_t total) {
        if (observer) {
            observer(done, total);
            return;
        }
        double percent = total > 0 ? 100.0 * static_cast<double>(done) / static_cast<double>(total) : 100.0;
        std::ostringstream line;
        line << "[SpeechText] Decoded " << done << "/" << total << " frames ("
             << std::fixed << std::setprecision(1) << percent << "%)\n";
        std::cout << line.str();
    }

    // Pad (with silence) and transpose one window into [1, n_mels, 3000]
    ctranslate2::StorageView window_features(const std::vector<std::vector<float>>& mel_features,
                                             int start_frame, int end_frame) const {
        const int n_mels = mel_converter.mel_bins();
        std::vector<float> flat(static_cast<size_t>(n_mels) * WINDOW_FRAMES, mel_converter.silence_value());

        for (int mel = 0; mel < n_mels; mel++) {
            for (int frame = start_frame; frame < end_frame; frame++) {
                flat[static_cast<size_t>(mel) * WINDOW_FRAMES + (frame - start_frame)] = mel_features[frame][mel];
            }
        }

        return ctranslate2::StorageView(
            ctranslate2::Shape{1, static_cast<ctranslate2::dim_t>(n_mels), WINDOW_FRAMES},
            flat,
            ctranslate2::Device::CPU
        );
    }

    std::string detect_language(const ctranslate2::StorageView& features) {
        auto futures = model->detect_language(features);
        if (futures.empty()) {
            throw std::runtime_error("language detection returned no result");
        }

        auto lang_probs = futures[0].get();
        if (lang_probs.empty()) {
            throw std::runtime_error("language detection returned no result");
        }

        auto best = std::max_element(lang_probs.begin(), lang_probs.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });

        std::string code = strip_token_markers(best->first);
        std::cout << "[SpeechText] Detected language: " << code
                  << " (probability: " << best->second << ")\n";
        return code;
    }
};

// =======================
// WhisperEngine Public API
// =======================

WhisperEngine::WhisperEngine(const ModelOptions& options)
    : pimpl_(std::make_unique<Impl>()) {

    try {
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "SPEECHTEXT WHISPER - LOADING MODEL\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

        DeviceType device = options.device;
        if (device == DeviceType::Auto) {
            device = cuda_available() ? DeviceType::CUDA : DeviceType::CPU;
        }

        std::cout << "Model: " << options.model_path << "\n";
        std::cout << "Device: " << to_string(device) << "\n";
        std::cout << "Compute type: " << options.compute_type << "\n";

        ctranslate2::ReplicaPoolConfig pool_config;
        pool_config.num_threads_per_replica = options.intra_threads > 0 ? options.intra_threads : 0;

        pimpl_->model = std::make_unique<ctranslate2::models::Whisper>(
            options.model_path,
            to_ct2_device(device),
            ctranslate2::str_to_compute_type(options.compute_type),
            std::vector<int>{options.device_index},
            false,  // tensor_parallel
            pool_config
        );
        pimpl_->device = device;

        const size_t n_mels = pimpl_->model->n_mels();
        std::cout << "Languages: " << (pimpl_->model->is_multilingual() ? "Multilingual" : "English-only")
                  << " (" << pimpl_->model->num_languages() << " languages)\n";
        std::cout << "Mel features: " << n_mels << "\n";

        if (n_mels != static_cast<size_t>(pimpl_->mel_converter.mel_bins())) {
            pimpl_->mel_converter = MelSpectrogram(AudioExtractor::WHISPER_SAMPLE_RATE, 400,
                                                   static_cast<int>(n_mels), 160);
        }

        const fs::path vocabulary = fs::path(options.model_path) / "vocabulary.txt";
        pimpl_->has_vocabulary = pimpl_->tokenizer.load_vocabulary(vocabulary.string());
        if (!pimpl_->has_vocabulary) {
            std::cerr << "[SpeechText] WARNING: " << vocabulary.string()
                      << " not readable, initial prompts disabled\n";
        }

        std::cout << "✓ Model loaded successfully\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

    } catch (const std::exception& e) {
        std::cerr << "✗ Failed to load Whisper model: " << e.what() << "\n";
        std::cerr << "═══════════════════════════════════════════════════════════\n";
        throw;
    }
}

WhisperEngine::~WhisperEngine() = default;

WhisperEngine::WhisperEngine(WhisperEngine&&) noexcept = default;
WhisperEngine& WhisperEngine::operator=(WhisperEngine&&) noexcept = default;

TranscribeResult WhisperEngine::transcribe(const std::string& audio_path, const DecodeOptions& options) {
    TranscribeResult result;

    std::cout << "[SpeechText] Loading audio from: " << audio_path << "\n";

    AudioExtractor extractor;
    std::vector<float> samples;
    float duration = 0.0f;
    if (!extractor.extract_audio(audio_path, samples, duration)) {
        throw std::runtime_error("Failed to load audio: " + extractor.get_last_error());
    }

    std::vector<std::vector<float>> mel_features;
    const int n_frames = pimpl_->mel_converter.compute(samples, mel_features);
    samples.clear();
    samples.shrink_to_fit();

    std::cout << "[SpeechText] Mel-spectrogram: " << n_frames << " frames x "
              << pimpl_->mel_converter.mel_bins() << " mels\n";

    if (n_frames == 0) {
        result.language = options.language.value_or("unknown");
        pimpl_->report_progress(0, 0);
        return result;
    }

    // Language: declared, detected from the first window, or English-only model
    if (options.language) {
        result.language = *options.language;
    } else if (!pimpl_->model->is_multilingual()) {
        result.language = "en";
    } else {
        std::cout << "[SpeechText] Detecting language from audio...\n";
        auto features = pimpl_->window_features(mel_features, 0, std::min(n_frames, WINDOW_FRAMES));
        result.language = pimpl_->detect_language(features);
    }

    std::vector<std::string> context;
    if (!options.initial_prompt.empty() && pimpl_->has_vocabulary) {
        context = pimpl_->tokenizer.encode(options.initial_prompt, MAX_PROMPT_TOKENS);
    }

    ctranslate2::models::WhisperOptions whisper_options;
    whisper_options.beam_size = options.beam_size;
    whisper_options.patience = options.patience;
    whisper_options.max_length = options.max_length;
    whisper_options.num_hypotheses = 1;
    whisper_options.return_scores = false;
    whisper_options.return_no_speech_prob = false;
    whisper_options.max_initial_timestamp_index = 50;
    whisper_options.suppress_blank = true;

    const int num_windows = (n_frames + WINDOW_FRAMES - 1) / WINDOW_FRAMES;
    std::cout << "[SpeechText] Transcribing " << num_windows << " window(s)\n";

    for (int window = 0; window < num_windows; ++window) {
        const int start_frame = window * WINDOW_FRAMES;
        const int end_frame = std::min(start_frame + WINDOW_FRAMES, n_frames);
        const double offset = start_frame * FRAME_SECONDS;
        const double window_seconds = (end_frame - start_frame) * FRAME_SECONDS;

        auto features = pimpl_->window_features(mel_features, start_frame, end_frame);
        std::vector<std::vector<std::string>> prompts = {
            build_prompt(result.language, context, pimpl_->model->is_multilingual())};

        auto futures = pimpl_->model->generate(features, prompts, whisper_options);
        if (futures.empty()) {
            throw std::runtime_error("Whisper returned no result for window " + std::to_string(window));
        }
        auto generation = futures[0].get();

        std::vector<std::string> text_tokens;
        if (!generation.sequences.empty()) {
            auto segments = split_segments(generation.sequences[0], offset, window_seconds, text_tokens);
            for (auto& seg : segments) {
                result.full_text += seg.text;
                result.segments.push_back(std::move(seg));
            }
        }

        if (options.condition_on_previous) {
            context.insert(context.end(), text_tokens.begin(), text_tokens.end());
            trim_context(context);
        } else {
            context.clear();
        }

        pimpl_->report_progress(end_frame, n_frames);
    }

    result.full_text = trim(result.full_text);

    std::cout << "[SpeechText] Completed transcription: " << result.segments.size() << " segment(s), "
              << duration << "s of audio\n";
    return result;
}

void WhisperEngine::set_progress_observer(ProgressObserver observer) {
    pimpl_->observer = std::move(observer);
}

bool WhisperEngine::has_progress_observer() const {
    return static_cast<bool>(pimpl_->observer);
}

DeviceType WhisperEngine::device() const {
    return pimpl_->device;
}

bool WhisperEngine::is_multilingual() const {
    return pimpl_->model->is_multilingual();
}

int cuda_device_count() {
    try {
        return ctranslate2::get_device_count(ctranslate2::Device::CUDA);
    } catch (const std::exception& e) {
        std::cerr << "[SpeechText] CUDA query failed: " << e.what() << "\n";
        return 0;
    }
}

bool cuda_available() {
    return cuda_device_count() > 0;
}

std::string engine_version() {
#ifdef SPEECHTEXT_CTRANSLATE2_VERSION
    return SPEECHTEXT_CTRANSLATE2_VERSION;
#else
    return "unknown";
#endif
}

} // namespace speechtext
