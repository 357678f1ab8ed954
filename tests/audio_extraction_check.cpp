#include "speechtext/audio_extractor.h"
#include "speechtext/fingerprint.h"
#include "speechtext/mel_spectrogram.h"
#include <cmath>
#include <iomanip>
#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "SpeechText Audio Extraction Check\n";
    std::cout << "FFmpeg decode -> 16kHz mono -> log-mel features\n";
    std::cout << "═══════════════════════════════════════════════════════════\n\n";

    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <audio_file>\n";
        std::cout << "\nExample:\n";
        std::cout << "  " << argv[0] << " lecture.mp3\n";
        std::cout << "  " << argv[0] << " interview.m4a\n";
        return 1;
    }

    std::string file_path = argv[1];
    std::cout << "[Check] File: " << file_path << "\n\n";

    try {
        auto fingerprint = speechtext::fingerprint_file(file_path);
        std::cout << "[1] Fingerprint:\n";
        std::cout << "    Name:  " << fingerprint.filename << "\n";
        std::cout << "    Size:  " << fingerprint.size_bytes << " bytes\n";
        std::cout << "    SHA-1: " << fingerprint.sha1 << "\n\n";

        speechtext::AudioExtractor extractor;

        std::cout << "[2] Opening file...\n";
        if (!extractor.open(file_path)) {
            std::cerr << "[ERROR] Failed to open file: " << extractor.get_last_error() << "\n";
            return 1;
        }
        std::cout << "    ✓ File opened successfully\n";
        std::cout << "    Duration: " << std::fixed << std::setprecision(2) << extractor.get_duration() << "s\n\n";

        std::cout << "[3] Decoding (16kHz mono)...\n";
        std::vector<float> samples;
        if (!extractor.extract(samples)) {
            std::cerr << "[ERROR] Failed to decode: " << extractor.get_last_error() << "\n";
            return 1;
        }
        extractor.close();
        std::cout << "    ✓ Decoded " << samples.size() << " samples\n";
        std::cout << "    Duration: " << (samples.size() / static_cast<float>(speechtext::AudioExtractor::WHISPER_SAMPLE_RATE))
                  << "s at 16kHz\n\n";

        float min_sample = samples[0];
        float max_sample = samples[0];
        float sum = 0.0f;
        for (float s : samples) {
            if (s < min_sample) min_sample = s;
            if (s > max_sample) max_sample = s;
            sum += s * s;
        }

        std::cout << "[4] Audio Statistics:\n";
        std::cout << "    Min:  " << std::setprecision(4) << min_sample << "\n";
        std::cout << "    Max:  " << max_sample << "\n";
        std::cout << "    RMS:  " << std::sqrt(sum / samples.size()) << "\n\n";

        std::cout << "[5] Mel-spectrogram...\n";
        speechtext::MelSpectrogram mel;
        std::vector<std::vector<float>> features;
        int frames = mel.compute(samples, features);
        std::cout << "    ✓ " << frames << " frames x " << mel.mel_bins() << " mels\n\n";

        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "✓ SUCCESS: audio pipeline working correctly!\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n[EXCEPTION] " << e.what() << "\n";
        return 1;
    }
}
