#include <catch2/catch.hpp>

#include "speechtext/audio_extractor.h"
#include "test_support.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

using namespace speechtext_test;

namespace {

constexpr double PI = 3.14159265358979323846;

void put_le(std::string& out, std::uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

// 16-bit PCM WAV holding a 440 Hz tone on every channel
std::string make_wav(int sample_rate, int channels, double seconds) {
    const std::uint32_t frames = static_cast<std::uint32_t>(sample_rate * seconds);
    const std::uint32_t data_bytes = frames * channels * 2;

    std::string wav = "RIFF";
    put_le(wav, 36 + data_bytes, 4);
    wav += "WAVEfmt ";
    put_le(wav, 16, 4);
    put_le(wav, 1, 2);  // PCM
    put_le(wav, channels, 2);
    put_le(wav, sample_rate, 4);
    put_le(wav, sample_rate * channels * 2, 4);
    put_le(wav, channels * 2, 2);
    put_le(wav, 16, 2);
    wav += "data";
    put_le(wav, data_bytes, 4);

    for (std::uint32_t n = 0; n < frames; ++n) {
        auto value = static_cast<std::int16_t>(8000.0 * std::sin(2.0 * PI * 440.0 * n / sample_rate));
        for (int c = 0; c < channels; ++c) {
            put_le(wav, static_cast<std::uint16_t>(value), 2);
        }
    }
    return wav;
}

} // anonymous namespace

TEST_CASE("extractor decodes PCM to 16 kHz mono", "[audio]") {
    TempDir dir;
    const int channels = GENERATE(1, 2);
    const int rate = GENERATE(16000, 44100);

    const std::string path = dir.file("tone.wav");
    write_file(path, make_wav(rate, channels, 0.5));

    speechtext::AudioExtractor extractor;
    std::vector<float> samples;
    float duration = 0.0f;
    REQUIRE(extractor.extract_audio(path, samples, duration));

    CHECK(duration == Approx(0.5).margin(0.05));
    CHECK(samples.size() == Approx(8000).margin(400));

    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::fabs(s));
    }
    CHECK(peak > 0.1f);
    CHECK(peak <= 1.0f);
}

TEST_CASE("extractor reports unreadable input", "[audio]") {
    TempDir dir;
    const std::string path = dir.file("noise.wav");
    write_file(path, "not audio at all");

    speechtext::AudioExtractor extractor;
    std::vector<float> samples;
    float duration = 0.0f;
    CHECK_FALSE(extractor.extract_audio(path, samples, duration));
    CHECK_FALSE(extractor.get_last_error().empty());
}
