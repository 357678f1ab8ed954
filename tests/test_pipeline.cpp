#include <catch2/catch.hpp>

#include "speechtext/errors.h"
#include "speechtext/pipeline.h"
#include "test_support.h"

using namespace speechtext_test;

namespace {

speechtext::Transcriber make_transcriber(const TempDir& dir, std::shared_ptr<FakeEngineState> state) {
    speechtext::ModelOptions options;
    options.model_path = make_model_dir(dir);
    return speechtext::Transcriber(
        options,
        [state](const speechtext::ModelOptions& resolved) -> std::unique_ptr<speechtext::RecognitionEngine> {
            return std::make_unique<FakeEngine>(state, resolved.device);
        },
        [] { return speechtext::DeviceType::CPU; });
}

} // anonymous namespace

TEST_CASE("pipeline writes a converted transcript next to the audio", "[pipeline]") {
    TempDir dir;
    auto state = std::make_shared<FakeEngineState>();
    state->result.language = "zh";
    state->result.full_text = "你好世界";
    state->result.segments = {{0.0, 1.5, "你好"}, {1.5, 3.0, "世界"}};

    auto transcriber = make_transcriber(dir, state);
    FakeConverter converter;
    speechtext::TranscriptionPipeline pipeline(transcriber, converter);

    const std::string audio = dir.file("lecture_01.mp3");
    write_file(audio, "abc");

    speechtext::TranscriptionRequest request;
    request.audio_path = audio;
    request.language_hint = "zh";
    request.want_timestamps = true;
    request.script_conversion = speechtext::ScriptVariant::Simplified;

    int progress_calls = 0;
    std::string written = pipeline.run(request, [&](int64_t, int64_t, double) { progress_calls++; });

    CHECK(written == dir.file("lecture_01_transcription.txt"));
    CHECK(progress_calls == 2);
    CHECK(state->last_options.initial_prompt == "lecture 01");

    const std::string text = read_file(written);
    CHECK(text.rfind("filename: lecture_01.mp3\nfile_size: 3 bytes\n", 0) == 0);
    CHECK(text.find("language: zh\nsegments: 2\n\n") != std::string::npos);
    CHECK(text.find("[00:00:00.000 --> 00:00:01.500]\n[S]你好\n\n") != std::string::npos);
    CHECK(text.find("[00:00:01.500 --> 00:00:03.000]\n[S]世界\n\n") != std::string::npos);
}

TEST_CASE("pipeline ignores conversion for non-Chinese audio", "[pipeline]") {
    TempDir dir;
    auto state = std::make_shared<FakeEngineState>();
    state->result.language = "en";
    state->result.segments = {{0.0, 1.0, "Hello"}};

    auto transcriber = make_transcriber(dir, state);
    FakeConverter converter;
    speechtext::TranscriptionPipeline pipeline(transcriber, converter);

    const std::string audio = dir.file("hello.wav");
    write_file(audio, "abc");

    speechtext::TranscriptionRequest request;
    request.audio_path = audio;
    request.script_conversion = speechtext::ScriptVariant::Traditional;

    std::string written = pipeline.run(request);

    CHECK(converter.calls == 0);
    CHECK(read_file(written).find("\n\nHello\n") != std::string::npos);
}

TEST_CASE("pipeline writes nothing when transcription fails", "[pipeline]") {
    TempDir dir;
    auto state = std::make_shared<FakeEngineState>();
    state->fail_with = "corrupt stream";

    auto transcriber = make_transcriber(dir, state);
    FakeConverter converter;
    speechtext::TranscriptionPipeline pipeline(transcriber, converter);

    speechtext::TranscriptionRequest request;
    request.audio_path = dir.file("broken.mp3");
    write_file(request.audio_path, "abc");

    CHECK_THROWS_AS(pipeline.run(request), speechtext::TranscriptionError);
    CHECK_FALSE(fs::exists(dir.file("broken_transcription.txt")));
}
