#include <catch2/catch.hpp>

#include "speechtext/errors.h"
#include "speechtext/transcriber.h"
#include "test_support.h"

#include <tuple>

using namespace speechtext_test;
using speechtext::DeviceType;

namespace {

struct Harness {
    TempDir dir;
    std::shared_ptr<FakeEngineState> state = std::make_shared<FakeEngineState>();
    DeviceType current_device = DeviceType::CPU;
    std::vector<speechtext::ModelOptions> loads;
    std::string load_failure;

    speechtext::Transcriber make(bool with_model = true) {
        speechtext::ModelOptions options;
        options.model_path = with_model ? make_model_dir(dir) : dir.file("models/absent");

        return speechtext::Transcriber(
            options,
            [this](const speechtext::ModelOptions& resolved) -> std::unique_ptr<speechtext::RecognitionEngine> {
                loads.push_back(resolved);
                if (!load_failure.empty()) {
                    throw std::runtime_error(load_failure);
                }
                return std::make_unique<FakeEngine>(state, resolved.device);
            },
            [this] { return current_device; });
    }
};

} // anonymous namespace

TEST_CASE("initial prompt is derived from the file name", "[transcriber]") {
    using speechtext::Transcriber;

    CHECK(Transcriber::build_initial_prompt("my_lecture-notes (v2).mp3") == "my lecture notes v2");
    CHECK(Transcriber::build_initial_prompt("/data/in/__Weekly--Sync__.wav") == "Weekly Sync");
    CHECK(Transcriber::build_initial_prompt("Q&A  session, part 3.m4a") == "Q A session part 3");
    CHECK(Transcriber::build_initial_prompt("会议_记录.mp3") == "会议 记录");
    CHECK(Transcriber::build_initial_prompt("!!!.mp3").empty());
    CHECK(Transcriber::build_initial_prompt("plain.mp3") == "plain");
}

TEST_CASE("missing model directory raises ModelNotFoundError", "[transcriber]") {
    Harness h;
    auto transcriber = h.make(false);

    CHECK_THROWS_AS(transcriber.transcribe(h.dir.file("talk.mp3")), speechtext::ModelNotFoundError);
    CHECK_THROWS_AS(transcriber.preload(), speechtext::ModelNotFoundError);
    CHECK(h.loads.empty());
    CHECK_FALSE(transcriber.is_loaded());
}

TEST_CASE("language hint and prompt reach the engine", "[transcriber]") {
    Harness h;
    h.state->result.language = "fr";
    h.state->result.segments = {{0.0, 1.0, "Bonjour"}};
    auto transcriber = h.make();

    SECTION("absent hint means auto-detect") {
        auto result = transcriber.transcribe("/tmp/team_meeting-2024.mp3");
        CHECK_FALSE(h.state->last_options.language.has_value());
        CHECK(h.state->last_options.initial_prompt == "team meeting 2024");
        CHECK(h.state->last_path == "/tmp/team_meeting-2024.mp3");
        CHECK(result.language == "fr");
        REQUIRE(result.segments.size() == 1);
        CHECK(result.segments[0].text == "Bonjour");
    }

    SECTION("hint is passed verbatim") {
        transcriber.transcribe("/tmp/a.mp3", std::string("not-a-code"));
        REQUIRE(h.state->last_options.language.has_value());
        CHECK(*h.state->last_options.language == "not-a-code");
    }
}

TEST_CASE("progress is forwarded and the observer is detached afterwards", "[transcriber]") {
    Harness h;
    auto transcriber = h.make();

    std::vector<std::tuple<int64_t, int64_t, double>> seen;
    auto callback = [&](int64_t done, int64_t total, double percent) {
        seen.emplace_back(done, total, percent);
    };

    SECTION("on success") {
        transcriber.transcribe(h.dir.file("a.mp3"), std::nullopt, callback);

        REQUIRE(seen.size() == 2);
        CHECK(std::get<0>(seen[0]) == 50);
        CHECK(std::get<1>(seen[0]) == 100);
        CHECK(std::get<2>(seen[0]) == Approx(50.0));
        CHECK(std::get<2>(seen[1]) == Approx(100.0));
        CHECK(h.state->observer_during_call);
        CHECK_FALSE(h.state->observer_attached);
    }

    SECTION("on failure") {
        h.state->fail_with = "decoder exploded";
        CHECK_THROWS_AS(transcriber.transcribe(h.dir.file("a.mp3"), std::nullopt, callback),
                        speechtext::TranscriptionError);
        CHECK(seen.size() == 2);
        CHECK_FALSE(h.state->observer_attached);

        // The engine accepts a new observer on the next call
        h.state->fail_with.clear();
        seen.clear();
        transcriber.transcribe(h.dir.file("a.mp3"), std::nullopt, callback);
        CHECK(seen.size() == 2);
    }

    SECTION("without a callback the engine keeps its default reporting") {
        transcriber.transcribe(h.dir.file("a.mp3"));
        CHECK_FALSE(h.state->observer_during_call);
    }
}

TEST_CASE("zero total reports 100 percent", "[transcriber]") {
    Harness h;
    h.state->progress_steps = {{0, 0}};
    auto transcriber = h.make();

    double percent = -1.0;
    transcriber.transcribe(h.dir.file("a.mp3"), std::nullopt,
                           [&](int64_t, int64_t, double p) { percent = p; });
    CHECK(percent == Approx(100.0));
}

TEST_CASE("engine failures become a single TranscriptionError", "[transcriber]") {
    Harness h;

    SECTION("decode failure") {
        h.state->fail_with = "bad frame";
        auto transcriber = h.make();
        try {
            transcriber.transcribe(h.dir.file("a.mp3"));
            FAIL("expected TranscriptionError");
        } catch (const speechtext::TranscriptionError& e) {
            CHECK(std::string(e.what()) == "transcription failed: bad frame");
        }
        CHECK(h.state->calls == 1);
    }

    SECTION("load failure") {
        h.load_failure = "out of memory";
        auto transcriber = h.make();
        try {
            transcriber.transcribe(h.dir.file("a.mp3"));
            FAIL("expected TranscriptionError");
        } catch (const speechtext::TranscriptionError& e) {
            CHECK(std::string(e.what()) == "transcription failed: out of memory");
        }
        CHECK(h.state->calls == 0);
    }
}

TEST_CASE("engine is reused per device and reloaded on device change", "[transcriber]") {
    Harness h;
    auto transcriber = h.make();

    transcriber.transcribe(h.dir.file("a.mp3"));
    transcriber.transcribe(h.dir.file("b.mp3"));
    REQUIRE(h.loads.size() == 1);
    CHECK(h.loads[0].device == DeviceType::CPU);
    CHECK(transcriber.loaded_device() == DeviceType::CPU);

    h.current_device = DeviceType::CUDA;
    transcriber.transcribe(h.dir.file("c.mp3"));
    REQUIRE(h.loads.size() == 2);
    CHECK(h.loads[1].device == DeviceType::CUDA);
    CHECK(transcriber.loaded_device() == DeviceType::CUDA);
    CHECK(h.state->calls == 3);
}

TEST_CASE("preload loads the engine once", "[transcriber]") {
    Harness h;
    auto transcriber = h.make();

    transcriber.preload();
    CHECK(transcriber.is_loaded());
    transcriber.transcribe(h.dir.file("a.mp3"));
    CHECK(h.loads.size() == 1);
}

TEST_CASE("a second live observer is a logic error", "[transcriber]") {
    auto state = std::make_shared<FakeEngineState>();
    FakeEngine engine(state, DeviceType::CPU);

    {
        speechtext::ScopedProgressObserver first(engine, [](int64_t, int64_t) {});
        CHECK(engine.has_progress_observer());
        CHECK_THROWS_AS(speechtext::ScopedProgressObserver(engine, [](int64_t, int64_t) {}),
                        std::logic_error);
        CHECK(engine.has_progress_observer());
    }
    CHECK_FALSE(engine.has_progress_observer());
}
