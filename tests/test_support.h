#pragma once

#include "speechtext/recognition_engine.h"
#include "speechtext/script_converter.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace speechtext_test {

namespace fs = std::filesystem;

/**
 * @brief Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("speechtext_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/**
 * @brief Everything a FakeEngine saw and will return, shared with the test
 */
struct FakeEngineState {
    speechtext::TranscribeResult result;
    std::string fail_with;                       // Non-empty: transcribe() throws this
    std::vector<std::pair<int64_t, int64_t>> progress_steps = {{50, 100}, {100, 100}};

    int calls = 0;
    std::string last_path;
    speechtext::DecodeOptions last_options;
    bool observer_during_call = false;
    bool observer_attached = false;
};

class FakeEngine : public speechtext::RecognitionEngine {
public:
    FakeEngine(std::shared_ptr<FakeEngineState> state, speechtext::DeviceType device)
        : state_(std::move(state)), device_(device) {}

    speechtext::TranscribeResult transcribe(const std::string& audio_path,
                                            const speechtext::DecodeOptions& options) override {
        state_->calls++;
        state_->last_path = audio_path;
        state_->last_options = options;
        state_->observer_during_call = static_cast<bool>(observer_);

        for (const auto& [done, total] : state_->progress_steps) {
            if (observer_) observer_(done, total);
        }

        if (!state_->fail_with.empty()) {
            throw std::runtime_error(state_->fail_with);
        }
        return state_->result;
    }

    void set_progress_observer(speechtext::ProgressObserver observer) override {
        observer_ = std::move(observer);
        state_->observer_attached = static_cast<bool>(observer_);
    }

    bool has_progress_observer() const override { return static_cast<bool>(observer_); }

    speechtext::DeviceType device() const override { return device_; }

private:
    std::shared_ptr<FakeEngineState> state_;
    speechtext::DeviceType device_;
    speechtext::ProgressObserver observer_;
};

/**
 * @brief Prefixes text with [S] or [T] so conversions are visible
 */
class FakeConverter : public speechtext::ScriptConverter {
public:
    std::string convert(const std::string& text, speechtext::ScriptVariant target) override {
        calls++;
        return (target == speechtext::ScriptVariant::Simplified ? "[S]" : "[T]") + text;
    }

    int calls = 0;
};

/**
 * @brief A model directory containing model.bin
 */
inline std::string make_model_dir(const TempDir& dir) {
    const std::string model_dir = dir.file("models/whisper-base");
    write_file(model_dir + "/model.bin", "weights");
    return model_dir;
}

} // namespace speechtext_test
