#include "speechtext/model_manager.h"
#include <curl/curl.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

// libcurl write callback: append to an open FILE*
size_t write_to_file(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<FILE*>(userp)) * size;
}

struct FileCloser {
    void operator()(FILE* file) const { std::fclose(file); }
};

} // anonymous namespace

namespace speechtext {

// =======================
// HttpModelFetcher
// =======================

HttpModelFetcher::HttpModelFetcher(long connect_timeout_seconds)
    : curl_handle_(curl_easy_init())
    , connect_timeout_(connect_timeout_seconds) {
}

HttpModelFetcher::~HttpModelFetcher() {
    if (curl_handle_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_handle_));
        curl_handle_ = nullptr;
    }
}

void HttpModelFetcher::fetch(const std::string& url, const std::string& destination) {
    if (!curl_handle_) {
        throw std::runtime_error("Failed to initialize HTTP client");
    }

    const std::string partial = destination + ".part";
    std::unique_ptr<FILE, FileCloser> file(std::fopen(partial.c_str(), "wb"));
    if (!file) {
        throw std::runtime_error("Cannot write " + partial);
    }

    CURL* curl = static_cast<CURL*>(curl_handle_);
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, file.get());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "speechtext/1.0");

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    bool flushed = std::fflush(file.get()) == 0;
    file.reset();

    std::error_code ec;
    if (res != CURLE_OK || !flushed) {
        fs::remove(partial, ec);
        std::string cause = res != CURLE_OK ? curl_easy_strerror(res) : "write error";
        if (status >= 400) {
            cause += " (HTTP " + std::to_string(status) + ")";
        }
        throw std::runtime_error("Download failed for " + url + ": " + cause);
    }

    fs::rename(partial, destination, ec);
    if (ec) {
        fs::remove(partial, ec);
        throw std::runtime_error("Cannot move download into place: " + destination);
    }
}

// =======================
// Model update
// =======================

std::string default_cache_dir() {
    if (const char* env = std::getenv("SPEECHTEXT_CACHE")) {
        if (*env != '\0') return env;
    }
    if (const char* home = std::getenv("HOME")) {
        return (fs::path(home) / ".cache" / "speechtext").string();
    }
    return (fs::path(".cache") / "speechtext").string();
}

int update_model(ModelFetcher& fetcher, const ModelUpdateOptions& options, std::ostream& out) {
    const fs::path cache = fs::path(options.cache_dir) / options.model_name;

    out << "Downloading latest Whisper base model (requires internet)...\n";
    out << "[Model] Repository: " << options.repository << "\n";
    out << "[Model] Cache: " << cache.string() << "\n";

    std::error_code ec;
    fs::create_directories(cache, ec);
    if (ec) {
        out << "[Model] Cannot create cache directory: " << ec.message() << "\n";
    }

    for (const auto& file : options.files) {
        const fs::path destination = cache / file;
        try {
            out << "[Model] Fetching " << file << "\n";
            fetcher.fetch(options.file_url(file), destination.string());
        } catch (const std::exception& e) {
            out << "[Model] " << e.what() << "\n";
        }
    }

    const fs::path cached_weights = cache / MODEL_WEIGHTS_FILE;
    if (!fs::is_regular_file(cached_weights, ec)) {
        out << "Error: Could not find downloaded model at " << cached_weights.string() << "\n";
        return 1;
    }

    try {
        fs::create_directories(options.target_dir);
        for (const auto& file : options.files) {
            const fs::path source = cache / file;
            if (!fs::is_regular_file(source, ec)) {
                out << "[Model] Skipping " << file << " (not in cache)\n";
                continue;
            }
            fs::copy_file(source, fs::path(options.target_dir) / file, fs::copy_options::overwrite_existing);
        }
    } catch (const fs::filesystem_error& e) {
        out << "Error: Could not copy model into " << options.target_dir << ": " << e.what() << "\n";
        return 1;
    }

    out << "Model updated: " << options.target_dir << "\n";
    return 0;
}

} // namespace speechtext
