#pragma once

#include "export.h"
#include "types.h"
#include <ostream>
#include <string>
#include <vector>

namespace speechtext {

/**
 * @brief Downloads one remote file to a local path
 */
class SPEECHTEXT_API ModelFetcher {
public:
    virtual ~ModelFetcher() = default;

    /**
     * @throws std::runtime_error if the transfer fails
     */
    virtual void fetch(const std::string& url, const std::string& destination) = 0;
};

/**
 * @brief libcurl fetcher (follows redirects, fails on HTTP errors)
 *
 * Writes to "<destination>.part" and renames on success, so an interrupted
 * transfer never leaves a truncated file under the final name.
 */
class SPEECHTEXT_API HttpModelFetcher : public ModelFetcher {
public:
    explicit HttpModelFetcher(long connect_timeout_seconds = 30);
    ~HttpModelFetcher() override;

    HttpModelFetcher(const HttpModelFetcher&) = delete;
    HttpModelFetcher& operator=(const HttpModelFetcher&) = delete;

    void fetch(const std::string& url, const std::string& destination) override;

private:
    void* curl_handle_;
    long connect_timeout_;
};

/**
 * @brief Model cache root: $SPEECHTEXT_CACHE, else ~/.cache/speechtext
 */
SPEECHTEXT_API std::string default_cache_dir();

/**
 * @brief Where the base model comes from and where it goes
 */
struct ModelUpdateOptions {
    std::string model_name = "faster-whisper-base";            // Cache subdirectory
    std::string repository = "Systran/faster-whisper-base";    // Hugging Face repository
    std::string base_url = "https://huggingface.co";
    std::string cache_dir = default_cache_dir();
    std::string target_dir = DEFAULT_MODEL_DIRECTORY;

    std::vector<std::string> files = {
        "model.bin", "config.json", "vocabulary.txt", "tokenizer.json"
    };

    std::string file_url(const std::string& file) const {
        return base_url + "/" + repository + "/resolve/main/" + file;
    }
};

/**
 * @brief Refresh the local model from the remote repository
 *
 * Downloads every file into the cache, then copies the cached files into
 * target_dir. Individual download failures are reported and the cached copy
 * (if any) is used instead.
 *
 * @return Process exit code: 1 if model.bin is not in the cache afterwards
 *         or the copy fails, 0 otherwise
 */
SPEECHTEXT_API int update_model(ModelFetcher& fetcher, const ModelUpdateOptions& options, std::ostream& out);

} // namespace speechtext
