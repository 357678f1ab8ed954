#include "speechtext/fingerprint.h"
#include <openssl/evp.h>
#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace speechtext {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string to_hex(const unsigned char* data, unsigned int length) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

} // anonymous namespace

std::string sha1_file_hex(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return "";
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        std::cerr << "[SpeechText] SHA-1 digest unavailable\n";
        return "";
    }

    std::array<char, FINGERPRINT_CHUNK_SIZE> buffer;
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize got = file.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            return "";
        }
    }

    // eof is the only acceptable way out of the loop
    if (file.bad() || !file.eof()) {
        return "";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return "";
    }

    return to_hex(digest, digest_len);
}

FileFingerprint fingerprint_file(const std::string& path) {
    FileFingerprint fp;
    fp.filename = fs::path(path).filename().string();

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    fp.size_bytes = ec ? 0 : size;

    fp.sha1 = sha1_file_hex(path);
    return fp;
}

} // namespace speechtext
