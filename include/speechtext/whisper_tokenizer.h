#pragma once

#include "speechtext/export.h"
#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace speechtext {

/**
 * @brief Text <-> token-string conversion for Whisper's byte-level BPE vocabulary
 *
 * CTranslate2 hands back token strings in GPT-2's byte-level alphabet, where
 * every raw byte is mapped to a printable code point (space becomes "Ġ",
 * newline "Ċ", and each UTF-8 byte of a CJK character becomes its own symbol).
 * Decoding therefore has to map symbols back to bytes before the text is
 * valid UTF-8 again.
 *
 * Encoding is only used for the initial prompt and does a greedy
 * longest-match against the model vocabulary rather than replaying BPE merges.
 */
class SPEECHTEXT_API WhisperTokenizer {
public:
    WhisperTokenizer() = default;

    /**
     * @brief Load vocabulary.txt (one token per line) from a model directory file
     * @return False if the file cannot be read or is empty
     */
    bool load_vocabulary(const std::string& vocabulary_path);

    /**
     * @brief Insert a token directly (tests and alternate vocab formats)
     */
    void add_token(const std::string& token);

    size_t vocabulary_size() const { return vocab_.size(); }

    /**
     * @brief Split text into vocabulary tokens
     *
     * @param text UTF-8 text
     * @param max_tokens Keep only the last max_tokens tokens (0 = no limit)
     * @return Token strings in the byte-level alphabet
     */
    std::vector<std::string> encode(const std::string& text, size_t max_tokens = 0) const;

    /**
     * @brief Join generated tokens into UTF-8 text, skipping <|special|> tokens
     */
    static std::string decode(const std::vector<std::string>& tokens);

    /// Raw UTF-8 bytes -> byte-level alphabet
    static std::string byte_encode(const std::string& text);

    /// Byte-level alphabet -> raw bytes. Code points outside the alphabet pass through.
    static std::string byte_decode(const std::string& token_text);

    /// True for tokens of the form <|...|>
    static bool is_special_token(const std::string& token);

private:
    std::unordered_set<std::string> vocab_;
    size_t max_token_bytes_ = 0;
};

} // namespace speechtext
