#include "speechtext/whisper_tokenizer.h"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <fstream>

namespace speechtext {

namespace {

// GPT-2 bytes_to_unicode(): printable Latin-1 bytes map to themselves,
// the remaining 68 bytes are shifted to U+0100 and up.
struct ByteAlphabet {
    std::array<char32_t, 256> byte_to_cp{};
    std::array<int, 512> cp_to_byte{};

    ByteAlphabet() {
        cp_to_byte.fill(-1);
        int shifted = 0;
        for (int b = 0; b < 256; ++b) {
            bool printable = (b >= 33 && b <= 126) || (b >= 161 && b <= 172) || (b >= 174 && b <= 255);
            char32_t cp = printable ? static_cast<char32_t>(b) : static_cast<char32_t>(256 + shifted++);
            byte_to_cp[b] = cp;
            cp_to_byte[cp] = b;
        }
    }
};

const ByteAlphabet& alphabet() {
    static const ByteAlphabet table;
    return table;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Length in bytes of the UTF-8 sequence starting with lead byte c
size_t utf8_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;  // Stray continuation byte
}

char32_t decode_utf8_at(const std::string& s, size_t pos, size_t len) {
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    if (len == 1) return lead;
    char32_t cp = (len == 2) ? (lead & 0x1F) : (len == 3) ? (lead & 0x0F) : (lead & 0x07);
    for (size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[pos + i]) & 0x3F);
    }
    return cp;
}

} // anonymous namespace

bool WhisperTokenizer::load_vocabulary(const std::string& vocabulary_path) {
    std::ifstream file(vocabulary_path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            add_token(line);
        }
    }

    return !vocab_.empty();
}

void WhisperTokenizer::add_token(const std::string& token) {
    vocab_.insert(token);
    max_token_bytes_ = std::max(max_token_bytes_, token.size());
}

std::vector<std::string> WhisperTokenizer::encode(const std::string& text, size_t max_tokens) const {
    std::vector<std::string> tokens;
    if (text.empty() || vocab_.empty()) {
        return tokens;
    }

    // Whisper prompts are tokenized with a leading space
    const std::string symbols = byte_encode(" " + text);

    size_t pos = 0;
    while (pos < symbols.size()) {
        size_t best = 0;
        size_t limit = std::min(max_token_bytes_, symbols.size() - pos);

        for (size_t len = limit; len > 0; --len) {
            // Only cut on code point boundaries
            if (pos + len < symbols.size() &&
                (static_cast<unsigned char>(symbols[pos + len]) & 0xC0) == 0x80) {
                continue;
            }
            if (vocab_.count(symbols.substr(pos, len)) > 0) {
                best = len;
                break;
            }
        }

        if (best == 0) {
            // Symbol missing from the vocabulary; drop it
            pos += utf8_length(static_cast<unsigned char>(symbols[pos]));
            continue;
        }

        tokens.push_back(symbols.substr(pos, best));
        pos += best;
    }

    if (max_tokens > 0 && tokens.size() > max_tokens) {
        tokens.erase(tokens.begin(), tokens.end() - static_cast<std::ptrdiff_t>(max_tokens));
    }
    return tokens;
}

std::string WhisperTokenizer::decode(const std::vector<std::string>& tokens) {
    std::string joined;
    for (const auto& token : tokens) {
        if (is_special_token(token)) {
            continue;
        }
        joined += token;
    }
    return byte_decode(joined);
}

std::string WhisperTokenizer::byte_encode(const std::string& text) {
    const auto& table = alphabet();
    std::string out;
    out.reserve(text.size() * 2);
    for (unsigned char c : text) {
        append_utf8(out, table.byte_to_cp[c]);
    }
    return out;
}

std::string WhisperTokenizer::byte_decode(const std::string& token_text) {
    const auto& table = alphabet();
    std::string out;
    out.reserve(token_text.size());

    size_t pos = 0;
    while (pos < token_text.size()) {
        size_t len = utf8_length(static_cast<unsigned char>(token_text[pos]));
        if (pos + len > token_text.size()) {
            len = 1;
        }
        char32_t cp = decode_utf8_at(token_text, pos, len);

        if (cp < table.cp_to_byte.size() && table.cp_to_byte[cp] >= 0) {
            out.push_back(static_cast<char>(table.cp_to_byte[cp]));
        } else {
            out.append(token_text, pos, len);
        }
        pos += len;
    }
    return out;
}

bool WhisperTokenizer::is_special_token(const std::string& token) {
    return token.size() >= 4 && token.compare(0, 2, "<|") == 0 &&
           token.compare(token.size() - 2, 2, "|>") == 0;
}

} // namespace speechtext
