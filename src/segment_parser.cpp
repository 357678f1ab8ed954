#include "speechtext/segment_parser.h"
#include "speechtext/whisper_tokenizer.h"
#include <algorithm>
#include <cctype>
#include <locale>
#include <sstream>

namespace speechtext {

double parse_timestamp_token(const std::string& token) {
    if (token.size() < 6 || token.compare(0, 2, "<|") != 0 ||
        token.compare(token.size() - 2, 2, "|>") != 0) {
        return -1.0;
    }

    const std::string inner = token.substr(2, token.size() - 4);
    bool has_dot = false;
    for (char c : inner) {
        if (c == '.') {
            if (has_dot) return -1.0;
            has_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1.0;
        }
    }
    if (!has_dot || inner.size() < 2) return -1.0;

    // Token text always uses '.', whatever LC_NUMERIC the host has set
    std::istringstream stream(inner);
    stream.imbue(std::locale::classic());
    double seconds = -1.0;
    if (!(stream >> seconds)) return -1.0;
    return seconds;
}

std::vector<std::string> build_prompt(const std::string& language,
                                      const std::vector<std::string>& context,
                                      bool multilingual) {
    std::vector<std::string> prompt;
    if (!context.empty()) {
        prompt.push_back("<|startofprev|>");
        size_t skip = context.size() > MAX_PROMPT_TOKENS ? context.size() - MAX_PROMPT_TOKENS : 0;
        prompt.insert(prompt.end(), context.begin() + skip, context.end());
    }
    prompt.push_back("<|startoftranscript|>");
    if (multilingual) {
        prompt.push_back("<|" + language + "|>");
        prompt.push_back("<|transcribe|>");
    }
    return prompt;
}

void trim_context(std::vector<std::string>& context) {
    if (context.size() > MAX_PROMPT_TOKENS) {
        context.erase(context.begin(), context.end() - MAX_PROMPT_TOKENS);
    }
}

std::vector<Segment> split_segments(const std::vector<std::string>& tokens,
                                    double offset,
                                    double window_seconds,
                                    std::vector<std::string>& text_tokens) {
    std::vector<Segment> segments;

    // Skip an echoed prompt if the backend returned one
    size_t first = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] == "<|transcribe|>" || tokens[i] == "<|translate|>" ||
            tokens[i] == "<|notimestamps|>") {
            first = i + 1;
        }
    }

    std::vector<std::string> pending;
    double start = -1.0;

    auto flush = [&](double end) {
        double seg_start = offset + std::max(0.0, start);
        double seg_end = std::max(seg_start, offset + end);
        segments.emplace_back(seg_start, seg_end, WhisperTokenizer::decode(pending));
        pending.clear();
        start = -1.0;
    };

    for (size_t i = first; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        double ts = parse_timestamp_token(token);
        if (ts >= 0.0) {
            if (pending.empty()) {
                start = ts;
            } else {
                flush(ts);
            }
            continue;
        }

        if (WhisperTokenizer::is_special_token(token)) {
            continue;
        }

        pending.push_back(token);
        text_tokens.push_back(token);
    }

    if (!pending.empty()) {
        flush(window_seconds);
    }

    return segments;
}

} // namespace speechtext
