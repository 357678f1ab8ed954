#pragma once

#include "speechtext/export.h"
#include "speechtext/types.h"
#include <cstddef>
#include <string>
#include <vector>

namespace speechtext {

// Whisper keeps at most n_text_ctx / 2 - 1 tokens of previous context
constexpr size_t MAX_PROMPT_TOKENS = 223;

/**
 * @brief Parse a timestamp token like "<|12.34|>"
 * @return Seconds relative to the window, or -1 if the token is not a timestamp
 */
SPEECHTEXT_API double parse_timestamp_token(const std::string& token);

/**
 * @brief Decoder prompt for one window
 *
 * [<|startofprev|>, context..., <|startoftranscript|>, <|lang|>, <|transcribe|>]
 * Only the last MAX_PROMPT_TOKENS context tokens are kept. English-only
 * models get no language or task token.
 */
SPEECHTEXT_API std::vector<std::string> build_prompt(const std::string& language,
                                                     const std::vector<std::string>& context,
                                                     bool multilingual);

/**
 * @brief Drop all but the last MAX_PROMPT_TOKENS context tokens in place
 */
SPEECHTEXT_API void trim_context(std::vector<std::string>& context);

/**
 * @brief Split one window's tokens into timestamped segments
 *
 * Whisper brackets each segment with timestamp tokens: <|t0|> text <|t1|>.
 * Text with no opening timestamp starts at the window start, text left open
 * at the end of the window runs to the window end. Segment ends are clamped
 * so they never precede their starts.
 *
 * @param tokens Generated token strings, possibly with the prompt echoed in front
 * @param offset Window start in seconds
 * @param window_seconds Audio length covered by this window
 * @param text_tokens Receives every non-special token (context for the next window)
 */
SPEECHTEXT_API std::vector<Segment> split_segments(const std::vector<std::string>& tokens,
                                                   double offset,
                                                   double window_seconds,
                                                   std::vector<std::string>& text_tokens);

} // namespace speechtext
