#include <catch2/catch.hpp>

#include "speechtext/whisper_tokenizer.h"

using speechtext::WhisperTokenizer;

TEST_CASE("space and newline map to the byte-level alphabet", "[tokenizer]") {
    CHECK(WhisperTokenizer::byte_encode(" ") == "\xC4\xA0");   // U+0120 'Ġ'
    CHECK(WhisperTokenizer::byte_encode("\n") == "\xC4\x8A");  // U+010A 'Ċ'
    CHECK(WhisperTokenizer::byte_encode("abc") == "abc");
}

TEST_CASE("decode joins tokens and drops special tokens", "[tokenizer]") {
    std::vector<std::string> tokens = {"<|0.00|>", "\xC4\xA0Hello", "\xC4\xA0world", "<|1.20|>", "<|endoftext|>"};
    CHECK(WhisperTokenizer::decode(tokens) == " Hello world");
}

TEST_CASE("decode restores CJK characters split across tokens", "[tokenizer]") {
    const std::string symbols = WhisperTokenizer::byte_encode("你好");

    // Split after the first byte symbol of the first character
    size_t cut = (static_cast<unsigned char>(symbols[0]) < 0x80) ? 1 : 2;
    std::vector<std::string> tokens = {symbols.substr(0, cut), symbols.substr(cut)};

    CHECK(WhisperTokenizer::decode(tokens) == "你好");
}

TEST_CASE("encode does greedy longest match against the vocabulary", "[tokenizer]") {
    WhisperTokenizer tokenizer;
    const std::string G = "\xC4\xA0";
    const std::vector<std::string> vocabulary = {G + "Hello", G + "wor", "ld", G + "world", G, "H", "e"};
    for (const auto& token : vocabulary) {
        tokenizer.add_token(token);
    }

    CHECK(tokenizer.encode("Hello world") == std::vector<std::string>{G + "Hello", G + "world"});
    CHECK(tokenizer.encode("Hello world", 1) == std::vector<std::string>{G + "world"});
    CHECK(tokenizer.encode("").empty());
}

TEST_CASE("encode drops symbols missing from the vocabulary", "[tokenizer]") {
    WhisperTokenizer tokenizer;
    tokenizer.add_token("\xC4\xA0" "a");

    CHECK(tokenizer.encode("a#") == std::vector<std::string>{"\xC4\xA0" "a"});
}

TEST_CASE("special token detection", "[tokenizer]") {
    CHECK(WhisperTokenizer::is_special_token("<|en|>"));
    CHECK(WhisperTokenizer::is_special_token("<|12.34|>"));
    CHECK_FALSE(WhisperTokenizer::is_special_token("<|"));
    CHECK_FALSE(WhisperTokenizer::is_special_token("hello"));
}
