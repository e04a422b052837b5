#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // Hex-encoded SHA-256 digest
    std::string sha256_hex(const std::string& input);

    std::string to_lower(const std::string& str);
    std::string trim(const std::string& str);

    // Lowercase, every non-word character replaced by a space, runs of
    // whitespace collapsed, ends trimmed
    std::string normalize_text(const std::string& text);

    bool is_word_char(char c);

    // Whole-word occurrences of term in text (both already normalized)
    int count_word_occurrences(const std::string& text, const std::string& term);

    std::vector<std::string> split_whitespace(const std::string& str);

    // Pieces between runs of '.', '!' or '?', trimmed, empty pieces dropped
    std::vector<std::string> split_sentences(const std::string& text);

    // Pieces between every single '.', '!' or '?', empty pieces kept
    std::vector<std::string> split_sentence_segments(const std::string& text);

    // Hostname of an http(s) URL, lowercased; empty when it cannot be parsed
    std::string extract_host(const std::string& url);
    std::string strip_www(const std::string& host);
}
