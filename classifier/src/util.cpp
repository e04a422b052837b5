#include "util.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string sha256_hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);

    std::ostringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

bool is_word_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return uc < 128 && (std::isalnum(uc) || c == '_');
}

std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;

    for (char c : text) {
        if (is_word_char(c)) {
            if (pending_space && !out.empty()) out += ' ';
            pending_space = false;
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            pending_space = true;
        }
    }
    return out;
}

int count_word_occurrences(const std::string& text, const std::string& term) {
    if (term.empty()) return 0;

    int count = 0;
    size_t pos = text.find(term);
    while (pos != std::string::npos) {
        size_t end = pos + term.size();
        bool left_ok = pos == 0 || !is_word_char(text[pos - 1]);
        bool right_ok = end >= text.size() || !is_word_char(text[end]);
        if (left_ok && right_ok) {
            count++;
            pos = text.find(term, end);
        } else {
            pos = text.find(term, pos + 1);
        }
    }
    return count;
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream ss(str);
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

static bool is_sentence_end(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    for (const auto& piece : split_sentence_segments(text)) {
        auto trimmed = trim(piece);
        if (!trimmed.empty()) {
            sentences.push_back(trimmed);
        }
    }
    return sentences;
}

std::vector<std::string> split_sentence_segments(const std::string& text) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : text) {
        if (is_sentence_end(c)) {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    segments.push_back(current);
    return segments;
}

std::string extract_host(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return "";

    size_t start = scheme_end + 3;
    size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    auto colon = authority.find(':');
    if (colon != std::string::npos) authority = authority.substr(0, colon);

    return to_lower(authority);
}

std::string strip_www(const std::string& host) {
    if (host.rfind("www.", 0) == 0) return host.substr(4);
    return host;
}

} // namespace util
