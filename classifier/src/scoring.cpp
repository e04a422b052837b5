#include "scoring.hpp"
#include "patterns.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

ContentScorer::ContentScorer(const ClassifierTuning& tuning)
    : tuning_(tuning) {}

int ContentScorer::blend_axis(int keyword_score, const SourceEntry* source, Axis axis) const {
    if (!source) return keyword_score;

    double blended = source->bias.get(axis) * tuning_.source_weight +
                     keyword_score * tuning_.keyword_weight;
    return std::clamp(static_cast<int>(std::round(blended)), -100, 100);
}

int ContentScorer::estimate_truth(const std::string& text, const SourceEntry* source) const {
    int score = source ? source->factual_rating : tuning_.neutral_truth;

    auto signals = analyze_truth_signals(text);

    if (signals.excessive_caps) score -= tuning_.caps_penalty;
    if (signals.clickbait) score -= tuning_.clickbait_penalty;
    if (signals.emotional_language) score -= tuning_.sensational_penalty;
    if (signals.citations) score += tuning_.citation_bonus;
    if (signals.statistics) score += tuning_.statistic_bonus;
    if (signals.long_quote) score += tuning_.quote_bonus;

    return std::clamp(score, 0, 100);
}

TruthSignals ContentScorer::analyze_truth_signals(const std::string& text) const {
    TruthSignals signals;
    std::string lower = util::to_lower(text);

    signals.excessive_caps = has_excessive_caps(text);
    signals.clickbait = PatternLibrary::any_present(lower, PatternLibrary::clickbait_phrases());
    signals.emotional_language =
        PatternLibrary::count_present(lower, PatternLibrary::sensational_words()) >
        tuning_.sensational_word_limit;
    signals.citations = PatternLibrary::any_present(lower, PatternLibrary::citation_phrases());
    signals.statistics = std::regex_search(text, PatternLibrary::statistic_pattern());
    signals.long_quote = has_long_quote(text);

    return signals;
}

bool ContentScorer::has_excessive_caps(const std::string& text) const {
    auto words = util::split_whitespace(text);
    if (words.empty()) return false;

    int caps_words = 0;
    for (const auto& word : words) {
        if (word.size() <= 2) continue;

        bool has_alpha = false;
        bool has_lower = false;
        for (char c : word) {
            auto uc = static_cast<unsigned char>(c);
            if (std::isalpha(uc)) has_alpha = true;
            if (std::islower(uc)) has_lower = true;
        }
        if (has_alpha && !has_lower) caps_words++;
    }

    return static_cast<double>(caps_words) / words.size() > tuning_.caps_ratio_limit;
}

bool ContentScorer::has_long_quote(const std::string& text) const {
    // Straight quotes and UTF-8 curly quotes
    static const std::pair<std::string, std::string> delimiters[] = {
        {"\"", "\""},
        {"\xE2\x80\x9C", "\xE2\x80\x9D"}
    };

    for (const auto& [open, close] : delimiters) {
        size_t pos = text.find(open);
        while (pos != std::string::npos) {
            size_t start = pos + open.size();
            size_t end = text.find(close, start);
            if (end == std::string::npos) break;
            if (end - start >= tuning_.min_quote_length) return true;
            pos = text.find(open, end + close.size());
        }
    }
    return false;
}

double ContentScorer::estimate_confidence(int total_matches, bool source_known,
                                          size_t text_length) const {
    double confidence = tuning_.confidence_base;

    confidence += std::min(tuning_.confidence_match_cap,
                           total_matches * tuning_.confidence_per_match);

    if (source_known) {
        confidence += tuning_.confidence_source_bonus;
    }

    double length_factor = std::min(1.0, text_length / tuning_.confidence_length_norm);
    confidence += length_factor * tuning_.confidence_length_weight;

    return std::min(1.0, confidence);
}
