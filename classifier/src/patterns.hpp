#pragma once

#include <regex>
#include <string>
#include <vector>

// A phrase pattern that contributes a fixed amount to an additive score
struct WeightedMarker {
    std::regex pattern;
    double score;
};

// Static lexical tables used by the truth estimator and the content signal
// extractor. All regexes are compiled once on first use.
class PatternLibrary {
public:
    // Truth estimator tables (substring checks on lowercased text)
    static const std::vector<std::string>& clickbait_phrases();
    static const std::vector<std::string>& sensational_words();
    static const std::vector<std::string>& citation_phrases();
    static const std::regex& statistic_pattern();

    // Author signal tables
    static const std::vector<std::string>& emotional_words();
    static const std::vector<std::regex>& attack_patterns();
    static const std::vector<std::regex>& bad_faith_patterns();
    static const std::vector<std::regex>& engagement_bait_patterns();
    static const std::vector<std::regex>& promotional_patterns();
    static const std::vector<std::regex>& template_patterns();
    static const std::vector<std::regex>& affiliate_patterns();
    static const std::vector<std::regex>& whataboutism_patterns();

    // Lowercased-text markers for the additive authenticity heuristics
    static const std::vector<WeightedMarker>& personal_voice_markers();
    static const std::vector<WeightedMarker>& nuance_markers();
    static const std::regex& genuine_question_pattern();
    static const std::regex& rhetorical_question_pattern();

    // Total non-overlapping matches of every pattern in text
    static int count_matches(const std::string& text, const std::vector<std::regex>& patterns);
    static int count_matches(const std::string& text, const std::regex& pattern);

    // Number of distinct phrases that occur as substrings of text
    static int count_present(const std::string& text, const std::vector<std::string>& phrases);
    static bool any_present(const std::string& text, const std::vector<std::string>& phrases);
};
