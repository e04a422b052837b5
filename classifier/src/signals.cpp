#include "signals.hpp"
#include "patterns.hpp"
#include "util.hpp"
#include <algorithm>
#include <regex>
#include <unordered_map>

namespace {

// Pieces between runs of sentence punctuation; empty pieces at either end kept
std::vector<std::string> split_on_runs(const std::string& text) {
    std::vector<std::string> pieces;
    std::string current;
    bool in_run = false;

    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            if (!in_run) {
                pieces.push_back(current);
                current.clear();
            }
            in_run = true;
        } else {
            in_run = false;
            current += c;
        }
    }
    pieces.push_back(current);
    return pieces;
}

std::string strip_edge_punctuation(const std::string& token) {
    size_t start = 0;
    size_t end = token.size();
    while (start < end && !util::is_word_char(token[start])) start++;
    while (end > start && !util::is_word_char(token[end - 1])) end--;
    return token.substr(start, end - start);
}

} // namespace

int ContentSignals::nonzero_count() const {
    const double values[] = {
        repetitive_patterns, template_likelihood, emotional_language_density,
        personal_attacks, bad_faith_arguments, engagement_baiting,
        promotional_language, affiliate_link_count, whataboutism_density,
        personal_voice, nuanced_arguments, original_content
    };
    return static_cast<int>(std::count_if(std::begin(values), std::end(values),
                                          [](double v) { return v > 0.0; }));
}

ContentSignals ContentSignalExtractor::extract(const std::string& text) {
    ContentSignals signals;

    auto sentences = util::split_sentences(text);
    std::string lower = util::to_lower(text);
    double sentence_count = std::max<double>(static_cast<double>(sentences.size()), 1.0);

    signals.repetitive_patterns = compute_repetition(sentences);
    signals.template_likelihood = compute_template_likelihood(text);

    signals.emotional_language_density = compute_emotional_density(text);
    signals.personal_attacks = PatternLibrary::count_matches(text, PatternLibrary::attack_patterns());
    signals.bad_faith_arguments = PatternLibrary::count_matches(text, PatternLibrary::bad_faith_patterns());
    signals.engagement_baiting = compute_engagement_bait(text);

    signals.promotional_language =
        PatternLibrary::count_matches(lower, PatternLibrary::promotional_patterns()) / sentence_count;
    signals.affiliate_link_count = PatternLibrary::count_matches(text, PatternLibrary::affiliate_patterns());

    signals.whataboutism_density = compute_whataboutism(text);

    signals.personal_voice = compute_personal_voice(text);
    signals.nuanced_arguments = compute_nuance(text);
    signals.original_content = 1.0 - signals.repetitive_patterns;

    return signals;
}

double ContentSignalExtractor::compute_repetition(const std::vector<std::string>& sentences) {
    if (sentences.size() < 3) return 0.0;

    std::unordered_map<std::string, int> buckets;
    for (const auto& sentence : sentences) {
        auto normalized = util::to_lower(util::trim(sentence));
        if (normalized.size() > 10) {
            buckets[normalized]++;
        }
    }

    int repeated = 0;
    for (const auto& [_, count] : buckets) {
        if (count > 1) repeated += count;
    }

    return std::min(1.0, static_cast<double>(repeated) / sentences.size());
}

double ContentSignalExtractor::compute_template_likelihood(const std::string& text) {
    int matches = PatternLibrary::count_matches(text, PatternLibrary::template_patterns());
    return std::min(1.0, matches * 0.5);
}

double ContentSignalExtractor::compute_emotional_density(const std::string& text) {
    auto words = util::split_whitespace(util::to_lower(text));
    if (words.empty()) return 0.0;

    const auto& emotional = PatternLibrary::emotional_words();
    int hits = 0;
    for (const auto& word : words) {
        auto bare = strip_edge_punctuation(word);
        if (std::find(emotional.begin(), emotional.end(), bare) != emotional.end()) {
            hits++;
        }
    }
    return static_cast<double>(hits) / words.size();
}

double ContentSignalExtractor::compute_engagement_bait(const std::string& text) {
    int matches = PatternLibrary::count_matches(text, PatternLibrary::engagement_bait_patterns());
    return std::min(1.0, matches * 0.3);
}

double ContentSignalExtractor::compute_whataboutism(const std::string& text) {
    int matches = PatternLibrary::count_matches(text, PatternLibrary::whataboutism_patterns());
    auto segments = util::split_sentence_segments(text);
    return matches / std::max<double>(static_cast<double>(segments.size()), 1.0);
}

double ContentSignalExtractor::compute_personal_voice(const std::string& text) {
    double score = 0.0;
    std::string lower = util::to_lower(text);

    for (const auto& marker : PatternLibrary::personal_voice_markers()) {
        if (std::regex_search(lower, marker.pattern)) score += marker.score;
    }

    // Varied, mid-length sentences read as hand-written
    auto pieces = split_on_runs(text);
    size_t total_length = 0;
    for (const auto& piece : pieces) {
        total_length += util::trim(piece).size();
    }
    double avg_length = static_cast<double>(total_length) / pieces.size();
    if (avg_length > 80.0 && avg_length < 200.0) score += 0.15;

    return std::min(1.0, score);
}

double ContentSignalExtractor::compute_nuance(const std::string& text) {
    double score = 0.0;
    std::string lower = util::to_lower(text);

    for (const auto& marker : PatternLibrary::nuance_markers()) {
        if (std::regex_search(lower, marker.pattern)) score += marker.score;
    }

    int questions = PatternLibrary::count_matches(text, PatternLibrary::genuine_question_pattern());
    if (questions > 0 && !std::regex_search(lower, PatternLibrary::rhetorical_question_pattern())) {
        score += std::min(0.2, questions * 0.05);
    }

    return std::min(1.0, score);
}
