#pragma once

#include "types.hpp"
#include <string>

// Reputation blend, truthfulness and confidence constants
struct ClassifierTuning {
    double source_weight = 0.4;
    double keyword_weight = 0.6;

    int neutral_truth = 50;
    double caps_ratio_limit = 0.2;     // share of fully uppercase words
    int caps_penalty = 5;
    int clickbait_penalty = 10;
    int sensational_word_limit = 3;
    int sensational_penalty = 5;
    int citation_bonus = 5;
    int statistic_bonus = 3;
    int quote_bonus = 2;
    size_t min_quote_length = 20;

    double confidence_base = 0.1;
    double confidence_per_match = 0.02;
    double confidence_match_cap = 0.4;
    double confidence_source_bonus = 0.3;
    double confidence_length_norm = 5000.0;
    double confidence_length_weight = 0.2;
};

struct TruthSignals {
    bool excessive_caps = false;
    bool clickbait = false;
    bool emotional_language = false;
    bool citations = false;
    bool statistics = false;
    bool long_quote = false;
};

class ContentScorer {
public:
    explicit ContentScorer(const ClassifierTuning& tuning = ClassifierTuning());

    // Source prior blended with the keyword score; pass-through without a source
    int blend_axis(int keyword_score, const SourceEntry* source, Axis axis) const;

    // Raw (not normalized) text; source may be null
    int estimate_truth(const std::string& text, const SourceEntry* source) const;
    TruthSignals analyze_truth_signals(const std::string& text) const;

    double estimate_confidence(int total_matches, bool source_known, size_t text_length) const;

    const ClassifierTuning& tuning() const { return tuning_; }

private:
    ClassifierTuning tuning_;

    bool has_excessive_caps(const std::string& text) const;
    bool has_long_quote(const std::string& text) const;
};
