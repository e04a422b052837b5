#pragma once

#include <string>
#include <vector>

// Author behaviour heuristics derived from one text
struct ContentSignals {
    // Bot
    double repetitive_patterns = 0.0;        // 0-1
    double template_likelihood = 0.0;        // 0-1

    // Troll
    double emotional_language_density = 0.0; // 0-1
    double personal_attacks = 0.0;           // count
    double bad_faith_arguments = 0.0;        // count
    double engagement_baiting = 0.0;         // 0-1

    // Commercial
    double promotional_language = 0.0;       // matches per sentence
    double affiliate_link_count = 0.0;       // count

    // Coordination
    double whataboutism_density = 0.0;       // matches per segment

    // Authenticity
    double personal_voice = 0.0;             // 0-1
    double nuanced_arguments = 0.0;          // 0-1
    double original_content = 1.0;           // 1 - repetition

    // Number of signals with a value above zero
    int nonzero_count() const;
};

class ContentSignalExtractor {
public:
    static ContentSignals extract(const std::string& text);

private:
    // Share of sentences whose normalized text occurs more than once
    static double compute_repetition(const std::vector<std::string>& sentences);

    // Placeholder markers, 0.5 per match
    static double compute_template_likelihood(const std::string& text);

    static double compute_emotional_density(const std::string& text);

    static double compute_engagement_bait(const std::string& text);

    static double compute_whataboutism(const std::string& text);

    // First-person reflection, hedging, admitted uncertainty, storytelling
    static double compute_personal_voice(const std::string& text);

    // Balancing connectives, conditionals, citations, genuine questions
    static double compute_nuance(const std::string& text);
};
