#pragma once

#include "signals.hpp"
#include "types.hpp"
#include <string>

// Hand-tuned thresholds and deltas for the author scorer
struct AuthorTuning {
    int base_authenticity = 60;
    int base_coordination = 15;
    IntentBreakdown prior{0.6, 0.1, 0.1, 0.05, 0.1, 0.05};

    // Bot
    double repetition_threshold = 0.3;
    int repetition_authenticity = -25;
    double repetition_bot = 0.25;
    double repetition_organic = -0.2;

    double template_threshold = 0.5;
    int template_authenticity = -30;
    double template_bot = 0.3;

    // Troll
    double emotional_threshold = 0.15;
    double emotional_troll = 0.2;
    double emotional_organic = -0.1;

    double attacks_threshold = 2.0;
    double attacks_troll = 0.25;
    double attacks_organic = -0.15;

    double bait_threshold = 0.5;
    double bait_troll = 0.2;

    double bad_faith_threshold = 1.0;
    double bad_faith_troll = 0.15;

    // Commercial
    double promotional_threshold = 0.2;
    double promotional_commercial = 0.3;
    double promotional_organic = -0.15;

    double affiliate_threshold = 2.0;
    double affiliate_commercial = 0.25;

    // Coordination
    double whataboutism_threshold = 0.1;
    double whataboutism_state = 0.1;
    double whataboutism_troll = 0.1;
    int whataboutism_coordination = 10;

    // Authenticity
    double voice_threshold = 0.7;
    int voice_authenticity = 15;
    double voice_organic = 0.15;

    double nuance_threshold = 0.5;
    int nuance_authenticity = 10;
    double nuance_organic = 0.1;

    double original_threshold = 0.8;
    int original_authenticity = 10;

    // Known actors
    int bot_authenticity_target = 10;
    int state_coordination_target = 85;
    double high_quality_actor_confidence = 0.8;

    // Metadata
    int new_account_days = 30;
    int new_account_authenticity = -10;
    int verified_authenticity = 15;
    double verified_organic = 0.1;
};

class AuthorScorer {
public:
    explicit AuthorScorer(const AuthorTuning& tuning = AuthorTuning());

    // known_actor may be null
    AuthorClassification score_author(const ExtractedAuthor& author,
                                      const ContentSignals& signals,
                                      const KnownActorEntry* known_actor) const;

    // Signal extraction followed by score_author
    AuthorClassification classify_author(const ExtractedAuthor& author,
                                         const std::string& text,
                                         const KnownActorEntry* known_actor) const;

    // Neutral record used when no author could be identified
    static AuthorClassification default_author_classification();

    const AuthorTuning& tuning() const { return tuning_; }

private:
    AuthorTuning tuning_;

    static void pin_known_intent(IntentBreakdown& breakdown, const KnownActorEntry& actor);
    IntentAssessment finalize_intent(IntentBreakdown breakdown) const;
    DataQuality determine_data_quality(const ContentSignals& signals,
                                       const KnownActorEntry* known_actor,
                                       const AuthorMetadata& metadata) const;
};
