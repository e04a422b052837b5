#include "author_scorer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {

AuthorSignal suspicious(const std::string& type, double value, double weight) {
    return AuthorSignal{type, value, weight, SignalDirection::Suspicious};
}

AuthorSignal authentic(const std::string& type, double value, double weight) {
    return AuthorSignal{type, value, weight, SignalDirection::Authentic};
}

} // namespace

AuthorScorer::AuthorScorer(const AuthorTuning& tuning) : tuning_(tuning) {}

AuthorClassification AuthorScorer::score_author(const ExtractedAuthor& author,
                                                const ContentSignals& signals,
                                                const KnownActorEntry* known_actor) const {
    const auto& t = tuning_;

    double authenticity = t.base_authenticity;
    double coordination = t.base_coordination;
    IntentBreakdown intent = t.prior;
    std::vector<AuthorSignal> collected;

    // Bot
    if (signals.repetitive_patterns > t.repetition_threshold) {
        authenticity += t.repetition_authenticity;
        intent.bot += t.repetition_bot;
        intent.organic += t.repetition_organic;
        collected.push_back(suspicious("repetitive_content", signals.repetitive_patterns, 0.25));
    }

    if (signals.template_likelihood > t.template_threshold) {
        authenticity += t.template_authenticity;
        intent.bot += t.template_bot;
        collected.push_back(suspicious("template_detected", signals.template_likelihood, 0.3));
    }

    // Troll
    if (signals.emotional_language_density > t.emotional_threshold) {
        intent.troll += t.emotional_troll;
        intent.organic += t.emotional_organic;
        collected.push_back(suspicious("emotional_language", signals.emotional_language_density, 0.2));
    }

    if (signals.personal_attacks > t.attacks_threshold) {
        intent.troll += t.attacks_troll;
        intent.organic += t.attacks_organic;
        collected.push_back(suspicious("personal_attacks", signals.personal_attacks, 0.25));
    }

    if (signals.engagement_baiting > t.bait_threshold) {
        intent.troll += t.bait_troll;
        collected.push_back(suspicious("engagement_bait", signals.engagement_baiting, 0.2));
    }

    if (signals.bad_faith_arguments > t.bad_faith_threshold) {
        intent.troll += t.bad_faith_troll;
        collected.push_back(suspicious("bad_faith_arguments", signals.bad_faith_arguments, 0.15));
    }

    // Commercial
    if (signals.promotional_language > t.promotional_threshold) {
        intent.commercial += t.promotional_commercial;
        intent.organic += t.promotional_organic;
        collected.push_back(suspicious("promotional_language", signals.promotional_language, 0.3));
    }

    if (signals.affiliate_link_count > t.affiliate_threshold) {
        intent.commercial += t.affiliate_commercial;
        collected.push_back(suspicious("affiliate_links", signals.affiliate_link_count, 0.25));
    }

    // Coordination
    if (signals.whataboutism_density > t.whataboutism_threshold) {
        intent.state_sponsored += t.whataboutism_state;
        intent.troll += t.whataboutism_troll;
        coordination += t.whataboutism_coordination;
        collected.push_back(suspicious("whataboutism", signals.whataboutism_density, 0.1));
    }

    // Authenticity
    if (signals.personal_voice > t.voice_threshold) {
        authenticity += t.voice_authenticity;
        intent.organic += t.voice_organic;
        collected.push_back(authentic("personal_voice", signals.personal_voice, 0.15));
    }

    if (signals.nuanced_arguments > t.nuance_threshold) {
        authenticity += t.nuance_authenticity;
        intent.organic += t.nuance_organic;
        collected.push_back(authentic("nuanced_arguments", signals.nuanced_arguments, 0.1));
    }

    if (signals.original_content > t.original_threshold) {
        authenticity += t.original_authenticity;
        collected.push_back(authentic("original_content", signals.original_content, 0.1));
    }

    if (known_actor) {
        double w = std::clamp(known_actor->confidence, 0.0, 1.0);

        if (known_actor->category == AuthorIntent::Bot) {
            authenticity = std::round(authenticity * (1.0 - w) + t.bot_authenticity_target * w);
        }
        if (known_actor->category == AuthorIntent::StateSponsored) {
            coordination = std::round(coordination * (1.0 - w) + t.state_coordination_target * w);
        }

        collected.push_back(AuthorSignal{"known_actor", to_string(known_actor->category),
                                         w, SignalDirection::Suspicious});
        spdlog::debug("Known actor {}:{} ({}, confidence {})", known_actor->platform,
                      known_actor->identifier, to_string(known_actor->category), w);
    }

    const auto& metadata = author.metadata;
    if (metadata.account_age_days && *metadata.account_age_days < t.new_account_days) {
        authenticity += t.new_account_authenticity;
        collected.push_back(suspicious("new_account", *metadata.account_age_days, 0.1));
    }

    if (metadata.verified.value_or(false)) {
        authenticity += t.verified_authenticity;
        intent.organic += t.verified_organic;
        collected.push_back(authentic("verified_account", 1.0, 0.15));
    }

    // The asserted category wins over every content and metadata nudge
    if (known_actor) {
        pin_known_intent(intent, *known_actor);
    }

    AuthorClassification result;
    result.authenticity = std::clamp(static_cast<int>(std::round(authenticity)), 0, 100);
    result.coordination = std::clamp(static_cast<int>(std::round(coordination)), 0, 100);
    result.intent = finalize_intent(intent);
    result.signals = std::move(collected);
    result.data_quality = determine_data_quality(signals, known_actor, metadata);
    result.author_id = author.identifier;
    result.platform = author.platform;
    if (known_actor) {
        result.known_actor = *known_actor;
    }

    return result;
}

AuthorClassification AuthorScorer::classify_author(const ExtractedAuthor& author,
                                                   const std::string& text,
                                                   const KnownActorEntry* known_actor) const {
    auto signals = ContentSignalExtractor::extract(text);
    return score_author(author, signals, known_actor);
}

AuthorClassification AuthorScorer::default_author_classification() {
    AuthorClassification result;
    result.authenticity = 50;
    result.coordination = 20;
    result.intent.primary = AuthorIntent::Organic;
    result.intent.confidence = 0.5;
    result.intent.breakdown = IntentBreakdown{0.5, 0.1, 0.1, 0.1, 0.1, 0.1};
    result.data_quality = DataQuality::Minimal;
    return result;
}

void AuthorScorer::pin_known_intent(IntentBreakdown& breakdown, const KnownActorEntry& actor) {
    double w = std::clamp(actor.confidence, 0.0, 1.0);

    double others = 0.0;
    for (auto intent : kAllIntents) {
        if (intent == actor.category) continue;
        breakdown.at(intent) = std::max(0.0, breakdown.at(intent));
        others += breakdown.at(intent);
    }

    // Remaining categories share (1 - w) in proportion to their current mass
    for (auto intent : kAllIntents) {
        if (intent == actor.category) continue;
        breakdown.at(intent) = others > 0.0 ? breakdown.at(intent) / others * (1.0 - w) : 0.0;
    }
    breakdown.at(actor.category) = w;
}

IntentAssessment AuthorScorer::finalize_intent(IntentBreakdown breakdown) const {
    for (auto intent : kAllIntents) {
        breakdown.at(intent) = std::max(0.0, breakdown.at(intent));
    }

    double total = breakdown.total();
    if (total <= 0.0) {
        spdlog::warn("Intent distribution collapsed to zero, using prior");
        breakdown = tuning_.prior;
        total = breakdown.total();
    }

    for (auto intent : kAllIntents) {
        breakdown.at(intent) /= total;
    }

    IntentAssessment assessment;
    assessment.primary = kAllIntents.front();
    assessment.confidence = breakdown.at(assessment.primary);
    for (auto intent : kAllIntents) {
        if (breakdown.at(intent) > assessment.confidence) {
            assessment.primary = intent;
            assessment.confidence = breakdown.at(intent);
        }
    }
    assessment.breakdown = breakdown;
    return assessment;
}

DataQuality AuthorScorer::determine_data_quality(const ContentSignals& signals,
                                                 const KnownActorEntry* known_actor,
                                                 const AuthorMetadata& metadata) const {
    if (known_actor && known_actor->confidence > tuning_.high_quality_actor_confidence) {
        return DataQuality::High;
    }

    double score = 0.0;
    if (metadata.account_age_days) score += 2;
    if (metadata.verified) score += 2;
    if (metadata.followers) score += 1;

    score += std::min(3.0, signals.nonzero_count() / 3.0);

    if (score >= 6) return DataQuality::High;
    if (score >= 4) return DataQuality::Medium;
    if (score >= 2) return DataQuality::Low;
    return DataQuality::Minimal;
}
