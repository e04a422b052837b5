#include "filter.hpp"
#include <algorithm>

namespace {

FilterVerdict verdict_for(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::Block:   return FilterVerdict::Block;
        case DisplayMode::Overlay: return FilterVerdict::Overlay;
        case DisplayMode::Badge:   return FilterVerdict::Badge;
        case DisplayMode::Off:
        case DisplayMode::Disabled:
            break;
    }
    return FilterVerdict::None;
}

bool outside(const std::optional<ScoreRange>& range, int value) {
    if (!range) return false;
    return value < range->first || value > range->second;
}

std::optional<FilterReason> first_failure(const ClassificationResult& result,
                                          const UserPreferences& prefs) {
    // Content checks
    if (outside(prefs.economic_range, result.economic)) return FilterReason::Economic;
    if (outside(prefs.social_range, result.social)) return FilterReason::Social;
    if (outside(prefs.authority_range, result.authority)) return FilterReason::Authority;
    if (outside(prefs.globalism_range, result.globalism)) return FilterReason::Globalism;
    if (result.truth_score < prefs.min_truth_score) return FilterReason::Truthfulness;

    // Author checks
    if (!result.author) return std::nullopt;
    const auto& author = *result.author;

    if (author.authenticity < prefs.min_authenticity) return FilterReason::Authenticity;
    if (author.coordination > prefs.max_coordination) return FilterReason::Coordination;

    const auto& blocked = prefs.blocked_intents;
    if (std::find(blocked.begin(), blocked.end(), author.intent.primary) != blocked.end()) {
        return FilterReason::Intent;
    }

    return std::nullopt;
}

} // namespace

FilterAction decide_filter_action(const ClassificationResult& result, const UserPreferences& prefs) {
    FilterAction action;
    action.result = result;

    if (prefs.display_mode == DisplayMode::Off || prefs.display_mode == DisplayMode::Disabled) {
        return action;
    }

    if (auto reason = first_failure(result, prefs)) {
        action.action = verdict_for(prefs.display_mode);
        action.reason = reason;
        return action;
    }

    if (prefs.display_mode == DisplayMode::Badge) {
        action.action = FilterVerdict::Badge;
    }
    return action;
}

std::string format_filter_reason(FilterReason reason) {
    switch (reason) {
        case FilterReason::Economic:     return "Economic bias outside your range";
        case FilterReason::Social:       return "Social bias outside your range";
        case FilterReason::Authority:    return "Authority bias outside your range";
        case FilterReason::Globalism:    return "Globalism bias outside your range";
        case FilterReason::Truthfulness: return "Below truthfulness threshold";
        case FilterReason::Authenticity: return "Author authenticity below minimum";
        case FilterReason::Coordination: return "Author coordination above maximum";
        case FilterReason::Intent:       return "Author intent type is blocked";
    }
    return "Content filtered";
}
