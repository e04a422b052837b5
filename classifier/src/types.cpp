#include "types.hpp"
#include <algorithm>

int BiasRating::get(Axis axis) const {
    switch (axis) {
        case Axis::Economic: return economic;
        case Axis::Social: return social;
        case Axis::Authority: return authority;
        case Axis::Globalism: return globalism;
    }
    return 0;
}

int ClassificationResult::axis(Axis axis) const {
    switch (axis) {
        case Axis::Economic: return economic;
        case Axis::Social: return social;
        case Axis::Authority: return authority;
        case Axis::Globalism: return globalism;
    }
    return 0;
}

double& IntentBreakdown::at(AuthorIntent intent) {
    switch (intent) {
        case AuthorIntent::Organic: return organic;
        case AuthorIntent::Troll: return troll;
        case AuthorIntent::Bot: return bot;
        case AuthorIntent::StateSponsored: return state_sponsored;
        case AuthorIntent::Commercial: return commercial;
        case AuthorIntent::Activist: return activist;
    }
    return organic;
}

double IntentBreakdown::at(AuthorIntent intent) const {
    return const_cast<IntentBreakdown*>(this)->at(intent);
}

double IntentBreakdown::total() const {
    return organic + troll + bot + state_sponsored + commercial + activist;
}

bool AuthorClassification::has_signal(const std::string& type) const {
    return std::any_of(signals.begin(), signals.end(),
                       [&type](const AuthorSignal& s) { return s.type == type; });
}

int PreferenceOverrides::count() const {
    int n = 0;
    if (economic_range) n++;
    if (social_range) n++;
    if (authority_range) n++;
    if (globalism_range) n++;
    if (min_truth_score) n++;
    if (min_authenticity) n++;
    if (max_coordination) n++;
    if (blocked_intents) n++;
    if (display_mode) n++;
    return n;
}

std::string to_string(Axis axis) {
    switch (axis) {
        case Axis::Economic: return "economic";
        case Axis::Social: return "social";
        case Axis::Authority: return "authority";
        case Axis::Globalism: return "globalism";
    }
    return "economic";
}

std::optional<Axis> axis_from_string(const std::string& name) {
    if (name == "economic") return Axis::Economic;
    if (name == "social") return Axis::Social;
    if (name == "authority") return Axis::Authority;
    if (name == "globalism") return Axis::Globalism;
    return std::nullopt;
}

std::string to_string(AuthorIntent intent) {
    switch (intent) {
        case AuthorIntent::Organic: return "organic";
        case AuthorIntent::Troll: return "troll";
        case AuthorIntent::Bot: return "bot";
        case AuthorIntent::StateSponsored: return "stateSponsored";
        case AuthorIntent::Commercial: return "commercial";
        case AuthorIntent::Activist: return "activist";
    }
    return "organic";
}

std::optional<AuthorIntent> intent_from_string(const std::string& name) {
    for (auto intent : kAllIntents) {
        if (to_string(intent) == name) return intent;
    }
    return std::nullopt;
}

std::string to_string(SignalDirection direction) {
    switch (direction) {
        case SignalDirection::Authentic: return "authentic";
        case SignalDirection::Suspicious: return "suspicious";
        case SignalDirection::Neutral: return "neutral";
    }
    return "neutral";
}

std::string to_string(DataQuality quality) {
    switch (quality) {
        case DataQuality::High: return "high";
        case DataQuality::Medium: return "medium";
        case DataQuality::Low: return "low";
        case DataQuality::Minimal: return "minimal";
    }
    return "minimal";
}

std::optional<DataQuality> data_quality_from_string(const std::string& name) {
    if (name == "high") return DataQuality::High;
    if (name == "medium") return DataQuality::Medium;
    if (name == "low") return DataQuality::Low;
    if (name == "minimal") return DataQuality::Minimal;
    return std::nullopt;
}

std::string to_string(ResultSource source) {
    return source == ResultSource::Enhanced ? "enhanced" : "local";
}

std::string to_string(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::Block: return "block";
        case DisplayMode::Overlay: return "overlay";
        case DisplayMode::Badge: return "badge";
        case DisplayMode::Off: return "off";
        case DisplayMode::Disabled: return "disabled";
    }
    return "off";
}

std::optional<DisplayMode> display_mode_from_string(const std::string& name) {
    if (name == "block") return DisplayMode::Block;
    if (name == "overlay") return DisplayMode::Overlay;
    if (name == "badge") return DisplayMode::Badge;
    if (name == "off") return DisplayMode::Off;
    if (name == "disabled") return DisplayMode::Disabled;
    return std::nullopt;
}

std::string to_string(FilterVerdict verdict) {
    switch (verdict) {
        case FilterVerdict::None: return "none";
        case FilterVerdict::Badge: return "badge";
        case FilterVerdict::Overlay: return "overlay";
        case FilterVerdict::Block: return "block";
    }
    return "none";
}

std::optional<FilterVerdict> verdict_from_string(const std::string& name) {
    if (name == "none") return FilterVerdict::None;
    if (name == "badge") return FilterVerdict::Badge;
    if (name == "overlay") return FilterVerdict::Overlay;
    if (name == "block") return FilterVerdict::Block;
    return std::nullopt;
}

std::string to_string(FilterReason reason) {
    switch (reason) {
        case FilterReason::Economic: return "economic";
        case FilterReason::Social: return "social";
        case FilterReason::Authority: return "authority";
        case FilterReason::Globalism: return "globalism";
        case FilterReason::Truthfulness: return "truthfulness";
        case FilterReason::Authenticity: return "authenticity";
        case FilterReason::Coordination: return "coordination";
        case FilterReason::Intent: return "authorIntent";
    }
    return "economic";
}

std::optional<FilterReason> filter_reason_from_string(const std::string& name) {
    static const FilterReason all[] = {
        FilterReason::Economic, FilterReason::Social, FilterReason::Authority,
        FilterReason::Globalism, FilterReason::Truthfulness, FilterReason::Authenticity,
        FilterReason::Coordination, FilterReason::Intent
    };
    for (auto reason : all) {
        if (to_string(reason) == name) return reason;
    }
    return std::nullopt;
}
