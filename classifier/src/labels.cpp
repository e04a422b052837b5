#include "labels.hpp"
#include <fmt/format.h>
#include <utility>

std::string format_axis_label(const std::string& axis, int score) {
    std::pair<std::string, std::string> names{"Low", "High"};

    if (axis == "economic") {
        names = {"Left", "Right"};
    } else if (axis == "social") {
        names = {"Progressive", "Conservative"};
    } else if (axis == "authority") {
        names = {"Libertarian", "Authoritarian"};
    } else if (axis == "globalism") {
        names = {"Nationalist", "Globalist"};
    }

    if (score < -33) return names.first;
    if (score > 33) return names.second;
    return "Center";
}

std::string format_axis_label(Axis axis, int score) {
    return format_axis_label(to_string(axis), score);
}

std::string score_color(int score) {
    if (score < -50) return "#2563eb";
    if (score < -20) return "#60a5fa";
    if (score < 20) return "#9ca3af";
    if (score < 50) return "#f87171";
    return "#dc2626";
}

TruthIndicator truth_indicator(int score) {
    if (score >= 80) return {"truth-high", "\xE2\x9C\x93", "Highly credible"};
    if (score >= 60) return {"truth-medium-high", "\xE2\x97\x8B", "Generally reliable"};
    if (score >= 40) return {"truth-medium", "?", "Mixed/unverified"};
    return {"truth-low", "!", "Low credibility"};
}

std::string authenticity_label(int score) {
    if (score < 30) return "Bot-like";
    if (score < 50) return "Suspicious";
    if (score < 70) return "Unclear";
    return "Human";
}

std::string coordination_label(int score) {
    if (score < 20) return "Organic";
    if (score < 40) return "Independent";
    if (score < 60) return "Aligned";
    if (score < 80) return "Coordinated";
    return "Orchestrated";
}

std::string intent_label(AuthorIntent intent) {
    switch (intent) {
        case AuthorIntent::Organic:        return "Organic";
        case AuthorIntent::Troll:          return "Troll";
        case AuthorIntent::Bot:            return "Bot";
        case AuthorIntent::StateSponsored: return "State-Sponsored";
        case AuthorIntent::Commercial:     return "Commercial";
        case AuthorIntent::Activist:       return "Activist";
    }
    return "Unknown";
}

std::string intent_description(AuthorIntent intent) {
    switch (intent) {
        case AuthorIntent::Organic:        return "Genuine personal or organizational expression";
        case AuthorIntent::Troll:          return "Provocative, disruptive intent";
        case AuthorIntent::Bot:            return "Automated spam or amplification";
        case AuthorIntent::StateSponsored: return "Government-affiliated disinformation";
        case AuthorIntent::Commercial:     return "Marketing or promotional content";
        case AuthorIntent::Activist:       return "Organized advocacy campaigns";
    }
    return "";
}

std::string format_result_summary(const ClassificationResult& result) {
    std::string text;

    for (auto axis : kAllAxes) {
        std::string name = to_string(axis);
        name[0] = static_cast<char>(name[0] - 'a' + 'A');
        text += fmt::format("{}: {} ({:+d})\n", name,
                            format_axis_label(axis, result.axis(axis)), result.axis(axis));
    }

    auto truth = truth_indicator(result.truth_score);
    text += fmt::format("Truth: {} {} ({})\n", truth.icon, truth.label, result.truth_score);
    text += fmt::format("Confidence: {:.0f}%\n", result.confidence * 100.0);

    if (result.author) {
        const auto& author = *result.author;
        text += fmt::format("Author: {} ({:.0f}%), authenticity {} ({}), coordination {} ({})\n",
                            intent_label(author.intent.primary),
                            author.intent.confidence * 100.0,
                            authenticity_label(author.authenticity), author.authenticity,
                            coordination_label(author.coordination), author.coordination);
    }

    return text;
}
