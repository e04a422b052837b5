#pragma once

#include "types.hpp"
#include <string>

struct TruthIndicator {
    std::string css_class;
    std::string icon;
    std::string label;
};

// "economic" / "social" / "authority" / "globalism"; any other name uses Low/High
std::string format_axis_label(const std::string& axis, int score);
std::string format_axis_label(Axis axis, int score);

// Hex colour, blue for negative scores through grey to red for positive
std::string score_color(int score);

TruthIndicator truth_indicator(int score);

std::string authenticity_label(int score);
std::string coordination_label(int score);

std::string intent_label(AuthorIntent intent);
std::string intent_description(AuthorIntent intent);

// Plain-text, multi-line rendition of a result for logs and API consumers
std::string format_result_summary(const ClassificationResult& result);
