#include "axis_scorer.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

AxisScorer::AxisScorer(const AxisTuning& tuning) : tuning_(tuning) {}

bool AxisScorer::has_context(const std::string& text, const KeywordEntry& keyword) {
    if (keyword.context.empty()) return true;

    return std::any_of(keyword.context.begin(), keyword.context.end(),
        [&text](const std::string& ctx) {
            return text.find(util::normalize_text(ctx)) != std::string::npos;
        });
}

AxisScore AxisScorer::score_axis(const std::string& text,
                                 const std::vector<KeywordEntry>& keywords,
                                 Axis axis) const {
    AxisScore result;

    double sum = 0.0;
    double occurrences = 0.0;

    for (const auto& keyword : keywords) {
        if (keyword.axis != axis) continue;
        if (!has_context(text, keyword)) continue;

        int count = util::count_word_occurrences(text, util::normalize_text(keyword.term));
        if (count == 0) continue;

        int effective = std::min(count, tuning_.max_occurrences);
        sum += keyword.direction * keyword.weight * effective;
        occurrences += effective;
        result.matches++;
    }

    // Full-weight matches in one direction map to +/-100
    double max_possible = std::max(occurrences, 1.0) * tuning_.weight_scale;
    int normalized = static_cast<int>(std::round(sum / max_possible * 100.0));

    result.score = std::clamp(normalized, -100, 100);
    return result;
}
