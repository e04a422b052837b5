#pragma once

#include "types.hpp"
#include <vector>

struct AxisTuning {
    int max_occurrences = 3;     // diminishing returns cap per keyword
    double weight_scale = 10.0;  // maximum keyword weight
};

class AxisScorer {
public:
    explicit AxisScorer(const AxisTuning& tuning = AxisTuning());

    // text must already be normalized with util::normalize_text
    AxisScore score_axis(const std::string& text,
                         const std::vector<KeywordEntry>& keywords,
                         Axis axis) const;

private:
    AxisTuning tuning_;

    static bool has_context(const std::string& text, const KeywordEntry& keyword);
};
