#pragma once

#include "types.hpp"
#include <string>

// Ordered checks; the first failing criterion decides the verdict
FilterAction decide_filter_action(const ClassificationResult& result, const UserPreferences& prefs);

// User-facing sentence for a filter reason
std::string format_filter_reason(FilterReason reason);
