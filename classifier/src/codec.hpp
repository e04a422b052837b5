#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

// JSON wire format for the service API and cache payloads. Field names are
// snake_case; enums travel as their to_string() names. Decoding of
// preferences, overrides and authors is lenient about missing fields and
// throws nlohmann::json::exception or std::invalid_argument on wrong types
// or unknown enum names.

void to_json(nlohmann::json& j, const IntentBreakdown& breakdown);
void from_json(const nlohmann::json& j, IntentBreakdown& breakdown);

void to_json(nlohmann::json& j, const AuthorSignal& signal);
void from_json(const nlohmann::json& j, AuthorSignal& signal);

void to_json(nlohmann::json& j, const KnownActorEntry& actor);
void from_json(const nlohmann::json& j, KnownActorEntry& actor);

void to_json(nlohmann::json& j, const AuthorClassification& author);
void from_json(const nlohmann::json& j, AuthorClassification& author);

void to_json(nlohmann::json& j, const ClassificationResult& result);
void from_json(const nlohmann::json& j, ClassificationResult& result);

void to_json(nlohmann::json& j, const ExtractedAuthor& author);
void from_json(const nlohmann::json& j, ExtractedAuthor& author);

void to_json(nlohmann::json& j, const UserPreferences& prefs);
void from_json(const nlohmann::json& j, UserPreferences& prefs);

void to_json(nlohmann::json& j, const PreferenceOverrides& overrides);
void from_json(const nlohmann::json& j, PreferenceOverrides& overrides);

void to_json(nlohmann::json& j, const SiteProfile& profile);
void from_json(const nlohmann::json& j, SiteProfile& profile);

void to_json(nlohmann::json& j, const FilterAction& action);
