#pragma once

#include "types.hpp"
#include <string>
#include <vector>

struct EffectivePreferences {
    UserPreferences prefs;
    const SiteProfile* profile = nullptr;  // points into the profile list passed in
};

// Global preferences with every explicitly present override applied
UserPreferences merge_preferences(const UserPreferences& global, const SiteProfile* profile);

// Case-insensitive; "www." ignored on both sides; exact or subdomain match
bool domain_matches_pattern(const std::string& domain, const std::string& pattern);

// Most specific (longest) matching pattern wins; null when nothing matches
const SiteProfile* find_profile_for_domain(const std::vector<SiteProfile>& profiles,
                                           const std::string& domain);

EffectivePreferences effective_preferences(const UserPreferences& global,
                                           const std::vector<SiteProfile>& profiles,
                                           const std::string& domain);

bool is_whitelisted(const UserPreferences& prefs, const std::string& domain);
