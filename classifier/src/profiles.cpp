#include "profiles.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

template <typename T>
void apply_override(T& target, const std::optional<T>& value) {
    if (value) target = *value;
}

std::string canonical_domain(const std::string& domain) {
    return util::strip_www(util::to_lower(util::trim(domain)));
}

} // namespace

UserPreferences merge_preferences(const UserPreferences& global, const SiteProfile* profile) {
    UserPreferences merged = global;
    if (!profile) return merged;

    const auto& o = profile->overrides;

    apply_override(merged.economic_range, o.economic_range);
    apply_override(merged.social_range, o.social_range);
    apply_override(merged.authority_range, o.authority_range);
    apply_override(merged.globalism_range, o.globalism_range);

    apply_override(merged.min_truth_score, o.min_truth_score);
    apply_override(merged.min_authenticity, o.min_authenticity);
    apply_override(merged.max_coordination, o.max_coordination);
    apply_override(merged.blocked_intents, o.blocked_intents);

    apply_override(merged.display_mode, o.display_mode);

    return merged;
}

bool domain_matches_pattern(const std::string& domain, const std::string& pattern) {
    std::string d = canonical_domain(domain);
    std::string p = canonical_domain(pattern);
    if (d.empty() || p.empty()) return false;

    if (d == p) return true;

    std::string suffix = "." + p;
    return d.size() > suffix.size() &&
           d.compare(d.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const SiteProfile* find_profile_for_domain(const std::vector<SiteProfile>& profiles,
                                           const std::string& domain) {
    const SiteProfile* best = nullptr;
    size_t best_length = 0;

    for (const auto& profile : profiles) {
        for (const auto& pattern : profile.domains) {
            if (!domain_matches_pattern(domain, pattern)) continue;

            size_t length = canonical_domain(pattern).size();
            if (!best || length > best_length) {
                best = &profile;
                best_length = length;
            }
        }
    }

    return best;
}

EffectivePreferences effective_preferences(const UserPreferences& global,
                                           const std::vector<SiteProfile>& profiles,
                                           const std::string& domain) {
    EffectivePreferences effective;
    effective.profile = find_profile_for_domain(profiles, domain);
    effective.prefs = merge_preferences(global, effective.profile);

    if (effective.profile) {
        spdlog::debug("Profile '{}' applies to {} ({} overrides)", effective.profile->name,
                      domain, effective.profile->overrides.count());
    }
    return effective;
}

bool is_whitelisted(const UserPreferences& prefs, const std::string& domain) {
    std::string host = util::to_lower(domain);
    std::string bare = util::strip_www(host);

    return std::any_of(prefs.whitelisted_domains.begin(), prefs.whitelisted_domains.end(),
        [&](const std::string& entry) {
            std::string listed = util::to_lower(entry);
            return listed == host || listed == bare || util::strip_www(listed) == bare;
        });
}
