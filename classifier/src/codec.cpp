#include "codec.hpp"
#include <stdexcept>

using nlohmann::json;

namespace {

template <typename E>
E parse_enum(const json& j, std::optional<E> (*parse)(const std::string&), const char* what) {
    auto name = j.get<std::string>();
    auto value = parse(name);
    if (!value) {
        throw std::invalid_argument(std::string("unknown ") + what + ": " + name);
    }
    return *value;
}

json range_to_json(const std::optional<ScoreRange>& range) {
    if (!range) return nullptr;
    return json::array({range->first, range->second});
}

std::optional<ScoreRange> range_from_json(const json& j) {
    if (j.is_null()) return std::nullopt;
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument("range must be [min, max] or null");
    }
    return ScoreRange{j.at(0).get<int>(), j.at(1).get<int>()};
}

std::vector<AuthorIntent> intents_from_json(const json& j) {
    std::vector<AuthorIntent> intents;
    for (const auto& item : j) {
        intents.push_back(parse_enum<AuthorIntent>(item, intent_from_string, "intent"));
    }
    return intents;
}

json intents_to_json(const std::vector<AuthorIntent>& intents) {
    json arr = json::array();
    for (auto intent : intents) arr.push_back(to_string(intent));
    return arr;
}

const char* kRangeKeys[] = {"economic_range", "social_range", "authority_range", "globalism_range"};

} // namespace

// ---- Author ----

void to_json(json& j, const IntentBreakdown& b) {
    j = json::object();
    for (auto intent : kAllIntents) {
        j[to_string(intent)] = b.at(intent);
    }
}

void from_json(const json& j, IntentBreakdown& b) {
    for (auto intent : kAllIntents) {
        b.at(intent) = j.value(to_string(intent), 0.0);
    }
}

void to_json(json& j, const AuthorSignal& signal) {
    j = {
        {"type", signal.type},
        {"weight", signal.weight},
        {"direction", to_string(signal.direction)}
    };
    if (const auto* label = std::get_if<std::string>(&signal.value)) {
        j["value"] = *label;
    } else {
        j["value"] = std::get<double>(signal.value);
    }
}

void from_json(const json& j, AuthorSignal& signal) {
    signal.type = j.at("type").get<std::string>();
    signal.weight = j.value("weight", 0.0);

    const auto& value = j.at("value");
    if (value.is_string()) {
        signal.value = value.get<std::string>();
    } else if (value.is_boolean()) {
        signal.value = value.get<bool>() ? 1.0 : 0.0;
    } else {
        signal.value = value.get<double>();
    }

    std::string direction = j.value("direction", "neutral");
    if (direction == "authentic") {
        signal.direction = SignalDirection::Authentic;
    } else if (direction == "suspicious") {
        signal.direction = SignalDirection::Suspicious;
    } else {
        signal.direction = SignalDirection::Neutral;
    }
}

void to_json(json& j, const KnownActorEntry& actor) {
    j = {
        {"identifier", actor.identifier},
        {"platform", actor.platform},
        {"category", to_string(actor.category)},
        {"confidence", actor.confidence},
        {"source", actor.source},
        {"added_date", actor.added_date}
    };
    if (actor.attribution) j["attribution"] = *actor.attribution;
}

void from_json(const json& j, KnownActorEntry& actor) {
    actor.identifier = j.at("identifier").get<std::string>();
    actor.platform = j.at("platform").get<std::string>();
    actor.category = parse_enum<AuthorIntent>(j.at("category"), intent_from_string, "intent");
    actor.confidence = j.at("confidence").get<double>();
    actor.source = j.value("source", "");
    actor.added_date = j.value("added_date", "");
    if (j.contains("attribution") && j["attribution"].is_string()) {
        actor.attribution = j["attribution"].get<std::string>();
    }
}

void to_json(json& j, const AuthorClassification& author) {
    j = {
        {"authenticity", author.authenticity},
        {"coordination", author.coordination},
        {"intent", {
            {"primary", to_string(author.intent.primary)},
            {"confidence", author.intent.confidence},
            {"breakdown", author.intent.breakdown}
        }},
        {"signals", author.signals},
        {"data_quality", to_string(author.data_quality)},
        {"author_id", author.author_id},
        {"platform", author.platform}
    };
    if (author.known_actor) j["known_actor"] = *author.known_actor;
}

void from_json(const json& j, AuthorClassification& author) {
    author.authenticity = j.at("authenticity").get<int>();
    author.coordination = j.at("coordination").get<int>();

    const auto& intent = j.at("intent");
    author.intent.primary = parse_enum<AuthorIntent>(intent.at("primary"), intent_from_string, "intent");
    author.intent.confidence = intent.at("confidence").get<double>();
    author.intent.breakdown = intent.at("breakdown").get<IntentBreakdown>();

    author.signals = j.value("signals", std::vector<AuthorSignal>());
    author.data_quality = parse_enum<DataQuality>(j.at("data_quality"), data_quality_from_string,
                                                  "data quality");
    author.author_id = j.value("author_id", "");
    author.platform = j.value("platform", "");
    if (j.contains("known_actor") && j["known_actor"].is_object()) {
        author.known_actor = j["known_actor"].get<KnownActorEntry>();
    }
}

// ---- Result ----

void to_json(json& j, const ClassificationResult& result) {
    j = {
        {"economic", result.economic},
        {"social", result.social},
        {"authority", result.authority},
        {"globalism", result.globalism},
        {"truth_score", result.truth_score},
        {"confidence", result.confidence},
        {"source", to_string(result.source)},
        {"timestamp", result.timestamp_ms}
    };
    if (result.author) j["author"] = *result.author;
}

void from_json(const json& j, ClassificationResult& result) {
    result.economic = j.at("economic").get<int>();
    result.social = j.at("social").get<int>();
    result.authority = j.at("authority").get<int>();
    result.globalism = j.at("globalism").get<int>();
    result.truth_score = j.at("truth_score").get<int>();
    result.confidence = j.at("confidence").get<double>();
    result.source = j.value("source", "local") == "enhanced" ? ResultSource::Enhanced
                                                            : ResultSource::Local;
    result.timestamp_ms = j.value("timestamp", int64_t{0});
    if (j.contains("author") && j["author"].is_object()) {
        result.author = j["author"].get<AuthorClassification>();
    }
}

void to_json(json& j, const ExtractedAuthor& author) {
    j = {
        {"identifier", author.identifier},
        {"platform", author.platform},
        {"display_name", author.display_name},
        {"profile_url", author.profile_url}
    };

    json metadata = json::object();
    if (author.metadata.account_age_days) metadata["account_age"] = *author.metadata.account_age_days;
    if (author.metadata.verified) metadata["verified"] = *author.metadata.verified;
    if (author.metadata.followers) metadata["followers"] = *author.metadata.followers;
    j["metadata"] = metadata;
}

void from_json(const json& j, ExtractedAuthor& author) {
    author.identifier = j.at("identifier").get<std::string>();
    author.platform = j.value("platform", "unknown");
    author.display_name = j.value("display_name", author.identifier);
    author.profile_url = j.value("profile_url", "");

    if (j.contains("metadata") && j["metadata"].is_object()) {
        const auto& metadata = j["metadata"];
        if (metadata.contains("account_age") && metadata["account_age"].is_number()) {
            author.metadata.account_age_days = metadata["account_age"].get<int>();
        }
        if (metadata.contains("verified") && metadata["verified"].is_boolean()) {
            author.metadata.verified = metadata["verified"].get<bool>();
        }
        if (metadata.contains("followers") && metadata["followers"].is_number()) {
            author.metadata.followers = metadata["followers"].get<int64_t>();
        }
    }
}

// ---- Preferences ----

void to_json(json& j, const UserPreferences& prefs) {
    j = {
        {"economic_range", range_to_json(prefs.economic_range)},
        {"social_range", range_to_json(prefs.social_range)},
        {"authority_range", range_to_json(prefs.authority_range)},
        {"globalism_range", range_to_json(prefs.globalism_range)},
        {"min_truth_score", prefs.min_truth_score},
        {"min_authenticity", prefs.min_authenticity},
        {"max_coordination", prefs.max_coordination},
        {"blocked_intents", intents_to_json(prefs.blocked_intents)},
        {"display_mode", to_string(prefs.display_mode)},
        {"enabled", prefs.enabled},
        {"whitelisted_domains", prefs.whitelisted_domains}
    };
}

void from_json(const json& j, UserPreferences& prefs) {
    std::optional<ScoreRange>* ranges[] = {
        &prefs.economic_range, &prefs.social_range, &prefs.authority_range, &prefs.globalism_range
    };
    for (size_t i = 0; i < 4; i++) {
        if (j.contains(kRangeKeys[i])) *ranges[i] = range_from_json(j[kRangeKeys[i]]);
    }

    prefs.min_truth_score = j.value("min_truth_score", prefs.min_truth_score);
    prefs.min_authenticity = j.value("min_authenticity", prefs.min_authenticity);
    prefs.max_coordination = j.value("max_coordination", prefs.max_coordination);
    if (j.contains("blocked_intents")) {
        prefs.blocked_intents = intents_from_json(j["blocked_intents"]);
    }
    if (j.contains("display_mode")) {
        prefs.display_mode = parse_enum<DisplayMode>(j["display_mode"], display_mode_from_string,
                                                     "display mode");
    }
    prefs.enabled = j.value("enabled", prefs.enabled);
    if (j.contains("whitelisted_domains")) {
        prefs.whitelisted_domains = j["whitelisted_domains"].get<std::vector<std::string>>();
    }
}

// Only present keys are emitted; a range override of "no range" is null
void to_json(json& j, const PreferenceOverrides& o) {
    j = json::object();

    const std::optional<std::optional<ScoreRange>>* ranges[] = {
        &o.economic_range, &o.social_range, &o.authority_range, &o.globalism_range
    };
    for (size_t i = 0; i < 4; i++) {
        if (*ranges[i]) j[kRangeKeys[i]] = range_to_json(**ranges[i]);
    }

    if (o.min_truth_score) j["min_truth_score"] = *o.min_truth_score;
    if (o.min_authenticity) j["min_authenticity"] = *o.min_authenticity;
    if (o.max_coordination) j["max_coordination"] = *o.max_coordination;
    if (o.blocked_intents) j["blocked_intents"] = intents_to_json(*o.blocked_intents);
    if (o.display_mode) j["display_mode"] = to_string(*o.display_mode);
}

void from_json(const json& j, PreferenceOverrides& o) {
    std::optional<std::optional<ScoreRange>>* ranges[] = {
        &o.economic_range, &o.social_range, &o.authority_range, &o.globalism_range
    };
    for (size_t i = 0; i < 4; i++) {
        if (j.contains(kRangeKeys[i])) *ranges[i] = range_from_json(j[kRangeKeys[i]]);
    }

    auto int_field = [&j](const char* key) -> std::optional<int> {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        return j[key].get<int>();
    };
    o.min_truth_score = int_field("min_truth_score");
    o.min_authenticity = int_field("min_authenticity");
    o.max_coordination = int_field("max_coordination");

    if (j.contains("blocked_intents") && !j["blocked_intents"].is_null()) {
        o.blocked_intents = intents_from_json(j["blocked_intents"]);
    }
    if (j.contains("display_mode") && !j["display_mode"].is_null()) {
        o.display_mode = parse_enum<DisplayMode>(j["display_mode"], display_mode_from_string,
                                                 "display mode");
    }
}

void to_json(json& j, const SiteProfile& profile) {
    j = {
        {"id", profile.id},
        {"name", profile.name},
        {"domains", profile.domains},
        {"overrides", profile.overrides}
    };
    if (profile.description) j["description"] = *profile.description;
}

void from_json(const json& j, SiteProfile& profile) {
    profile.id = j.at("id").get<std::string>();
    profile.name = j.value("name", profile.id);
    if (j.contains("description") && j["description"].is_string()) {
        profile.description = j["description"].get<std::string>();
    }
    profile.domains = j.value("domains", std::vector<std::string>());
    if (j.contains("overrides")) {
        profile.overrides = j["overrides"].get<PreferenceOverrides>();
    }
}

void to_json(json& j, const FilterAction& action) {
    j = {
        {"action", to_string(action.action)},
        {"result", action.result}
    };
    if (action.reason) j["reason"] = to_string(*action.reason);
}
