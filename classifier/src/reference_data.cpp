#include "reference_data.hpp"
#include "codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <fstream>

using nlohmann::json;

namespace {

std::string actor_key(const std::string& platform, const std::string& identifier) {
    return util::to_lower(platform) + ":" + util::to_lower(identifier);
}

bool in_range(const json& value, double lo, double hi) {
    if (!value.is_number()) return false;
    double v = value.get<double>();
    return v >= lo && v <= hi;
}

const json& entries_of(const json& doc, const char* key) {
    static const json empty = json::array();
    if (doc.is_object() && doc.contains(key) && doc[key].is_array()) return doc[key];
    if (doc.is_array()) return doc;
    if (!doc.is_null()) {
        spdlog::warn("Reference document has no '{}' array", key);
    }
    return empty;
}

} // namespace

// ---- ReferenceTables ----

const SourceEntry* ReferenceTables::find_source(const std::string& host) const {
    std::string lower = util::to_lower(host);

    auto it = sources.find(lower);
    if (it != sources.end()) return &it->second;

    it = sources.find(util::strip_www(lower));
    return it != sources.end() ? &it->second : nullptr;
}

const SourceEntry* ReferenceTables::find_source_for_url(const std::string& url) const {
    std::string host = util::extract_host(url);
    if (host.empty()) return nullptr;
    return find_source(host);
}

const KnownActorEntry* ReferenceTables::find_known_actor(const std::string& platform,
                                                         const std::string& identifier) const {
    auto it = actors.find(actor_key(platform, identifier));
    if (it != actors.end()) return &it->second;

    it = actors.find(actor_key("all", identifier));
    return it != actors.end() ? &it->second : nullptr;
}

void ReferenceTables::add_source(const SourceEntry& source) {
    sources[util::to_lower(source.domain)] = source;
}

void ReferenceTables::add_actor(const KnownActorEntry& actor) {
    actors[actor_key(actor.platform, actor.identifier)] = actor;
}

// ---- Parsing ----

std::optional<KeywordEntry> ReferenceDataParser::parse_keyword(const json& entry) {
    if (!entry.is_object()) return std::nullopt;

    const auto term = entry.value("term", json());
    const auto axis_name = entry.value("axis", json());
    const auto direction = entry.value("direction", json());
    const auto weight = entry.value("weight", json());

    if (!term.is_string() || term.get<std::string>().empty()) return std::nullopt;
    if (!axis_name.is_string()) return std::nullopt;

    auto axis = axis_from_string(axis_name.get<std::string>());
    if (!axis) return std::nullopt;

    if (!direction.is_number_integer()) return std::nullopt;
    int dir = direction.get<int>();
    if (dir != -1 && dir != 1) return std::nullopt;

    if (!in_range(weight, 1.0, 10.0)) return std::nullopt;

    KeywordEntry keyword{term.get<std::string>(), *axis, dir, weight.get<double>(), {}};

    if (entry.contains("context")) {
        const auto& context = entry["context"];
        if (!context.is_array()) return std::nullopt;
        for (const auto& item : context) {
            if (!item.is_string()) return std::nullopt;
            keyword.context.push_back(item.get<std::string>());
        }
    }

    return keyword;
}

std::optional<SourceEntry> ReferenceDataParser::parse_source(const json& entry) {
    if (!entry.is_object()) return std::nullopt;

    const auto domain = entry.value("domain", json());
    const auto rating = entry.value("factual_rating", json());
    const auto bias = entry.value("bias_rating", json());

    if (!domain.is_string() || domain.get<std::string>().empty()) return std::nullopt;
    if (!in_range(rating, 0.0, 100.0)) return std::nullopt;
    if (!bias.is_object()) return std::nullopt;

    SourceEntry source;
    source.domain = domain.get<std::string>();
    source.name = entry.value("name", source.domain);
    source.factual_rating = static_cast<int>(std::lround(rating.get<double>()));
    source.category = entry.value("category", "unknown");
    if (entry.contains("country") && entry["country"].is_string()) {
        source.country = entry["country"].get<std::string>();
    }

    for (auto axis : kAllAxes) {
        const auto value = bias.value(to_string(axis), json());
        if (!in_range(value, -100.0, 100.0)) return std::nullopt;

        int score = static_cast<int>(std::lround(value.get<double>()));
        switch (axis) {
            case Axis::Economic:  source.bias.economic = score; break;
            case Axis::Social:    source.bias.social = score; break;
            case Axis::Authority: source.bias.authority = score; break;
            case Axis::Globalism: source.bias.globalism = score; break;
        }
    }

    return source;
}

std::optional<KnownActorEntry> ReferenceDataParser::parse_known_actor(const json& entry) {
    if (!entry.is_object()) return std::nullopt;

    try {
        auto actor = entry.get<KnownActorEntry>();
        if (actor.identifier.empty() || actor.platform.empty()) return std::nullopt;
        if (actor.confidence < 0.0 || actor.confidence > 1.0) return std::nullopt;
        return actor;
    } catch (const std::exception& e) {
        spdlog::debug("Known actor rejected: {}", e.what());
        return std::nullopt;
    }
}

std::vector<KeywordEntry> ReferenceDataParser::parse_keywords(const json& doc) {
    std::vector<KeywordEntry> keywords;
    for (const auto& entry : entries_of(doc, "keywords")) {
        if (auto keyword = parse_keyword(entry)) {
            keywords.push_back(std::move(*keyword));
        } else {
            spdlog::debug("Skipping malformed keyword entry: {}", entry.dump());
        }
    }
    return keywords;
}

std::vector<SourceEntry> ReferenceDataParser::parse_sources(const json& doc) {
    std::vector<SourceEntry> sources;
    for (const auto& entry : entries_of(doc, "sources")) {
        if (auto source = parse_source(entry)) {
            sources.push_back(std::move(*source));
        } else {
            spdlog::debug("Skipping malformed source entry: {}", entry.dump());
        }
    }
    return sources;
}

std::vector<KnownActorEntry> ReferenceDataParser::parse_known_actors(const json& doc) {
    std::vector<KnownActorEntry> actors;
    for (const auto& entry : entries_of(doc, "actors")) {
        if (auto actor = parse_known_actor(entry)) {
            actors.push_back(std::move(*actor));
        } else {
            spdlog::debug("Skipping malformed known actor entry: {}", entry.dump());
        }
    }
    return actors;
}

json ReferenceDataParser::read_document(const std::string& path) {
    if (path.empty()) return nullptr;

    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open reference file {}", path);
        return nullptr;
    }

    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse reference file {}: {}", path, e.what());
        return nullptr;
    }
}

ReferenceTables build_reference_tables(std::vector<KeywordEntry> keywords,
                                       const std::vector<SourceEntry>& sources,
                                       const std::vector<KnownActorEntry>& actors) {
    ReferenceTables tables;
    tables.keywords = std::move(keywords);
    for (const auto& source : sources) tables.add_source(source);
    for (const auto& actor : actors) tables.add_actor(actor);
    return tables;
}

ReferenceTables load_reference_tables(const ReferencePaths& paths) {
    auto tables = build_reference_tables(
        ReferenceDataParser::parse_keywords(ReferenceDataParser::read_document(paths.keywords)),
        ReferenceDataParser::parse_sources(ReferenceDataParser::read_document(paths.sources)),
        ReferenceDataParser::parse_known_actors(ReferenceDataParser::read_document(paths.known_actors)));

    spdlog::info("Loaded reference data: {} keywords, {} sources, {} known actors",
                 tables.keywords.size(), tables.sources.size(), tables.actors.size());
    if (tables.keywords.empty()) {
        spdlog::warn("Keyword table is empty, axis scores will all be 0");
    }
    return tables;
}

// ---- Provider ----

ReferenceDataProvider::ReferenceDataProvider(Loader loader) : loader_(std::move(loader)) {}

std::shared_ptr<ReferenceDataProvider> ReferenceDataProvider::from_tables(ReferenceTables tables) {
    auto snapshot = std::make_shared<ReferenceTables>(std::move(tables));
    return std::make_shared<ReferenceDataProvider>([snapshot]() { return *snapshot; });
}

ReferenceDataProvider::TablesPtr ReferenceDataProvider::get() {
    std::promise<TablesPtr> promise;
    std::shared_future<TablesPtr> pending;
    bool run_loader = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) {
            started_ = true;
            load_count_++;
            tables_ = promise.get_future().share();
            run_loader = true;
        }
        pending = tables_;
    }

    if (run_loader) {
        try {
            promise.set_value(std::make_shared<const ReferenceTables>(loader_()));
        } catch (...) {
            try {
                throw;
            } catch (const std::exception& e) {
                spdlog::error("Reference data load failed: {}", e.what());
            } catch (...) {
                spdlog::error("Reference data load failed with a non-standard exception");
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                started_ = false;
            }
            // Waiters on the shared future see the same exception
            promise.set_exception(std::current_exception());
        }
    }

    return pending.get();
}

bool ReferenceDataProvider::is_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && tables_.valid() &&
           tables_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

int ReferenceDataProvider::load_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_count_;
}
