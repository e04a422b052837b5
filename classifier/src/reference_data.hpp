#pragma once

#include "types.hpp"
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

// Immutable snapshot of the keyword, source and known-actor tables
struct ReferenceTables {
    std::vector<KeywordEntry> keywords;
    std::unordered_map<std::string, SourceEntry> sources;      // by lowercased domain
    std::unordered_map<std::string, KnownActorEntry> actors;   // by "platform:identifier"

    // Exact host, then host without a leading "www."
    const SourceEntry* find_source(const std::string& host) const;
    const SourceEntry* find_source_for_url(const std::string& url) const;

    // Exact "platform:identifier", then "all:identifier"
    const KnownActorEntry* find_known_actor(const std::string& platform,
                                            const std::string& identifier) const;

    void add_source(const SourceEntry& source);
    void add_actor(const KnownActorEntry& actor);
};

struct ReferencePaths {
    std::string keywords;
    std::string sources;
    std::string known_actors;
};

// Parses the JSON reference documents. Malformed entries are skipped with a
// debug log; a document of the wrong shape yields no entries.
class ReferenceDataParser {
public:
    static std::vector<KeywordEntry> parse_keywords(const nlohmann::json& doc);
    static std::vector<SourceEntry> parse_sources(const nlohmann::json& doc);
    static std::vector<KnownActorEntry> parse_known_actors(const nlohmann::json& doc);

    static std::optional<KeywordEntry> parse_keyword(const nlohmann::json& entry);
    static std::optional<SourceEntry> parse_source(const nlohmann::json& entry);
    static std::optional<KnownActorEntry> parse_known_actor(const nlohmann::json& entry);

    // Read and parse a file; missing or unparsable files are logged and
    // reported as a null document
    static nlohmann::json read_document(const std::string& path);
};

ReferenceTables build_reference_tables(std::vector<KeywordEntry> keywords,
                                       const std::vector<SourceEntry>& sources,
                                       const std::vector<KnownActorEntry>& actors);

ReferenceTables load_reference_tables(const ReferencePaths& paths);

// Owns the lazily loaded tables. The first caller runs the loader; callers
// arriving while that load is in flight wait for the same result.
class ReferenceDataProvider {
public:
    using TablesPtr = std::shared_ptr<const ReferenceTables>;
    using Loader = std::function<ReferenceTables()>;

    explicit ReferenceDataProvider(Loader loader);

    // Provider over a ready snapshot
    static std::shared_ptr<ReferenceDataProvider> from_tables(ReferenceTables tables);

    TablesPtr get();

    bool is_loaded() const;
    int load_count() const;

private:
    Loader loader_;
    mutable std::mutex mutex_;
    std::shared_future<TablesPtr> tables_;
    bool started_ = false;
    int load_count_ = 0;
};
