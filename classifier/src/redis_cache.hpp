#pragma once

#include "cache.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// Redis-backed cache. Each entry is a JSON envelope written with SETEX, so
// Redis evicts expired entries on its own.
class RedisResultCache : public ResultCache {
public:
    RedisResultCache(std::shared_ptr<sw::redis::Redis> redis,
                     std::shared_ptr<Clock> clock = std::make_shared<SystemClock>(),
                     const std::string& key_prefix = "derigo");

    using ResultCache::put_classification;
    using ResultCache::put_author;

    std::optional<ClassificationResult> get_classification(const std::string& url) override;
    void put_classification(const std::string& url, const ClassificationResult& result,
                            int64_t ttl_ms) override;

    std::optional<AuthorClassification> get_author(const ExtractedAuthor& author) override;
    void put_author(const ExtractedAuthor& author, const AuthorClassification& result,
                    int64_t ttl_ms) override;

    size_t sweep_expired() override;

    bool ping() override;

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::shared_ptr<Clock> clock_;
    std::string key_prefix_;

    std::string make_key(const std::string& kind, const std::string& id) const;

    std::optional<nlohmann::json> read_payload(const std::string& key);
    void write_payload(const std::string& key, const nlohmann::json& payload, int64_t ttl_ms);
};
