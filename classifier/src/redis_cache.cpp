#include "redis_cache.hpp"
#include "codec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

RedisResultCache::RedisResultCache(std::shared_ptr<sw::redis::Redis> redis,
                                   std::shared_ptr<Clock> clock,
                                   const std::string& key_prefix)
    : redis_(std::move(redis)), clock_(std::move(clock)), key_prefix_(key_prefix) {}

std::string RedisResultCache::make_key(const std::string& kind, const std::string& id) const {
    return key_prefix_ + ":" + kind + ":" + id;
}

std::optional<nlohmann::json> RedisResultCache::read_payload(const std::string& key) {
    try {
        auto val = redis_->get(key);
        if (!val) return std::nullopt;

        auto envelope = nlohmann::json::parse(*val);
        CacheEntry<nlohmann::json> entry{key, envelope.at("payload"),
                                         envelope.at("ts").get<int64_t>(),
                                         envelope.at("ttl").get<int64_t>()};
        if (entry.is_stale(clock_->now_ms())) {
            return std::nullopt;
        }
        return entry.payload;
    } catch (const std::exception& e) {
        spdlog::error("Failed to read cache entry {}: {}", key, e.what());
        return std::nullopt;
    }
}

void RedisResultCache::write_payload(const std::string& key, const nlohmann::json& payload,
                                     int64_t ttl_ms) {
    try {
        nlohmann::json envelope = {
            {"ts", clock_->now_ms()},
            {"ttl", ttl_ms},
            {"payload", payload}
        };
        long long ttl_seconds = std::max<long long>(1, ttl_ms / 1000);
        redis_->setex(key, ttl_seconds, envelope.dump());
    } catch (const std::exception& e) {
        spdlog::error("Failed to write cache entry {}: {}", key, e.what());
    }
}

std::optional<ClassificationResult> RedisResultCache::get_classification(const std::string& url) {
    auto payload = read_payload(make_key("content", content_cache_key(url)));
    if (!payload) return std::nullopt;

    try {
        return payload->get<ClassificationResult>();
    } catch (const std::exception& e) {
        spdlog::warn("Discarding malformed cached classification for {}: {}", url, e.what());
        return std::nullopt;
    }
}

void RedisResultCache::put_classification(const std::string& url,
                                          const ClassificationResult& result,
                                          int64_t ttl_ms) {
    write_payload(make_key("content", content_cache_key(url)), result, ttl_ms);
}

std::optional<AuthorClassification> RedisResultCache::get_author(const ExtractedAuthor& author) {
    auto payload = read_payload(make_key("author", author_cache_key(author)));
    if (!payload) return std::nullopt;

    try {
        return payload->get<AuthorClassification>();
    } catch (const std::exception& e) {
        spdlog::warn("Discarding malformed cached author {}: {}", author_cache_key(author), e.what());
        return std::nullopt;
    }
}

void RedisResultCache::put_author(const ExtractedAuthor& author,
                                  const AuthorClassification& result,
                                  int64_t ttl_ms) {
    write_payload(make_key("author", author_cache_key(author)), result, ttl_ms);
}

size_t RedisResultCache::sweep_expired() {
    // SETEX expiry already evicts entries server-side
    return 0;
}

bool RedisResultCache::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Redis ping failed: {}", e.what());
        return false;
    }
}
