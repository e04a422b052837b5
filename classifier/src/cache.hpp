#pragma once

#include "types.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

constexpr int64_t kHourMs = 60LL * 60 * 1000;
constexpr int64_t kDayMs = 24 * kHourMs;

class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override;
};

template <typename T>
struct CacheEntry {
    std::string key;
    T payload;
    int64_t timestamp_ms;
    int64_t ttl_ms;

    bool is_stale(int64_t now_ms) const { return now_ms - timestamp_ms >= ttl_ms; }
};

// SHA-256 hex of the URL
std::string content_cache_key(const std::string& url);
// "platform:identifier"
std::string author_cache_key(const ExtractedAuthor& author);

// 1h for social sites, 6h for news sites, 24h otherwise
int64_t content_cache_ttl_ms(const std::string& url);
// 7 days for high quality data, 12h on twitter / reddit, 6h otherwise
int64_t author_cache_ttl_ms(const std::string& platform, DataQuality quality);

// Memoizes classification and author results. Backends never throw: a
// failed read is a miss and a failed write is dropped.
class ResultCache {
public:
    virtual ~ResultCache() = default;

    virtual std::optional<ClassificationResult> get_classification(const std::string& url) = 0;
    virtual void put_classification(const std::string& url, const ClassificationResult& result,
                                    int64_t ttl_ms) = 0;

    virtual std::optional<AuthorClassification> get_author(const ExtractedAuthor& author) = 0;
    virtual void put_author(const ExtractedAuthor& author, const AuthorClassification& result,
                            int64_t ttl_ms) = 0;

    // Drops stale entries, returns how many were removed
    virtual size_t sweep_expired() = 0;

    virtual bool ping() { return true; }

    // TTL chosen from the URL / platform and data quality
    void put_classification(const std::string& url, const ClassificationResult& result);
    void put_author(const ExtractedAuthor& author, const AuthorClassification& result);
};

class InMemoryResultCache : public ResultCache {
public:
    explicit InMemoryResultCache(std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

    using ResultCache::put_classification;
    using ResultCache::put_author;

    std::optional<ClassificationResult> get_classification(const std::string& url) override;
    void put_classification(const std::string& url, const ClassificationResult& result,
                            int64_t ttl_ms) override;

    std::optional<AuthorClassification> get_author(const ExtractedAuthor& author) override;
    void put_author(const ExtractedAuthor& author, const AuthorClassification& result,
                    int64_t ttl_ms) override;

    size_t sweep_expired() override;

    size_t size() const;

private:
    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry<ClassificationResult>> content_;
    std::unordered_map<std::string, CacheEntry<AuthorClassification>> authors_;
};
