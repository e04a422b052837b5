#include "cache.hpp"
#include "profiles.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

const std::vector<std::string> kSocialSites = {
    "twitter.com", "x.com", "facebook.com", "fb.com",
    "reddit.com", "instagram.com", "tiktok.com", "linkedin.com"
};

const std::vector<std::string> kNewsTerms = {
    "news", "cnn", "bbc", "reuters", "nytimes", "washingtonpost",
    "guardian", "foxnews", "msnbc", "npr"
};

bool host_contains_any(const std::string& host, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(),
        [&host](const std::string& needle) { return host.find(needle) != std::string::npos; });
}

template <typename T>
size_t erase_stale(std::unordered_map<std::string, CacheEntry<T>>& entries, int64_t now) {
    size_t removed = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second.is_stale(now)) {
            it = entries.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace

int64_t SystemClock::now_ms() const {
    return util::current_timestamp_ms();
}

std::string content_cache_key(const std::string& url) {
    return util::sha256_hex(url);
}

std::string author_cache_key(const ExtractedAuthor& author) {
    return author.platform + ":" + author.identifier;
}

int64_t content_cache_ttl_ms(const std::string& url) {
    std::string host = util::extract_host(url);

    bool social = std::any_of(kSocialSites.begin(), kSocialSites.end(),
        [&host](const std::string& site) { return domain_matches_pattern(host, site); });

    if (social) return kHourMs;
    if (host_contains_any(host, kNewsTerms)) return 6 * kHourMs;
    return kDayMs;
}

int64_t author_cache_ttl_ms(const std::string& platform, DataQuality quality) {
    if (quality == DataQuality::High) return 7 * kDayMs;
    if (platform == "twitter" || platform == "reddit") return 12 * kHourMs;
    return 6 * kHourMs;
}

void ResultCache::put_classification(const std::string& url, const ClassificationResult& result) {
    put_classification(url, result, content_cache_ttl_ms(url));
}

void ResultCache::put_author(const ExtractedAuthor& author, const AuthorClassification& result) {
    put_author(author, result, author_cache_ttl_ms(author.platform, result.data_quality));
}

InMemoryResultCache::InMemoryResultCache(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {}

std::optional<ClassificationResult> InMemoryResultCache::get_classification(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = content_.find(content_cache_key(url));
    if (it == content_.end() || it->second.is_stale(clock_->now_ms())) {
        return std::nullopt;
    }
    return it->second.payload;
}

void InMemoryResultCache::put_classification(const std::string& url,
                                             const ClassificationResult& result,
                                             int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto key = content_cache_key(url);
    content_[key] = CacheEntry<ClassificationResult>{key, result, clock_->now_ms(), ttl_ms};
}

std::optional<AuthorClassification> InMemoryResultCache::get_author(const ExtractedAuthor& author) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = authors_.find(author_cache_key(author));
    if (it == authors_.end() || it->second.is_stale(clock_->now_ms())) {
        return std::nullopt;
    }
    return it->second.payload;
}

void InMemoryResultCache::put_author(const ExtractedAuthor& author,
                                     const AuthorClassification& result,
                                     int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto key = author_cache_key(author);
    authors_[key] = CacheEntry<AuthorClassification>{key, result, clock_->now_ms(), ttl_ms};
}

size_t InMemoryResultCache::sweep_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now = clock_->now_ms();
    size_t removed = erase_stale(content_, now) + erase_stale(authors_, now);
    if (removed > 0) {
        spdlog::debug("Swept {} expired cache entries", removed);
    }
    return removed;
}

size_t InMemoryResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return content_.size() + authors_.size();
}
