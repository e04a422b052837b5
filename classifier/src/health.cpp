#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<ReferenceDataProvider> reference,
                         std::shared_ptr<ResultCache> cache)
    : reference_(std::move(reference)), cache_(std::move(cache)) {}

void HealthCheck::record_request() {
    requests_++;
    last_request_ms_ = util::current_timestamp_ms();
}

nlohmann::json HealthCheck::get_status() {
    bool cache_ok = cache_->ping();
    bool reference_ok = reference_->is_loaded();

    return {
        {"ok", cache_ok && reference_ok},
        {"cache", cache_ok},
        {"reference_data", reference_ok},
        {"requests", requests_.load()},
        {"last_request_ms", last_request_ms_.load()},
        {"ts", util::current_iso8601()}
    };
}

bool HealthCheck::is_healthy() {
    return cache_->ping() && reference_->is_loaded();
}
