#pragma once
#include "cache.hpp"
#include "reference_data.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<ReferenceDataProvider> reference, std::shared_ptr<ResultCache> cache);

    nlohmann::json get_status();
    bool is_healthy();

    void record_request();

private:
    std::shared_ptr<ReferenceDataProvider> reference_;
    std::shared_ptr<ResultCache> cache_;
    std::atomic<int64_t> requests_{0};
    std::atomic<int64_t> last_request_ms_{0};
};
