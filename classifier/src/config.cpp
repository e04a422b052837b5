#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.keywords_path = get_env("KEYWORDS_PATH", "data/keywords.json");
    cfg.sources_path = get_env("SOURCES_PATH", "data/sources.json");
    cfg.known_actors_path = get_env("KNOWN_ACTORS_PATH", "data/known_actors.json");

    cfg.cache_backend = get_env("CACHE_BACKEND", "memory");
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.cache_sweep_interval_sec = get_env_int("CACHE_SWEEP_INTERVAL_SEC", 300);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "derigo-classifier");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (cache_backend != "memory" && cache_backend != "redis") {
        throw std::runtime_error("CACHE_BACKEND must be 'memory' or 'redis', got '" +
                                 cache_backend + "'");
    }
    if (cache_backend == "redis" && redis_url.empty()) {
        throw std::runtime_error("REDIS_URL is required when CACHE_BACKEND=redis");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range: " + std::to_string(listen_port));
    }
    if (cache_sweep_interval_sec <= 0) {
        throw std::runtime_error("CACHE_SWEEP_INTERVAL_SEC must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Keywords: {}", keywords_path);
    spdlog::info("  Sources: {}", sources_path);
    spdlog::info("  Known actors: {}", known_actors_path);
    spdlog::info("  Cache backend: {}", cache_backend);
}
