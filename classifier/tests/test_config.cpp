#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include "../src/health.hpp"
#include <stdexcept>

namespace {

void clear_env() {
    const char* names[] = {"KEYWORDS_PATH", "SOURCES_PATH", "KNOWN_ACTORS_PATH", "CACHE_BACKEND",
                           "REDIS_URL", "CACHE_SWEEP_INTERVAL_SEC", "LISTEN_ADDR", "LISTEN_PORT",
                           "SERVICE_NAME", "LOG_LEVEL"};
    for (const char* name : names) unsetenv(name);
}

} // namespace

TEST_CASE("Config from environment", "[config]") {
    clear_env();

    SECTION("Defaults") {
        auto config = Config::from_env();
        REQUIRE(config.keywords_path == "data/keywords.json");
        REQUIRE(config.cache_backend == "memory");
        REQUIRE(config.listen_port == 8090);
        REQUIRE(config.cache_sweep_interval_sec == 300);
        REQUIRE(config.service_name == "derigo-classifier");
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Overrides") {
        setenv("CACHE_BACKEND", "redis", 1);
        setenv("REDIS_URL", "redis://cache:6379", 1);
        setenv("LISTEN_PORT", "9000", 1);

        auto config = Config::from_env();
        REQUIRE(config.cache_backend == "redis");
        REQUIRE(config.redis_url == "redis://cache:6379");
        REQUIRE(config.listen_port == 9000);
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Unparsable integer falls back to the default") {
        setenv("LISTEN_PORT", "eighty", 1);
        REQUIRE(Config::from_env().listen_port == 8090);
    }

    SECTION("Unknown cache backend is rejected") {
        setenv("CACHE_BACKEND", "memcached", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    SECTION("Port out of range is rejected") {
        setenv("LISTEN_PORT", "70000", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    clear_env();
}

TEST_CASE("Health reflects reference data and cache", "[health]") {
    auto reference = ReferenceDataProvider::from_tables(ReferenceTables());
    auto cache = std::make_shared<InMemoryResultCache>();
    HealthCheck health(reference, cache);

    REQUIRE_FALSE(health.is_healthy());
    REQUIRE(health.get_status()["reference_data"] == false);

    reference->get();
    health.record_request();

    auto status = health.get_status();
    REQUIRE(status["ok"] == true);
    REQUIRE(status["cache"] == true);
    REQUIRE(status["requests"] == 1);
    REQUIRE(health.is_healthy());
}
