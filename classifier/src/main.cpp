#include "config.hpp"
#include "cache.hpp"
#include "redis_cache.hpp"
#include "reference_data.hpp"
#include "classifier.hpp"
#include "profiles.hpp"
#include "filter.hpp"
#include "labels.hpp"
#include "codec.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

std::shared_ptr<ResultCache> make_cache(const Config& config) {
    if (config.cache_backend == "redis") {
        auto redis = std::make_shared<sw::redis::Redis>(config.redis_url);
        spdlog::info("Using Redis cache at {}", config.redis_url);
        return std::make_shared<RedisResultCache>(redis);
    }
    spdlog::info("Using in-memory cache");
    return std::make_shared<InMemoryResultCache>();
}

// POST /classify: {text, url, author?, preferences?, profiles?}
nlohmann::json handle_classify(const nlohmann::json& body, ContentClassifier& classifier) {
    auto text = body.at("text").get<std::string>();
    auto url = body.at("url").get<std::string>();

    std::optional<ExtractedAuthor> author;
    if (body.contains("author") && body["author"].is_object()) {
        author = body["author"].get<ExtractedAuthor>();
    }

    UserPreferences prefs;
    if (body.contains("preferences")) {
        prefs = body["preferences"].get<UserPreferences>();
    }

    std::vector<SiteProfile> profiles;
    if (body.contains("profiles")) {
        profiles = body["profiles"].get<std::vector<SiteProfile>>();
    }

    auto result = classifier.classify(text, url, author);

    std::string host = util::extract_host(url);
    auto effective = effective_preferences(prefs, profiles, host);

    FilterAction action;
    action.result = result;
    if (!prefs.enabled) {
        spdlog::debug("Filtering disabled, no action for {}", url);
    } else if (is_whitelisted(prefs, host)) {
        spdlog::debug("{} is whitelisted", host);
    } else {
        action = decide_filter_action(result, effective.prefs);
    }

    nlohmann::json reply = {
        {"result", result},
        {"action", action},
        {"summary", format_result_summary(result)}
    };
    if (action.reason) {
        reply["reason_text"] = format_filter_reason(*action.reason);
    }
    if (effective.profile) {
        reply["profile"] = {{"id", effective.profile->id}, {"name", effective.profile->name}};
    }

    spdlog::info("Classified {}: action={} reason={}", url, to_string(action.action),
                 action.reason ? to_string(*action.reason) : "-");
    return reply;
}

int main() {
    try {
        // Load configuration
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        // Initialize components
        ReferencePaths paths{config.keywords_path, config.sources_path, config.known_actors_path};
        auto reference = std::make_shared<ReferenceDataProvider>(
            [paths]() { return load_reference_tables(paths); });
        auto cache = make_cache(config);

        ContentClassifier classifier(reference, cache);
        HealthCheck health(reference, cache);

        // Warm the reference tables before accepting traffic
        reference->get();

        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            auto status = health.get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        http_server.Post("/classify", [&](const httplib::Request& req, httplib::Response& res) {
            health.record_request();
            try {
                auto body = nlohmann::json::parse(req.body);
                auto reply = handle_classify(body, classifier);
                res.set_content(reply.dump(), "application/json");
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Bad classify request: {}", e.what());
                res.status = 400;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            } catch (const std::invalid_argument& e) {
                spdlog::warn("Bad classify request: {}", e.what());
                res.status = 400;
                res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
            } catch (const std::exception& e) {
                spdlog::error("Classify failed: {}", e.what());
                res.status = 500;
                res.set_content(nlohmann::json{{"error", "internal error"}}.dump(), "application/json");
            }
        });

        // Start HTTP server in background thread
        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            if (!http_server.listen(config.listen_addr.c_str(), config.listen_port)) {
                spdlog::error("HTTP server failed to bind {}:{}", config.listen_addr, config.listen_port);
                shutdown_requested = true;
            }
        });

        // Register signal handlers
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        // Periodic cache sweep until shutdown
        auto next_sweep = std::chrono::steady_clock::now() +
                          std::chrono::seconds(config.cache_sweep_interval_sec);
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            if (std::chrono::steady_clock::now() >= next_sweep) {
                size_t removed = cache->sweep_expired();
                if (removed > 0) {
                    spdlog::info("Cache sweep removed {} entries", removed);
                }
                next_sweep = std::chrono::steady_clock::now() +
                             std::chrono::seconds(config.cache_sweep_interval_sec);
            }
        }

        // Graceful shutdown
        spdlog::info("Shutting down gracefully");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
