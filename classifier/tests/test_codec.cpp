#include <catch2/catch_test_macros.hpp>
#include "../src/codec.hpp"
#include <stdexcept>

using nlohmann::json;

TEST_CASE("User preferences decode", "[codec]") {
    SECTION("Full document") {
        auto prefs = json{
            {"economic_range", {-50, 50}},
            {"social_range", nullptr},
            {"min_truth_score", 40},
            {"blocked_intents", {"bot", "stateSponsored"}},
            {"display_mode", "overlay"},
            {"enabled", true},
            {"whitelisted_domains", json::array({"example.com"})}
        }.get<UserPreferences>();

        REQUIRE(prefs.economic_range == std::optional<ScoreRange>(ScoreRange{-50, 50}));
        REQUIRE_FALSE(prefs.social_range.has_value());
        REQUIRE(prefs.min_truth_score == 40);
        REQUIRE(prefs.max_coordination == 100);
        REQUIRE(prefs.blocked_intents.size() == 2);
        REQUIRE(prefs.blocked_intents[1] == AuthorIntent::StateSponsored);
        REQUIRE(prefs.display_mode == DisplayMode::Overlay);
        REQUIRE(prefs.whitelisted_domains == std::vector<std::string>{"example.com"});
    }

    SECTION("Missing fields keep defaults") {
        auto prefs = json::object().get<UserPreferences>();
        REQUIRE(prefs.display_mode == DisplayMode::Badge);
        REQUIRE(prefs.enabled);
        REQUIRE_FALSE(prefs.economic_range.has_value());
    }

    SECTION("Unknown display mode is rejected") {
        json doc = {{"display_mode", "popup"}};
        REQUIRE_THROWS_AS(doc.get<UserPreferences>(), std::invalid_argument);
    }

    SECTION("Unknown intent is rejected") {
        json doc = {{"blocked_intents", json::array({"alien"})}};
        REQUIRE_THROWS_AS(doc.get<UserPreferences>(), std::invalid_argument);
    }

    SECTION("Malformed range is rejected") {
        json doc = {{"economic_range", {1, 2, 3}}};
        REQUIRE_THROWS_AS(doc.get<UserPreferences>(), std::invalid_argument);
    }
}

TEST_CASE("Preference overrides keep explicit unset apart from absent", "[codec]") {
    json doc = {
        {"economic_range", nullptr},
        {"social_range", {-20, 20}},
        {"min_truth_score", 0},
        {"display_mode", "block"}
    };
    auto overrides = doc.get<PreferenceOverrides>();

    REQUIRE(overrides.economic_range.has_value());
    REQUIRE_FALSE(overrides.economic_range->has_value());
    REQUIRE(overrides.social_range == std::optional<std::optional<ScoreRange>>(ScoreRange{-20, 20}));
    REQUIRE_FALSE(overrides.authority_range.has_value());
    REQUIRE(overrides.min_truth_score == std::optional<int>(0));
    REQUIRE_FALSE(overrides.max_coordination.has_value());
    REQUIRE(overrides.display_mode == std::optional<DisplayMode>(DisplayMode::Block));
    REQUIRE(overrides.count() == 4);

    json encoded = overrides;
    REQUIRE(encoded.contains("economic_range"));
    REQUIRE(encoded["economic_range"].is_null());
    REQUIRE_FALSE(encoded.contains("authority_range"));
    REQUIRE(encoded["min_truth_score"] == 0);
}

TEST_CASE("Site profile decode", "[codec]") {
    json doc = {
        {"id", "news"},
        {"name", "News sites"},
        {"domains", json::array({"*.example.com"})},
        {"overrides", {{"min_truth_score", 70}}}
    };
    auto profile = doc.get<SiteProfile>();

    REQUIRE(profile.id == "news");
    REQUIRE(profile.domains.size() == 1);
    REQUIRE(profile.overrides.min_truth_score == std::optional<int>(70));
    REQUIRE(profile.overrides.count() == 1);
}

TEST_CASE("Extracted author metadata", "[codec]") {
    json doc = {
        {"identifier", "someone"},
        {"platform", "twitter"},
        {"metadata", {{"account_age", 12}, {"verified", false}}}
    };
    auto author = doc.get<ExtractedAuthor>();

    REQUIRE(author.display_name == "someone");
    REQUIRE(author.metadata.account_age_days == std::optional<int>(12));
    REQUIRE(author.metadata.verified == std::optional<bool>(false));
    REQUIRE_FALSE(author.metadata.followers.has_value());
}

TEST_CASE("Classification result wire format", "[codec]") {
    ClassificationResult result;
    result.economic = -35;
    result.truth_score = 55;
    result.confidence = 0.44;
    result.timestamp_ms = 1700000000000;

    AuthorClassification author;
    author.authenticity = 35;
    author.coordination = 15;
    author.intent.primary = AuthorIntent::Commercial;
    author.intent.confidence = 0.4;
    author.signals.push_back({"known_actor", std::string("commercial"), 0.7, SignalDirection::Suspicious});
    author.signals.push_back({"affiliate_links", 4.0, 0.25, SignalDirection::Suspicious});
    author.data_quality = DataQuality::Low;
    result.author = author;

    json encoded = result;
    REQUIRE(encoded["timestamp"] == 1700000000000);
    REQUIRE(encoded["source"] == "local");
    REQUIRE(encoded["author"]["intent"]["primary"] == "commercial");
    REQUIRE(encoded["author"]["signals"][0]["value"] == "commercial");
    REQUIRE(encoded["author"]["signals"][1]["value"] == 4.0);

    auto decoded = encoded.get<ClassificationResult>();
    REQUIRE(decoded.economic == -35);
    REQUIRE(decoded.author.has_value());
    REQUIRE(decoded.author->data_quality == DataQuality::Low);
    REQUIRE(std::get<std::string>(decoded.author->signals[0].value) == "commercial");
    REQUIRE(std::get<double>(decoded.author->signals[1].value) == 4.0);
}

TEST_CASE("Filter action wire format", "[codec]") {
    FilterAction action;
    action.action = FilterVerdict::Overlay;
    action.reason = FilterReason::Intent;

    json encoded = action;
    REQUIRE(encoded["action"] == "overlay");
    REQUIRE(encoded["reason"] == "authorIntent");
    REQUIRE(encoded["result"].is_object());
}
