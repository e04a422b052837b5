#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/author_scorer.hpp"
#include <cmath>

using Catch::Approx;

namespace {

ExtractedAuthor make_author(const std::string& id = "testuser", const std::string& platform = "twitter") {
    ExtractedAuthor author;
    author.identifier = id;
    author.platform = platform;
    author.display_name = id;
    return author;
}

KnownActorEntry make_actor(AuthorIntent category, double confidence) {
    KnownActorEntry actor;
    actor.identifier = "testuser";
    actor.platform = "twitter";
    actor.category = category;
    actor.confidence = confidence;
    actor.source = "test";
    actor.added_date = "2024-01-01";
    return actor;
}

void require_normalized(const AuthorClassification& result) {
    double total = 0.0;
    for (auto intent : kAllIntents) {
        REQUIRE(result.intent.breakdown.at(intent) >= 0.0);
        total += result.intent.breakdown.at(intent);
    }
    REQUIRE(std::abs(total - 1.0) < 1e-6);
    REQUIRE(result.authenticity >= 0);
    REQUIRE(result.authenticity <= 100);
    REQUIRE(result.coordination >= 0);
    REQUIRE(result.coordination <= 100);
}

const SignalDirection* direction_of(const AuthorClassification& result, const std::string& type) {
    for (const auto& signal : result.signals) {
        if (signal.type == type) return &signal.direction;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Default author classification", "[author]") {
    auto result = AuthorScorer::default_author_classification();

    REQUIRE(result.authenticity == 50);
    REQUIRE(result.coordination == 20);
    REQUIRE(result.intent.primary == AuthorIntent::Organic);
    REQUIRE(result.intent.confidence == Approx(0.5));
    REQUIRE(result.intent.breakdown.organic == Approx(0.5));
    REQUIRE(result.data_quality == DataQuality::Minimal);
    REQUIRE(result.signals.empty());
    require_normalized(result);
}

TEST_CASE("Author scoring from content", "[author]") {
    AuthorScorer scorer;
    auto author = make_author();

    SECTION("Neutral content is organic") {
        auto result = scorer.classify_author(author, "The weather is nice today. I went for a walk.", nullptr);
        REQUIRE(result.intent.primary == AuthorIntent::Organic);
        REQUIRE(result.authenticity == 70);
        REQUIRE(result.coordination == 15);
        REQUIRE(result.has_signal("original_content"));
        REQUIRE(result.author_id == "testuser");
        REQUIRE(result.platform == "twitter");
        require_normalized(result);
    }

    SECTION("Spam with repetition and affiliate links has low authenticity") {
        std::string text;
        for (int i = 0; i < 4; i++) text += "BREAKING! Share before deleted! ";
        // Each link hits both the shortener and the "affiliate" marker, 4 matches over the > 2 threshold
        text += "https://bit.ly/affiliate-deal https://bit.ly/affiliate-offer";

        auto result = scorer.classify_author(author, text, nullptr);
        REQUIRE(result.authenticity < 40);
        REQUIRE(result.has_signal("repetitive_content"));
        REQUIRE(result.has_signal("affiliate_links"));
        REQUIRE(*direction_of(result, "repetitive_content") == SignalDirection::Suspicious);
        require_normalized(result);
    }

    SECTION("Two plain short links stay under the affiliate threshold") {
        auto result = scorer.classify_author(author,
            "Found this today https://amzn.to/abc and this https://bit.ly/xyz", nullptr);
        REQUIRE_FALSE(result.has_signal("affiliate_links"));
        require_normalized(result);
    }

    SECTION("Personal attacks push toward troll") {
        auto result = scorer.classify_author(author,
            "You're an idiot! People like you are the problem. Wake up sheeple!", nullptr);
        REQUIRE(result.has_signal("personal_attacks"));
        REQUIRE(result.intent.breakdown.troll > 0.1);
        require_normalized(result);
    }

    SECTION("Promotional content pushes toward commercial") {
        auto result = scorer.classify_author(author,
            "Buy now! Limited time offer! Click here to sign up for a free trial!", nullptr);
        REQUIRE(result.has_signal("promotional_language"));
        REQUIRE(result.intent.breakdown.commercial > 0.1);
    }

    SECTION("Template content is bot-like") {
        auto result = scorer.classify_author(author,
            "Hello [name], check out {your_product} at INSERT LINK HERE", nullptr);
        REQUIRE(result.has_signal("template_detected"));
        REQUIRE(result.authenticity == 40);
    }

    SECTION("Whataboutism raises coordination") {
        auto result = scorer.classify_author(author,
            "What about when they did that? But what about the other side?", nullptr);
        REQUIRE(result.has_signal("whataboutism"));
        REQUIRE(result.coordination == 25);
    }

    SECTION("Personal voice is rewarded") {
        auto result = scorer.classify_author(author,
            "I think this is interesting because in my experience, things work differently. "
            "I'm not sure about everything, but I could be wrong. I was there when it happened.",
            nullptr);
        REQUIRE(result.has_signal("personal_voice"));
        REQUIRE(*direction_of(result, "personal_voice") == SignalDirection::Authentic);
        REQUIRE(result.authenticity > 60);
    }

    SECTION("Nuance is rewarded") {
        auto result = scorer.classify_author(author,
            "On the other hand, we should consider the downsides. However, it depends on the "
            "situation. The picture is nuanced, according to the latest survey.", nullptr);
        REQUIRE(result.has_signal("nuanced_arguments"));
    }

    SECTION("Empty content stays in bounds") {
        auto result = scorer.classify_author(author, "", nullptr);
        REQUIRE(result.data_quality == DataQuality::Minimal);
        require_normalized(result);
    }
}

TEST_CASE("Author metadata", "[author]") {
    AuthorScorer scorer;

    SECTION("Verified accounts are boosted") {
        auto author = make_author("verifieduser");
        author.metadata.verified = true;

        auto result = scorer.classify_author(author, "Regular post from a verified account.", nullptr);
        REQUIRE(result.authenticity > 70);
        REQUIRE(result.has_signal("verified_account"));
        REQUIRE(*direction_of(result, "verified_account") == SignalDirection::Authentic);
    }

    SECTION("New accounts are penalized") {
        auto author = make_author("newuser");
        author.metadata.account_age_days = 5;

        auto result = scorer.classify_author(author, "Some regular content here.", nullptr);
        REQUIRE(result.has_signal("new_account"));
        REQUIRE(result.authenticity == 60);
    }

    SECTION("Metadata raises data quality") {
        auto author = make_author();
        author.metadata.account_age_days = 400;
        author.metadata.verified = false;
        author.metadata.followers = 1200;

        auto result = scorer.classify_author(author, "Hi", nullptr);
        REQUIRE(result.data_quality == DataQuality::Medium);
    }

    SECTION("Minimal content and no metadata is minimal quality") {
        auto result = scorer.classify_author(make_author(), "Hi", nullptr);
        REQUIRE(result.data_quality == DataQuality::Minimal);
    }
}

TEST_CASE("Known actor override", "[author]") {
    AuthorScorer scorer;
    auto author = make_author();

    SECTION("Full confidence pins the category") {
        auto actor = make_actor(AuthorIntent::Troll, 1.0);
        author.metadata.verified = true;

        auto result = scorer.classify_author(author, "I think this is fine.", &actor);
        REQUIRE(result.intent.primary == AuthorIntent::Troll);
        REQUIRE(result.intent.confidence == Approx(1.0));
        for (auto intent : kAllIntents) {
            if (intent != AuthorIntent::Troll) {
                REQUIRE(result.intent.breakdown.at(intent) == Approx(0.0).margin(1e-12));
            }
        }
        REQUIRE(result.known_actor.has_value());
        REQUIRE(result.data_quality == DataQuality::High);
        require_normalized(result);
    }

    SECTION("Partial confidence keeps other categories proportional") {
        auto actor = make_actor(AuthorIntent::Commercial, 0.5);

        auto result = scorer.classify_author(author, "The weather is nice today.", &actor);
        REQUIRE(result.intent.breakdown.commercial == Approx(0.5));
        // prior without commercial: organic 0.6 of 0.9
        REQUIRE(result.intent.breakdown.organic == Approx(0.5 * 0.6 / 0.9));
        REQUIRE(result.data_quality != DataQuality::High);
        require_normalized(result);
    }

    SECTION("Known bot drags authenticity toward 10") {
        auto actor = make_actor(AuthorIntent::Bot, 0.9);

        auto result = scorer.classify_author(author, "The weather is nice today.", &actor);
        // 70 * 0.1 + 10 * 0.9
        REQUIRE(result.authenticity == 16);
        REQUIRE(result.intent.primary == AuthorIntent::Bot);
    }

    SECTION("Known state actor drags coordination toward 85") {
        auto actor = make_actor(AuthorIntent::StateSponsored, 0.8);

        auto result = scorer.classify_author(author, "The weather is nice today.", &actor);
        // 15 * 0.2 + 85 * 0.8
        REQUIRE(result.coordination == 71);
        REQUIRE(result.intent.primary == AuthorIntent::StateSponsored);
    }

    SECTION("Known actor is recorded as a signal") {
        auto actor = make_actor(AuthorIntent::Activist, 0.6);

        auto result = scorer.classify_author(author, "The weather is nice today.", &actor);
        REQUIRE(result.has_signal("known_actor"));
        for (const auto& signal : result.signals) {
            if (signal.type == "known_actor") {
                REQUIRE(std::get<std::string>(signal.value) == "activist");
                REQUIRE(signal.weight == Approx(0.6));
            }
        }
    }
}

TEST_CASE("Breakdown always sums to one", "[author]") {
    AuthorScorer scorer;
    auto author = make_author();
    author.metadata.verified = true;
    author.metadata.account_age_days = 3;

    const char* texts[] = {
        "",
        "Hi",
        "You're an idiot! You are stupid! People like you! Typical liberal! Go back to school!",
        "Buy now! Buy now! Buy now! Use code SAVE at bit.ly/a bit.ly/b amzn.to/c ?ref=x",
        "What about them? What about that? Yeah but what about this?"
    };

    for (const char* text : texts) {
        require_normalized(scorer.classify_author(author, text, nullptr));

        for (auto intent : kAllIntents) {
            auto actor = make_actor(intent, 0.75);
            require_normalized(scorer.classify_author(author, text, &actor));
        }
    }
}
