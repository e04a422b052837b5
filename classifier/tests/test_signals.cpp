#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/signals.hpp"
#include "../src/scoring.hpp"

using Catch::Approx;

TEST_CASE("Content signal extraction", "[signals]") {
    SECTION("Neutral content raises no suspicious signals") {
        auto s = ContentSignalExtractor::extract("The weather is nice today. I went for a walk in the park.");
        REQUIRE(s.personal_attacks == 0);
        REQUIRE(s.bad_faith_arguments == 0);
        REQUIRE(s.affiliate_link_count == 0);
        REQUIRE(s.repetitive_patterns == 0);
        REQUIRE(s.original_content == Approx(1.0));
    }

    SECTION("Empty content") {
        auto s = ContentSignalExtractor::extract("");
        REQUIRE(s.emotional_language_density == 0);
        REQUIRE(s.promotional_language == 0);
        REQUIRE(s.whataboutism_density == 0);
        REQUIRE(s.personal_voice == 0);
        REQUIRE(s.original_content == Approx(1.0));
        REQUIRE(s.nonzero_count() == 1);
    }

    SECTION("Emotional language density") {
        auto s = ContentSignalExtractor::extract("Disgusting and horrific behavior! Shocking and pathetic!");
        // 4 of 7 words
        REQUIRE(s.emotional_language_density == Approx(4.0 / 7.0));
    }

    SECTION("Personal attacks") {
        auto s = ContentSignalExtractor::extract(
            "You're an idiot! People like you are the problem. Wake up sheeple!");
        REQUIRE(s.personal_attacks == 3);
    }

    SECTION("Bad faith arguments") {
        auto s = ContentSignalExtractor::extract(
            "What about when they did it? So you're saying we should just ignore that?");
        REQUIRE(s.bad_faith_arguments == 2);
    }

    SECTION("Engagement bait saturates at one") {
        auto s = ContentSignalExtractor::extract(
            "Change my mind! Prove me wrong if you can. Hot take: unpopular opinion here");
        REQUIRE(s.engagement_baiting == Approx(1.0));
    }

    SECTION("Promotional language is per sentence") {
        auto s = ContentSignalExtractor::extract(
            "Buy now! Limited time offer! Click here to sign up for a free trial!");
        REQUIRE(s.promotional_language == Approx(5.0 / 3.0));
    }

    SECTION("Template placeholders") {
        auto s = ContentSignalExtractor::extract("Hello [name], check out {your_product} at INSERT LINK HERE");
        REQUIRE(s.template_likelihood == Approx(1.0));

        auto one = ContentSignalExtractor::extract("Dear [company], thanks");
        REQUIRE(one.template_likelihood == Approx(0.5));
    }

    SECTION("Every affiliate marker occurrence counts") {
        auto s = ContentSignalExtractor::extract("amzn.to/abc123 use ?ref=me or bit.ly/xyz and bit.ly/abc");
        REQUIRE(s.affiliate_link_count == 4);
    }

    SECTION("Whataboutism per segment") {
        auto s = ContentSignalExtractor::extract("What about when they did that? But what about the other side?");
        // three matches over three segments (trailing empty segment included)
        REQUIRE(s.whataboutism_density == Approx(1.0));
    }

    SECTION("Personal voice markers") {
        auto s = ContentSignalExtractor::extract(
            "I think this is interesting. In my experience, it works well. Maybe not always.");
        REQUIRE(s.personal_voice == Approx(0.55));
    }

    SECTION("Nuance markers and genuine questions") {
        auto s = ContentSignalExtractor::extract(
            "On the other hand, we should consider alternatives. It depends on the situation.");
        REQUIRE(s.nuanced_arguments == Approx(0.35));

        auto questions = ContentSignalExtractor::extract("Why did it fail? Was the plan wrong?");
        REQUIRE(questions.nuanced_arguments == Approx(0.05));

        auto rhetorical = ContentSignalExtractor::extract("Why did it fail? Seriously? Really?");
        REQUIRE(rhetorical.nuanced_arguments == 0);
    }

    SECTION("Repetition needs at least three sentences") {
        auto two = ContentSignalExtractor::extract("Buy this product now. Buy this product now.");
        REQUIRE(two.repetitive_patterns == 0);

        auto four = ContentSignalExtractor::extract(
            "Buy this product now. Buy this product now. Buy this product now. Buy this product now.");
        REQUIRE(four.repetitive_patterns == Approx(1.0));
        REQUIRE(four.original_content == Approx(0.0));
    }

    SECTION("Short sentences are not bucketed") {
        auto s = ContentSignalExtractor::extract("Yes. Yes. Yes. Yes.");
        REQUIRE(s.repetitive_patterns == 0);
    }

    SECTION("Extraction is deterministic") {
        std::string text = "What about them? Buy now at bit.ly/x! I think so.";
        auto a = ContentSignalExtractor::extract(text);
        auto b = ContentSignalExtractor::extract(text);
        REQUIRE(a.whataboutism_density == b.whataboutism_density);
        REQUIRE(a.affiliate_link_count == b.affiliate_link_count);
        REQUIRE(a.personal_voice == b.personal_voice);
        REQUIRE(a.nonzero_count() == b.nonzero_count());
    }
}

TEST_CASE("Long single-line text is handled", "[signals]") {
    std::string prose;
    while (prose.size() < 100000) {
        prose += "the council reviewed the budget proposal and the committee asked for more detail ";
    }

    SECTION("Leading insert keyword without a placeholder") {
        auto s = ContentSignalExtractor::extract("insert " + prose);
        REQUIRE(s.template_likelihood == 0);

        ContentScorer scorer;
        REQUIRE(scorer.estimate_truth("insert " + prose, nullptr) == 50);
    }

    SECTION("Whole text wrapped in double braces") {
        auto s = ContentSignalExtractor::extract("{{" + prose + "}}");
        REQUIRE(s.template_likelihood == 0);
    }

    SECTION("Open question mark followed by a long run") {
        auto s = ContentSignalExtractor::extract("why? " + prose + "?");
        REQUIRE(s.nuanced_arguments >= 0.0);
        REQUIRE(s.nuanced_arguments <= 1.0);
    }

    SECTION("Short placeholders still match") {
        REQUIRE(ContentSignalExtractor::extract("insert your name here").template_likelihood == Approx(0.5));
        REQUIRE(ContentSignalExtractor::extract("Hi {{first_name}}").template_likelihood == Approx(0.5));
    }
}
