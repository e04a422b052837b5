#include <catch2/catch_test_macros.hpp>
#include "../src/axis_scorer.hpp"
#include "../src/util.hpp"

namespace {

std::vector<KeywordEntry> sample_keywords() {
    return {
        {"tax cuts", Axis::Economic, 1, 6, {}},
        {"wealth tax", Axis::Economic, -1, 9, {}},
        {"border wall", Axis::Globalism, -1, 7, {}},
        {"surveillance", Axis::Authority, 1, 5, {"security"}}
    };
}

AxisScore score(const std::string& text, Axis axis) {
    AxisScorer scorer;
    return scorer.score_axis(util::normalize_text(text), sample_keywords(), axis);
}

} // namespace

TEST_CASE("Axis scoring", "[axis]") {
    SECTION("No matching keywords scores exactly zero") {
        auto result = score("The weather was pleasant all week", Axis::Economic);
        REQUIRE(result.score == 0);
        REQUIRE(result.matches == 0);
    }

    SECTION("Empty text scores zero on every axis") {
        for (auto axis : kAllAxes) {
            auto result = score("", axis);
            REQUIRE(result.score == 0);
            REQUIRE(result.matches == 0);
        }
    }

    SECTION("Single keyword maps its weight onto the output range") {
        auto result = score("They proposed tax cuts again", Axis::Economic);
        REQUIRE(result.score == 60);
        REQUIRE(result.matches == 1);
    }

    SECTION("Repeated keyword is capped at three occurrences") {
        auto result = score("wealth tax, wealth tax, wealth tax, wealth tax, wealth tax",
                            Axis::Economic);
        REQUIRE(result.score == -90);
        REQUIRE(result.matches == 1);
    }

    SECTION("Opposing keywords offset each other") {
        auto result = score("tax cuts for some and a wealth tax for others", Axis::Economic);
        REQUIRE(result.score == -15);
        REQUIRE(result.matches == 2);
    }

    SECTION("Only whole words count") {
        auto result = score("syntax cuts everywhere", Axis::Economic);
        REQUIRE(result.matches == 0);
    }

    SECTION("Keywords on other axes are ignored") {
        auto result = score("build the border wall", Axis::Economic);
        REQUIRE(result.score == 0);

        auto globalism = score("build the border wall", Axis::Globalism);
        REQUIRE(globalism.score == -70);
    }

    SECTION("Required context gates a keyword") {
        REQUIRE(score("more surveillance cameras downtown", Axis::Authority).matches == 0);

        auto with_context = score("more surveillance for national security", Axis::Authority);
        REQUIRE(with_context.matches == 1);
        REQUIRE(with_context.score == 50);
    }

    SECTION("Punctuation and case do not affect matching") {
        auto result = score("TAX-CUTS!!!", Axis::Economic);
        REQUIRE(result.matches == 1);
    }
}

TEST_CASE("Axis tuning is overridable", "[axis]") {
    AxisTuning tuning;
    tuning.max_occurrences = 1;
    AxisScorer scorer(tuning);

    auto result = scorer.score_axis(util::normalize_text("tax cuts tax cuts wealth tax"),
                                    sample_keywords(), Axis::Economic);
    // one effective occurrence each: (6 - 9) / 20
    REQUIRE(result.score == -15);
}
