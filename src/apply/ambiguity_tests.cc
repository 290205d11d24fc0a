#include "ambiguity.hpp"

#include <doctest.h>

#include <vector>

using namespace mender;

namespace {

MatchCandidate
candidate(std::size_t start, double similarity, int priority = 0) {
    MatchCandidate c;
    c.strategy = StrategyId::kFuzzy;
    c.start_offset = start;
    c.end_offset = start + 4;
    c.similarity = similarity;
    c.priority = priority;
    return c;
}

}  // namespace

TEST_CASE("resolve_ambiguity") {
    SUBCASE("no_candidates") {
        auto result = resolve_ambiguity({});
        REQUIRE(result.resolution == Resolution::NoMatch);
        REQUIRE_FALSE(result.accepted.has_value());
    }

    SUBCASE("single_candidate") {
        auto result = resolve_ambiguity({candidate(7, 0.81)});
        REQUIRE(result.resolution == Resolution::Accepted);
        REQUIRE(result.accepted->start_offset == 7);
    }

    SUBCASE("clear_winner_by_margin") {
        auto result = resolve_ambiguity({candidate(0, 0.97), candidate(10, 0.9)});
        REQUIRE(result.resolution == Resolution::Accepted);
        REQUIRE(result.accepted->start_offset == 0);
    }

    SUBCASE("gap_of_exactly_the_margin_is_enough") {
        auto result = resolve_ambiguity({candidate(0, 1.0), candidate(10, 0.95)});
        REQUIRE(result.resolution == Resolution::Accepted);
    }

    SUBCASE("gap_below_the_margin") {
        auto result = resolve_ambiguity({candidate(0, 0.9), candidate(10, 0.86)});
        REQUIRE(result.resolution == Resolution::Ambiguous);
        REQUIRE(result.tied.size() == 2);
    }

    SUBCASE("equal_scores_are_ambiguous") {
        auto result = resolve_ambiguity({candidate(0, 1.0), candidate(10, 1.0), candidate(20, 1.0)});
        REQUIRE(result.resolution == Resolution::Ambiguous);
        REQUIRE_FALSE(result.accepted.has_value());
        REQUIRE(result.tied.size() == 3);
    }

    SUBCASE("tied_set_stops_at_the_margin") {
        auto result = resolve_ambiguity({candidate(0, 0.9), candidate(10, 0.89), candidate(20, 0.8)});
        REQUIRE(result.resolution == Resolution::Ambiguous);
        REQUIRE(result.tied.size() == 2);
        REQUIRE(result.tied[0].start_offset == 0);
        REQUIRE(result.tied[1].start_offset == 10);
    }

    SUBCASE("more_literal_strategy_wins") {
        auto result = resolve_ambiguity({candidate(0, 1.0, 0), candidate(10, 0.99, 3), candidate(20, 0.98, 2)});
        REQUIRE(result.resolution == Resolution::Accepted);
        REQUIRE(result.accepted->start_offset == 0);
    }

    SUBCASE("same_strategy_is_no_tiebreak") {
        auto result = resolve_ambiguity({candidate(0, 1.0, 1), candidate(10, 0.99, 1)});
        REQUIRE(result.resolution == Resolution::Ambiguous);
    }
}
