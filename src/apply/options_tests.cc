#include "options.hpp"

#include <doctest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace mender;

TEST_CASE("apply_options") {
    std::string error;

    SUBCASE("defaults") {
        ApplyOptions options;
        REQUIRE_FALSE(options.strict);
        REQUIRE_FALSE(options.enable_telemetry);
        REQUIRE(options.fuzzy_threshold == 0.8);
        REQUIRE(options.matching_strategies.size() == 4);
        REQUIRE(options.matching_strategies[0] == StrategyId::kExact);
        REQUIRE(options.matching_strategies[3] == StrategyId::kFuzzy);
        REQUIRE(validate_options(options, error));
        REQUIRE(error.empty());
    }

    SUBCASE("realtime_corrector") {
        auto options = ApplyOptions::realtime_corrector();
        REQUIRE(options.fuzzy_threshold == kRealtimeCorrectorThreshold);
        REQUIRE(validate_options(options, error));
    }

    SUBCASE("threshold_range") {
        ApplyOptions options;
        options.fuzzy_threshold = 1.0;
        REQUIRE(validate_options(options, error));

        for (double bad : {0.0, -0.5, 1.0000001, 2.0, std::numeric_limits<double>::quiet_NaN()}) {
            options.fuzzy_threshold = bad;
            REQUIRE_FALSE(validate_options(options, error));
            REQUIRE(error.find("fuzzy threshold") != std::string::npos);
        }
    }

    SUBCASE("strategy_list") {
        ApplyOptions options;
        options.matching_strategies.clear();
        REQUIRE_FALSE(validate_options(options, error));

        options.matching_strategies = {StrategyId::kExact, StrategyId::kInvalid};
        REQUIRE_FALSE(validate_options(options, error));

        options.matching_strategies = {StrategyId::kFuzzy, StrategyId::kExact, StrategyId::kFuzzy};
        REQUIRE_FALSE(validate_options(options, error));
        REQUIRE(error.find("more than once") != std::string::npos);

        options.matching_strategies = {StrategyId::kFuzzy, StrategyId::kExact};
        REQUIRE(validate_options(options, error));
    }

    SUBCASE("negative_limits") {
        ApplyOptions options;
        options.fuzzy_scan_lines = -1;
        REQUIRE_FALSE(validate_options(options, error));

        options.fuzzy_scan_lines = 0;
        options.preview_length = -1;
        REQUIRE_FALSE(validate_options(options, error));
    }
}
