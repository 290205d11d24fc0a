#pragma once

#include "matching/strategy.hpp"

#include <string>
#include <vector>

namespace mender {

// Minimum similarity gap between the best and the second best candidate
// for the best one to be accepted on score alone.
constexpr double kAmbiguityMargin = 0.05;

constexpr double kDefaultFuzzyThreshold = 0.8;
constexpr double kRealtimeCorrectorThreshold = 0.87;

// Per-call configuration. Passed by value into every call; there is no
// process-wide default instance.
struct ApplyOptions {
    // Fail the whole call, content untouched, on the first failing block.
    bool strict = false;

    bool enable_telemetry = false;

    std::vector<StrategyId> matching_strategies = {
        StrategyId::kExact,
        StrategyId::kWhitespaceInsensitive,
        StrategyId::kIndentationPreserving,
        StrategyId::kFuzzy,
    };

    // In (0, 1]. A fuzzy window scoring exactly the threshold is accepted.
    double fuzzy_threshold = kDefaultFuzzyThreshold;

    // The fuzzy scan costs O(windows * len(search) * len(window)). A value
    // above zero limits it to this many lines centred on the position hint,
    // or to the first lines of the content when there is no hint.
    int fuzzy_scan_lines = 0;

    // Characters of search text kept in failure previews.
    int preview_length = 100;

    // Stricter preset used for correction passes.
    static ApplyOptions
    realtime_corrector();
};

// Returns false and describes the first problem found when the options
// are unusable.
bool
validate_options(const ApplyOptions& options, std::string& error);

}  // namespace mender
