#include "options.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

using namespace mender;

ApplyOptions
ApplyOptions::realtime_corrector() {
    ApplyOptions options;
    options.fuzzy_threshold = kRealtimeCorrectorThreshold;
    return options;
}

namespace {

std::string
first_problem(const ApplyOptions& options) {
    if (std::isnan(options.fuzzy_threshold) || options.fuzzy_threshold <= 0.0 || options.fuzzy_threshold > 1.0) {
        return fmt::format("fuzzy threshold must be in (0, 1], got {}", options.fuzzy_threshold);
    }

    if (options.matching_strategies.empty()) {
        return "at least one matching strategy is required";
    }

    const auto& strategies = options.matching_strategies;
    for (auto it = strategies.begin(); it != strategies.end(); ++it) {
        if (*it == StrategyId::kInvalid) {
            return "invalid matching strategy";
        }
        if (std::find(strategies.begin(), it, *it) != it) {
            return fmt::format("matching strategy '{}' is listed more than once", to_string(*it));
        }
    }

    if (options.fuzzy_scan_lines < 0) {
        return fmt::format("fuzzy scan lines must not be negative, got {}", options.fuzzy_scan_lines);
    }

    if (options.preview_length < 0) {
        return fmt::format("preview length must not be negative, got {}", options.preview_length);
    }

    return {};
}

}  // namespace

bool
mender::validate_options(const ApplyOptions& options, std::string& error) {
    error = first_problem(options);
    return error.empty();
}
