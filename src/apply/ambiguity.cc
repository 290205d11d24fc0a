#include "ambiguity.hpp"

#include "apply/options.hpp"

#include <algorithm>

using namespace mender;

namespace {

// Similarities are ratios of small integers; don't let the last bit of a
// double decide whether a gap of exactly the margin counts.
constexpr double kEpsilon = 1e-9;

}  // namespace

ResolveResult
mender::resolve_ambiguity(const std::vector<MatchCandidate>& ranked) {
    ResolveResult result;

    if (ranked.empty()) {
        result.resolution = Resolution::NoMatch;
        return result;
    }

    const auto& top = ranked[0];
    if (ranked.size() == 1) {
        result.resolution = Resolution::Accepted;
        result.accepted = top;
        return result;
    }

    const auto& runner_up = ranked[1];
    bool clear_winner = top.similarity - runner_up.similarity >= kAmbiguityMargin - kEpsilon;

    bool more_literal = std::all_of(ranked.begin() + 1, ranked.end(),
                                    [&](const MatchCandidate& other) { return top.priority < other.priority; });

    if (clear_winner || more_literal) {
        result.resolution = Resolution::Accepted;
        result.accepted = top;
        return result;
    }

    result.resolution = Resolution::Ambiguous;
    for (const auto& candidate : ranked) {
        if (top.similarity - candidate.similarity < kAmbiguityMargin - kEpsilon) {
            result.tied.push_back(candidate);
        }
    }
    return result;
}
