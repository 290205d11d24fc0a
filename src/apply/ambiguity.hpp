#pragma once

/*
    Decide whether a block's best candidate is safe to apply.

      0 candidates   -> NoMatch
      1 candidate    -> Accepted
      2+ candidates  -> Accepted if the best one beats the runner-up by at
                        least kAmbiguityMargin, or comes from a strictly
                        more literal strategy than every other candidate.
                        Otherwise Ambiguous.

    Repetitive code (the same loop body twice, differing only in names) is
    reported, never resolved to an arbitrary occurrence.
*/

#include "matching/strategy.hpp"

#include <optional>
#include <vector>

namespace mender {

enum class Resolution {
    Accepted,
    NoMatch,
    Ambiguous,
};

struct ResolveResult {
    Resolution resolution = Resolution::NoMatch;
    std::optional<MatchCandidate> accepted;

    // On Ambiguous: every candidate within the margin of the best one.
    std::vector<MatchCandidate> tied;
};

// `ranked` must be ordered best first (see rank_candidates).
ResolveResult
resolve_ambiguity(const std::vector<MatchCandidate>& ranked);

}  // namespace mender
