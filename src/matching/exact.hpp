#pragma once

#include "strategy.hpp"

namespace mender {

// Literal substring search. Every occurrence, overlapping ones included,
// is a candidate with similarity 1.0. An empty search text matches once,
// at the end of the content (pure insertion).
class ExactStrategy : public MatchingStrategy {
   public:
    StrategyId
    id() const override {
        return StrategyId::kExact;
    }

    std::vector<MatchCandidate>
    find(const MatchInput& input) const override;
};

}  // namespace mender
