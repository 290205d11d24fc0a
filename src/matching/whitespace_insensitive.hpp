#pragma once

#include "strategy.hpp"

namespace mender {

/*
    Compare with every whitespace run, line breaks included, collapsed to a
    single space. Similarity 1.0.

    Only runs of whole content lines are considered: a window starts on a
    non-blank line and grows line by line until its collapsed text is at
    least as long as the collapsed search text. The span covers the window
    from the start of its first line to the end of its last, so the
    replacement brings its own indentation, re-based onto the window's.
*/
class WhitespaceInsensitiveStrategy : public MatchingStrategy {
   public:
    StrategyId
    id() const override {
        return StrategyId::kWhitespaceInsensitive;
    }

    std::vector<MatchCandidate>
    find(const MatchInput& input) const override;

    std::string
    prepare_replacement(const MatchCandidate& candidate,
                        const std::string& search_text,
                        const std::string& replace_text,
                        std::vector<std::string>& warnings) const override;
};

}  // namespace mender
