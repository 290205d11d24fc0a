#pragma once

/*
    Run the configured matching strategies, most literal first, and rank
    what the first successful one found.

    Once a strategy yields at least one candidate the remaining strategies
    are skipped for that block: an exact hit is never diluted by fuzzy
    near-misses.
*/

#include "apply/options.hpp"
#include "matching/strategy.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mender {

struct ChainResult {
    std::vector<MatchCandidate> candidates;  // ranked, best first

    // Strategy that produced the candidates, if any did.
    std::optional<StrategyId> strategy;

    int strategies_tried = 0;
};

std::unique_ptr<MatchingStrategy>
make_strategy(StrategyId id, const ApplyOptions& options);

// Similarity descending, then distance to the hint, then document order.
void
rank_candidates(std::vector<MatchCandidate>& candidates, std::optional<std::size_t> position_hint);

class MatchingStrategyChain {
   public:
    // Options must have passed validate_options().
    explicit MatchingStrategyChain(const ApplyOptions& options);

    // Content is rescanned on every call; nothing is cached between blocks.
    ChainResult
    find(const std::string& content, const std::string& search_text, std::optional<std::size_t> position_hint) const;

    // Ask the strategy that produced `candidate` for the text to splice in.
    std::string
    prepare_replacement(const MatchCandidate& candidate,
                        const std::string& search_text,
                        const std::string& replace_text,
                        std::vector<std::string>& warnings) const;

    std::size_t
    size() const {
        return strategies_.size();
    }

   private:
    std::vector<std::unique_ptr<MatchingStrategy>> strategies_;
};

}  // namespace mender
