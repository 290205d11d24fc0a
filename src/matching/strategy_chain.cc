#include "strategy_chain.hpp"

#include "matching/exact.hpp"
#include "matching/fuzzy.hpp"
#include "matching/indentation_preserving.hpp"
#include "matching/whitespace_insensitive.hpp"
#include "util/readlines.hpp"
#include "util/trace.hpp"

#include <algorithm>

using namespace mender;

std::unique_ptr<MatchingStrategy>
mender::make_strategy(StrategyId id, const ApplyOptions& options) {
    switch (id) {
        case StrategyId::kExact:
            return std::make_unique<ExactStrategy>();
        case StrategyId::kWhitespaceInsensitive:
            return std::make_unique<WhitespaceInsensitiveStrategy>();
        case StrategyId::kIndentationPreserving:
            return std::make_unique<IndentationPreservingStrategy>();
        case StrategyId::kFuzzy:
            return std::make_unique<FuzzyStrategy>(options.fuzzy_threshold, options.fuzzy_scan_lines);
        case StrategyId::kInvalid:
            /* fall-through */
        default:
            return nullptr;
    }
}

void
mender::rank_candidates(std::vector<MatchCandidate>& candidates, std::optional<std::size_t> position_hint) {
    auto distance = [&](const MatchCandidate& c) -> std::size_t {
        if (!position_hint) {
            return 0;
        }
        return c.start_offset > *position_hint ? c.start_offset - *position_hint : *position_hint - c.start_offset;
    };

    std::stable_sort(candidates.begin(), candidates.end(), [&](const MatchCandidate& a, const MatchCandidate& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        if (a.priority != b.priority) {
            return a.priority < b.priority;
        }
        auto da = distance(a);
        auto db = distance(b);
        if (da != db) {
            return da < db;
        }
        return a.start_offset < b.start_offset;
    });
}

MatchingStrategyChain::MatchingStrategyChain(const ApplyOptions& options) {
    for (auto id : options.matching_strategies) {
        if (auto strategy = make_strategy(id, options); strategy) {
            strategies_.push_back(std::move(strategy));
        }
    }
}

ChainResult
MatchingStrategyChain::find(const std::string& content,
                            const std::string& search_text,
                            std::optional<std::size_t> position_hint) const {
    std::vector<Line> content_lines;
    std::vector<Line> search_lines;
    parselines(content, content_lines);
    parselines(search_text, search_lines);

    MatchInput input{content, content_lines, search_text, search_lines, position_hint};

    ChainResult result;
    int priority = 0;
    for (const auto& strategy : strategies_) {
        result.strategies_tried++;
        auto candidates = strategy->produce_candidates(input);
        MENDER_TRACE("chain: {} found {} candidate(s)\n", to_string(strategy->id()), candidates.size());
        if (!candidates.empty()) {
            for (auto& candidate : candidates) {
                candidate.priority = priority;
            }
            rank_candidates(candidates, position_hint);
            result.candidates = std::move(candidates);
            result.strategy = strategy->id();
            break;
        }
        priority++;
    }
    return result;
}

std::string
MatchingStrategyChain::prepare_replacement(const MatchCandidate& candidate,
                                           const std::string& search_text,
                                           const std::string& replace_text,
                                           std::vector<std::string>& warnings) const {
    for (const auto& strategy : strategies_) {
        if (strategy->id() == candidate.strategy) {
            return strategy->prepare_replacement(candidate, search_text, replace_text, warnings);
        }
    }
    return replace_text;
}
