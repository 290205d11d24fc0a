#pragma once

/*
    A matching strategy looks for a block's search text in the current
    content and returns every location it considers a match.

    Strategies are ordered from literal to lenient. The chain runs them in
    the configured order and stops at the first one that finds anything.
*/

#include "util/readlines.hpp"

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mender {

enum class StrategyId {
    kInvalid,
    kExact,
    kWhitespaceInsensitive,
    kIndentationPreserving,
    kFuzzy,
};

StrategyId
strategy_from_string(std::string s);

std::string
to_string(StrategyId id);

// "line 3" or "lines 3-5"; line numbers are 1-based.
std::string
describe_lines(uint32_t start_line, uint32_t end_line);

struct MatchCandidate {
    StrategyId strategy = StrategyId::kInvalid;

    // Position of the producing strategy in the chain; 0 is tried first.
    int priority = 0;

    // matched_text == content.substr(start_offset, end_offset - start_offset)
    std::size_t start_offset = 0;
    std::size_t end_offset = 0;
    std::string matched_text;

    double similarity = 0.0;

    // 1-based, inclusive.
    uint32_t start_line = 0;
    uint32_t end_line = 0;
};

// A strategy's view of one block against the current content.
struct MatchInput {
    const std::string& content;
    gsl::span<const Line> content_lines;

    const std::string& search_text;
    gsl::span<const Line> search_lines;

    // Offset of the previously applied block, if any.
    std::optional<std::size_t> position_hint;
};

class MatchingStrategy {
   public:
    virtual ~MatchingStrategy() = default;

    virtual StrategyId
    id() const = 0;

    // Fill in the span of every match. Offsets only; the rest of the
    // candidate is completed by produce_candidates().
    virtual std::vector<MatchCandidate>
    find(const MatchInput& input) const = 0;

    std::vector<MatchCandidate>
    produce_candidates(const MatchInput& input) const;

    // Text to splice in place of `candidate`. Strategies that tolerate a
    // different layout may adapt the replacement to what was matched.
    virtual std::string
    prepare_replacement(const MatchCandidate& candidate,
                        const std::string& search_text,
                        const std::string& replace_text,
                        std::vector<std::string>& warnings) const;

   protected:
    static MatchCandidate
    span_candidate(std::size_t start_offset, std::size_t end_offset, double similarity);

    static MatchCandidate
    window_candidate(gsl::span<const Line> window, double similarity);
};

}  // namespace mender
