#pragma once

#include "strategy.hpp"

#include <string_view>
#include <vector>

namespace mender {

/*
    Line-for-line comparison that ignores how a block is indented, as long
    as its shape is the same.

    Each line's indentation is taken relative to the least indented
    non-blank line and divided by the greatest common divisor of all
    relative indents. A block indented with two spaces per level and the
    same block indented with a tab per level both become 0, 1, 2, ...
    Line bodies must be equal, spacing inside a line included; trailing
    whitespace is ignored.
*/
class IndentationPreservingStrategy : public MatchingStrategy {
   public:
    StrategyId
    id() const override {
        return StrategyId::kIndentationPreserving;
    }

    std::vector<MatchCandidate>
    find(const MatchInput& input) const override;

    // Shift the replacement from the search text's base indentation to the
    // matched window's, with a warning, when the two differ.
    std::string
    prepare_replacement(const MatchCandidate& candidate,
                        const std::string& search_text,
                        const std::string& replace_text,
                        std::vector<std::string>& warnings) const override;
};

// Canonical indentation levels of `lines`; blank lines get level 0.
std::vector<int>
relative_indent_levels(gsl::span<const Line> lines);

// Leading whitespace of the least indented non-blank line.
std::string_view
base_indentation(gsl::span<const Line> lines);

// Lines of `text` starting with `from` have it replaced by `to`. Blank
// lines are left alone.
std::string
reindent(const std::string& text, std::string_view from, std::string_view to);

// "4 spaces", "1 tab", "none", ...
std::string
describe_indentation(std::string_view indentation);

// Re-base `replace_text` from the base indentation of `search_text` to the
// base indentation of the matched window. Records a warning when it does.
// Shared by every strategy whose span covers whole lines and tolerates a
// different indentation.
std::string
rebase_replacement(const MatchCandidate& candidate,
                   const std::string& search_text,
                   const std::string& replace_text,
                   std::vector<std::string>& warnings);

}  // namespace mender
