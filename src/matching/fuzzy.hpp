#pragma once

#include "strategy.hpp"

#include <string_view>
#include <vector>

namespace mender {

/*
    Edit-distance matching over whitespace-normalized line windows.

    Every window of content lines with the same line count as the search
    text is scored

        similarity = (max_len - edit_distance) / max_len

    and kept when similarity >= threshold.

    A search text of a single non-blank line carries no surrounding context,
    so its window must also contain all but at most one of the search's
    words (runs of letters, digits and '_'). "const x = 1;" is not a near
    miss of "const y = 2;" however close the characters are.

    The scan is O(windows * len(search) * len(window)). `scan_lines` > 0
    bounds it: to that many lines centred on the position hint, or to the
    first `scan_lines` lines of the content when there is no hint yet.
*/
class FuzzyStrategy : public MatchingStrategy {
   public:
    FuzzyStrategy(double threshold, int scan_lines) : threshold_(threshold), scan_lines_(scan_lines) {
    }

    StrategyId
    id() const override {
        return StrategyId::kFuzzy;
    }

    std::vector<MatchCandidate>
    find(const MatchInput& input) const override;

    // Re-bases the replacement like the other line-window strategies and
    // always records that a fuzzy match was used.
    std::string
    prepare_replacement(const MatchCandidate& candidate,
                        const std::string& search_text,
                        const std::string& replace_text,
                        std::vector<std::string>& warnings) const override;

   private:
    double threshold_;
    int scan_lines_;
};

// Words of `text`, in order. Bytes >= 0x80 count as word characters so
// UTF-8 identifiers stay whole.
std::vector<std::string_view>
split_words(std::string_view text);

// How many of `search`'s words (with multiplicity) `window` lacks.
std::size_t
count_missing_words(std::string_view search, std::string_view window);

}  // namespace mender
