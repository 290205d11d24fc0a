#include "strategy.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

using namespace mender;

StrategyId
mender::strategy_from_string(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    std::replace(s.begin(), s.end(), '_', '-');
    if (s == "exact" || s == "e") {
        return StrategyId::kExact;
    } else if (s == "whitespace" || s == "whitespace-insensitive" || s == "w") {
        return StrategyId::kWhitespaceInsensitive;
    } else if (s == "indentation" || s == "indentation-preserving" || s == "i") {
        return StrategyId::kIndentationPreserving;
    } else if (s == "fuzzy" || s == "f") {
        return StrategyId::kFuzzy;
    }
    return StrategyId::kInvalid;
}

std::string
mender::to_string(StrategyId id) {
    switch (id) {
        case StrategyId::kExact:
            return "exact";
        case StrategyId::kWhitespaceInsensitive:
            return "whitespace";
        case StrategyId::kIndentationPreserving:
            return "indentation";
        case StrategyId::kFuzzy:
            return "fuzzy";
        case StrategyId::kInvalid:
            /* fall-through */
        default:
            return "invalid";
    }
}

std::string
mender::describe_lines(uint32_t start_line, uint32_t end_line) {
    if (start_line == end_line) {
        return fmt::format("line {}", start_line);
    }
    return fmt::format("lines {}-{}", start_line, end_line);
}

MatchCandidate
MatchingStrategy::span_candidate(std::size_t start_offset, std::size_t end_offset, double similarity) {
    MatchCandidate candidate;
    candidate.start_offset = start_offset;
    candidate.end_offset = end_offset;
    candidate.similarity = similarity;
    return candidate;
}

MatchCandidate
MatchingStrategy::window_candidate(gsl::span<const Line> window, double similarity) {
    return span_candidate(window[0].offset, window[window.size() - 1].end_offset(), similarity);
}

std::vector<MatchCandidate>
MatchingStrategy::produce_candidates(const MatchInput& input) const {
    auto candidates = find(input);

    const auto& lines = input.content_lines;
    for (auto& candidate : candidates) {
        candidate.strategy = id();
        candidate.matched_text =
            input.content.substr(candidate.start_offset, candidate.end_offset - candidate.start_offset);

        // A span ending right after a '\n' does not reach into the next line.
        auto last = candidate.end_offset > candidate.start_offset ? candidate.end_offset - 1 : candidate.end_offset;
        candidate.start_line = lines[line_index_at(lines, candidate.start_offset)].line_number;
        candidate.end_line = lines[line_index_at(lines, last)].line_number;
    }
    return candidates;
}

std::string
MatchingStrategy::prepare_replacement(const MatchCandidate& /*candidate*/,
                                      const std::string& /*search_text*/,
                                      const std::string& replace_text,
                                      std::vector<std::string>& /*warnings*/) const {
    return replace_text;
}
