#include "whitespace_insensitive.hpp"

#include "indentation_preserving.hpp"
#include "processing/whitespace.hpp"

using namespace mender;

std::vector<MatchCandidate>
WhitespaceInsensitiveStrategy::find(const MatchInput& input) const {
    std::vector<MatchCandidate> candidates;

    const auto needle = collapse_whitespace(input.search_text);
    if (needle.empty()) {
        return candidates;
    }

    const auto& lines = input.content_lines;
    for (std::size_t first = 0; first < lines.size(); first++) {
        if (lines[first].is_blank()) {
            continue;
        }

        std::string window = collapse_whitespace(lines[first].line);
        std::size_t last = first;
        while (window.size() < needle.size() && needle.compare(0, window.size(), window) == 0) {
            auto next = last + 1;
            while (next < lines.size() && lines[next].is_blank()) {
                next++;
            }
            if (next == lines.size()) {
                break;
            }
            window += ' ';
            window += collapse_whitespace(lines[next].line);
            last = next;
        }

        if (window == needle) {
            candidates.push_back(window_candidate(lines.subspan(first, last - first + 1), 1.0));
        }
    }
    return candidates;
}

std::string
WhitespaceInsensitiveStrategy::prepare_replacement(const MatchCandidate& candidate,
                                                   const std::string& search_text,
                                                   const std::string& replace_text,
                                                   std::vector<std::string>& warnings) const {
    return rebase_replacement(candidate, search_text, replace_text, warnings);
}
