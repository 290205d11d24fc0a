#include "exact.hpp"

using namespace mender;

std::vector<MatchCandidate>
ExactStrategy::find(const MatchInput& input) const {
    std::vector<MatchCandidate> candidates;

    const auto& content = input.content;
    const auto& search = input.search_text;
    if (search.empty()) {
        candidates.push_back(span_candidate(content.size(), content.size(), 1.0));
        return candidates;
    }

    for (auto pos = content.find(search); pos != std::string::npos; pos = content.find(search, pos + 1)) {
        candidates.push_back(span_candidate(pos, pos + search.size(), 1.0));
    }
    return candidates;
}
