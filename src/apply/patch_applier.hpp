#pragma once

#include "matching/strategy.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mender {

struct PatchResult {
    std::string content;

    // Offset just past the inserted replacement; the next block's hint.
    std::size_t position = 0;

    std::vector<std::string> warnings;
};

// Replace [start_offset, end_offset) of `content` with `replacement`.
// Text outside the span is preserved byte for byte. An empty span at the
// end of non-empty content that lacks a final newline gets one before the
// insertion.
PatchResult
apply_patch(const std::string& content, const MatchCandidate& candidate, const std::string& replacement);

}  // namespace mender
