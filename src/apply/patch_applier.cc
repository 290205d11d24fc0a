#include "patch_applier.hpp"

#include "util/trace.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace mender;

PatchResult
mender::apply_patch(const std::string& content, const MatchCandidate& candidate, const std::string& replacement) {
    PatchResult result;

    const auto start = std::min(candidate.start_offset, content.size());
    const auto end = std::max(start, std::min(candidate.end_offset, content.size()));

    std::string inserted = replacement;
    bool appending = start == end && end == content.size();
    if (appending && !content.empty() && content.back() != '\n' && !inserted.empty()) {
        inserted.insert(inserted.begin(), '\n');
    }

    if (content.compare(start, end - start, inserted) == 0) {
        result.warnings.push_back(
            fmt::format("no-op replacement at {}: text is already in place", describe_lines(candidate.start_line, candidate.end_line)));
    }

    result.content.reserve(content.size() - (end - start) + inserted.size());
    result.content.append(content, 0, start);
    result.content.append(inserted);
    result.content.append(content, end, std::string::npos);
    result.position = start + inserted.size();

    MENDER_TRACE("patch: [{}, {}) -> {} byte(s)\n", start, end, inserted.size());
    return result;
}
