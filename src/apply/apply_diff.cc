#include "apply_diff.hpp"

#include "apply/ambiguity.hpp"
#include "apply/patch_applier.hpp"
#include "matching/strategy_chain.hpp"
#include "processing/diff_parser.hpp"
#include "util/trace.hpp"

#include <fmt/format.h>

#include <chrono>
#include <utility>

using namespace mender;

namespace {

enum class BlockState {
    Pending,
    Matching,
    Matched,
    Unmatched,
    AmbiguousSet,
    Applying,
    Applied,
    Failed,
};

const char*
state_name(BlockState state) {
    switch (state) {
        case BlockState::Pending:
            return "Pending";
        case BlockState::Matching:
            return "Matching";
        case BlockState::Matched:
            return "Matched";
        case BlockState::Unmatched:
            return "Unmatched";
        case BlockState::AmbiguousSet:
            return "AmbiguousSet";
        case BlockState::Applying:
            return "Applying";
        case BlockState::Applied:
            return "Applied";
        case BlockState::Failed:
            return "Failed";
    }
    return "?";
}

void
transition(int block_index, BlockState& state, BlockState next) {
    MENDER_TRACE("block {}: {} -> {}\n", block_index, state_name(state), state_name(next));
    state = next;
}

// Loop state of the fold over blocks.
struct ApplyState {
    std::string content;
    std::vector<BlockResult> blocks;
    std::vector<TelemetryEntry> telemetry;

    // End of the last applied replacement.
    std::optional<std::size_t> position_hint;
};

CandidatePreview
preview_of(const MatchCandidate& candidate) {
    return CandidatePreview{candidate.strategy, candidate.start_line, candidate.end_line, candidate.similarity};
}

std::string
ambiguity_message(const std::vector<MatchCandidate>& tied) {
    std::string locations;
    for (const auto& candidate : tied) {
        if (!locations.empty()) {
            locations += ", ";
        }
        locations += fmt::format("{} ({:.1f}%)", describe_lines(candidate.start_line, candidate.end_line),
                                 candidate.similarity * 100.0);
    }
    return fmt::format("search text matches {} locations equally well: {}; include more surrounding lines to "
                       "make it unique",
                       tied.size(), locations);
}

ApplyState
apply_block(ApplyState state, const DiffBlock& block, const MatchingStrategyChain& chain, const ApplyOptions& options) {
    const auto started = std::chrono::steady_clock::now();

    BlockResult result;
    result.index = block.index;

    auto block_state = BlockState::Pending;
    transition(block.index, block_state, BlockState::Matching);

    auto found = chain.find(state.content, block.search_text, state.position_hint);
    auto resolved = resolve_ambiguity(found.candidates);

    switch (resolved.resolution) {
        case Resolution::Accepted: {
            transition(block.index, block_state, BlockState::Matched);
            const auto& candidate = *resolved.accepted;

            transition(block.index, block_state, BlockState::Applying);
            auto replacement =
                chain.prepare_replacement(candidate, block.search_text, block.replace_text, result.warnings);
            auto patch = apply_patch(state.content, candidate, replacement);

            state.content = std::move(patch.content);
            state.position_hint = patch.position;

            result.status = BlockStatus::Applied;
            result.strategy_used = candidate.strategy;
            result.similarity = candidate.similarity;
            result.warnings.insert(result.warnings.end(), patch.warnings.begin(), patch.warnings.end());
            transition(block.index, block_state, BlockState::Applied);
            break;
        }
        case Resolution::NoMatch:
            transition(block.index, block_state, BlockState::Unmatched);
            result.status = BlockStatus::Failed;
            result.error_kind = ErrorKind::NoMatchFound;
            result.error = fmt::format("search text not found (tried {} strateg{})", found.strategies_tried,
                                       found.strategies_tried == 1 ? "y" : "ies");
            transition(block.index, block_state, BlockState::Failed);
            break;
        case Resolution::Ambiguous:
            transition(block.index, block_state, BlockState::AmbiguousSet);
            result.status = BlockStatus::Failed;
            result.error_kind = ErrorKind::Ambiguous;
            result.error = ambiguity_message(resolved.tied);
            for (const auto& candidate : resolved.tied) {
                result.candidate_previews.push_back(preview_of(candidate));
            }
            transition(block.index, block_state, BlockState::Failed);
            break;
    }

    if (result.status == BlockStatus::Failed) {
        result.search_preview = make_preview(block.search_text, options.preview_length);
    }

    if (options.enable_telemetry) {
        auto elapsed = std::chrono::steady_clock::now() - started;

        TelemetryEntry entry;
        entry.block_index = block.index;
        entry.status = result.status;
        entry.strategy = found.strategy;
        entry.similarity = result.similarity;
        entry.candidate_count = found.candidates.size();
        entry.strategies_tried = found.strategies_tried;
        entry.elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
        state.telemetry.push_back(entry);
    }

    state.blocks.push_back(std::move(result));
    return state;
}

void
fill_error(const BlockResult& block, ApplyError& error) {
    error.kind = block.error_kind.value_or(ErrorKind::NoMatchFound);
    error.block_index = block.index;
    error.message = fmt::format("block {}: {}", block.index, block.error);
    error.search_preview = block.search_preview;
    error.candidates = block.candidate_previews;
}

ApplyDiffResult
finish(ApplyState state, const ApplyOptions& options) {
    ApplyDiffResult out;
    out.content = std::move(state.content);

    auto& results = out.results;
    for (auto& block : state.blocks) {
        results.blocks_total++;
        if (block.status == BlockStatus::Applied) {
            results.blocks_applied++;
        } else {
            results.blocks_failed++;
            results.failed_blocks.push_back(block);
        }
        for (const auto& warning : block.warnings) {
            results.warnings.push_back(fmt::format("block {}: {}", block.index, warning));
        }
    }
    results.blocks = std::move(state.blocks);

    if (options.enable_telemetry) {
        out.telemetry = std::move(state.telemetry);
    }
    return out;
}

}  // namespace

std::string
mender::to_string(BlockStatus status) {
    switch (status) {
        case BlockStatus::Applied:
            return "Applied";
        case BlockStatus::Failed:
            return "Failed";
    }
    return "Unknown";
}

std::string
mender::make_preview(const std::string& text, int length) {
    if (length < 0 || text.size() <= static_cast<std::size_t>(length)) {
        return text;
    }
    auto cut = static_cast<std::size_t>(length);
    // Don't split a multi-byte sequence.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut) + "...";
}

bool
mender::apply_diff(const std::string& source,
                   const std::string& diff_text,
                   const ApplyOptions& options,
                   ApplyDiffResult& result,
                   ApplyError& error) {
    result = ApplyDiffResult{};
    result.content = source;
    error = ApplyError{};

    std::string problem;
    if (!validate_options(options, problem)) {
        error.kind = ErrorKind::InvalidOptions;
        error.message = problem;
        return false;
    }

    DiffParseResult parse_result;
    std::vector<DiffBlock> blocks;
    if (!parse_diff(diff_text, parse_result, blocks)) {
        error.kind = ErrorKind::ParseError;
        error.message = parse_result.error;
        error.line = parse_result.line;
        return false;
    }

    MatchingStrategyChain chain(options);

    ApplyState state;
    state.content = source;
    for (const auto& block : blocks) {
        state = apply_block(std::move(state), block, chain, options);

        const auto& last = state.blocks.back();
        if (options.strict && last.status == BlockStatus::Failed) {
            fill_error(last, error);
            return false;
        }
    }

    result = finish(std::move(state), options);
    return true;
}
