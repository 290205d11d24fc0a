#pragma once

/*
    Apply a search/replace diff to a piece of text.

    Blocks run strictly in diff order. Each one is matched against the
    content as left by the blocks before it:

        Pending -> Matching -> Matched -> Applying -> Applied
                            -> Unmatched -> Failed (NoMatchFound)
                            -> AmbiguousSet -> Failed (Ambiguous)

    A call owns all of its state; nothing is shared between calls.
*/

#include "apply/options.hpp"
#include "matching/strategy.hpp"
#include "util/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mender {

enum class BlockStatus {
    Applied,
    Failed,
};

std::string
to_string(BlockStatus status);

struct CandidatePreview {
    StrategyId strategy = StrategyId::kInvalid;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    double similarity = 0.0;
};

struct BlockResult {
    int index = 0;
    BlockStatus status = BlockStatus::Applied;

    std::optional<StrategyId> strategy_used;
    std::optional<double> similarity;

    // Set on failure.
    std::optional<ErrorKind> error_kind;
    std::string error;
    std::string search_preview;
    std::vector<CandidatePreview> candidate_previews;

    std::vector<std::string> warnings;
};

struct TelemetryEntry {
    int block_index = 0;
    BlockStatus status = BlockStatus::Applied;
    std::optional<StrategyId> strategy;
    std::optional<double> similarity;
    std::size_t candidate_count = 0;
    int strategies_tried = 0;
    int64_t elapsed_us = 0;
};

struct ApplyResults {
    int blocks_total = 0;
    int blocks_applied = 0;
    int blocks_failed = 0;

    // Every block, in diff order.
    std::vector<BlockResult> blocks;
    std::vector<BlockResult> failed_blocks;

    // Block warnings, prefixed with "block N: ".
    std::vector<std::string> warnings;
};

struct ApplyDiffResult {
    std::string content;
    ApplyResults results;

    // Only with ApplyOptions::enable_telemetry.
    std::optional<std::vector<TelemetryEntry>> telemetry;
};

// Why a call failed as a whole.
struct ApplyError {
    ErrorKind kind = ErrorKind::None;

    // Failing block (1-based); 0 when no block was involved.
    int block_index = 0;

    std::string message;
    std::string search_preview;
    std::vector<CandidatePreview> candidates;

    // ParseError position within the diff text.
    uint32_t line = 0;

    bool
    is_ok() const {
        return kind == ErrorKind::None;
    }
};

// Returns false on ParseError and InvalidOptions, and in strict mode on
// the first block that fails. `result.content` is then the unmodified
// source. In non-strict mode block failures are only recorded in
// `result.results`.
bool
apply_diff(const std::string& source,
           const std::string& diff_text,
           const ApplyOptions& options,
           ApplyDiffResult& result,
           ApplyError& error);

// First `length` bytes of `text`, cut on a UTF-8 boundary, with "..."
// appended when something was cut.
std::string
make_preview(const std::string& text, int length);

}  // namespace mender
