#include "report.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

using namespace mender;

namespace {

std::string
format_percent(double similarity) {
    return fmt::format("{:.1f}%", similarity * 100.0);
}

void
render_candidates(const std::vector<CandidatePreview>& candidates, std::vector<std::string>& out) {
    for (const auto& c : candidates) {
        out.push_back(fmt::format("    at {} ({} {})\n", describe_lines(c.start_line, c.end_line),
                                  to_string(c.strategy), format_percent(c.similarity)));
    }
}

void
render_preview(const std::string& preview, std::vector<std::string>& out) {
    if (preview.empty()) {
        out.push_back("    search text: (empty)\n");
        return;
    }
    out.push_back("    search text:\n");
    std::vector<Line> lines;
    parselines(preview, lines);
    for (const auto& line : lines) {
        out.push_back(fmt::format("    | {}\n", line.line));
    }
}

}  // namespace

std::vector<std::string>
mender::render_report(const ApplyDiffResult& result) {
    std::vector<std::string> out;
    const auto& results = result.results;

    out.push_back(fmt::format("applied {} of {} block{}, {} failed\n", results.blocks_applied, results.blocks_total,
                              results.blocks_total == 1 ? "" : "s", results.blocks_failed));

    for (const auto& block : results.failed_blocks) {
        out.push_back(fmt::format("block {}: {}: {}\n", block.index,
                                  to_string(block.error_kind.value_or(ErrorKind::None)), block.error));
        render_candidates(block.candidate_previews, out);
        render_preview(block.search_preview, out);
    }

    if (!results.warnings.empty()) {
        out.push_back("warnings:\n");
        for (const auto& warning : results.warnings) {
            out.push_back(fmt::format("    {}\n", warning));
        }
    }
    return out;
}

std::vector<std::string>
mender::render_telemetry(const ApplyDiffResult& result) {
    std::vector<std::string> out;
    if (!result.telemetry) {
        return out;
    }

    for (const auto& entry : *result.telemetry) {
        out.push_back(fmt::format("block {}: {} strategy={} candidates={} similarity={} tried={} elapsed={}us\n",
                                  entry.block_index, to_string(entry.status),
                                  entry.strategy ? to_string(*entry.strategy) : "-", entry.candidate_count,
                                  entry.similarity ? fmt::format("{:.3f}", *entry.similarity) : "-",
                                  entry.strategies_tried, entry.elapsed_us));
    }
    return out;
}

std::vector<std::string>
mender::render_error(const ApplyError& error) {
    std::vector<std::string> out;
    if (error.is_ok()) {
        return out;
    }

    out.push_back(fmt::format("{}: {}\n", to_string(error.kind), error.message));
    if (error.block_index > 0) {
        render_candidates(error.candidates, out);
        render_preview(error.search_preview, out);
    }
    return out;
}
