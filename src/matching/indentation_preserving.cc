#include "indentation_preserving.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <climits>
#include <numeric>

using namespace mender;

namespace {

bool
same_bodies(gsl::span<const Line> a, gsl::span<const Line> b) {
    for (std::size_t i = 0; i < a.size(); i++) {
        if (a[i].is_blank() != b[i].is_blank()) {
            return false;
        }
        if (a[i].checksum != b[i].checksum || a[i].body() != b[i].body()) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::vector<int>
mender::relative_indent_levels(gsl::span<const Line> lines) {
    int base = INT_MAX;
    for (const auto& line : lines) {
        if (!line.is_blank()) {
            base = std::min(base, line.indentation_level);
        }
    }

    std::vector<int> levels(lines.size(), 0);
    if (base == INT_MAX) {
        return levels;
    }

    int unit = 0;
    for (const auto& line : lines) {
        if (!line.is_blank()) {
            unit = std::gcd(unit, line.indentation_level - base);
        }
    }

    for (std::size_t i = 0; i < lines.size(); i++) {
        if (!lines[i].is_blank() && unit > 0) {
            levels[i] = (lines[i].indentation_level - base) / unit;
        }
    }
    return levels;
}

std::string_view
mender::base_indentation(gsl::span<const Line> lines) {
    const Line* base = nullptr;
    for (const auto& line : lines) {
        if (!line.is_blank() && (!base || line.indentation_level < base->indentation_level)) {
            base = &line;
        }
    }
    return base ? base->indentation() : std::string_view{};
}

std::vector<MatchCandidate>
IndentationPreservingStrategy::find(const MatchInput& input) const {
    std::vector<MatchCandidate> candidates;

    const auto& search = input.search_lines;
    const auto& content = input.content_lines;
    const auto n = search.size();
    if (n == 0 || n > content.size()) {
        return candidates;
    }
    if (std::all_of(search.begin(), search.end(), [](const Line& line) { return line.is_blank(); })) {
        return candidates;
    }

    const auto search_levels = relative_indent_levels(search);
    for (std::size_t i = 0; i + n <= content.size(); i++) {
        auto window = content.subspan(i, n);
        if (!same_bodies(search, window)) {
            continue;
        }
        if (relative_indent_levels(window) == search_levels) {
            candidates.push_back(window_candidate(window, 1.0));
        }
    }
    return candidates;
}

std::string
mender::reindent(const std::string& text, std::string_view from, std::string_view to) {
    std::vector<Line> lines;
    parselines(text, lines);

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < lines.size(); i++) {
        std::string_view line = lines[i].line;
        if (!lines[i].is_blank() && line.substr(0, from.size()) == from) {
            out.append(to);
            out.append(line.substr(from.size()));
        } else {
            out.append(line);
        }
        if (i + 1 < lines.size()) {
            out.push_back('\n');
        }
    }
    return out;
}

std::string
mender::describe_indentation(std::string_view indentation) {
    if (indentation.empty()) {
        return "none";
    }
    auto tabs = std::count(indentation.begin(), indentation.end(), '\t');
    auto spaces = static_cast<long>(indentation.size()) - tabs;

    auto plural = [](long n, const char* what) { return fmt::format("{} {}{}", n, what, n == 1 ? "" : "s"); };
    if (tabs == 0) {
        return plural(spaces, "space");
    }
    if (spaces == 0) {
        return plural(tabs, "tab");
    }
    return fmt::format("{} + {}", plural(tabs, "tab"), plural(spaces, "space"));
}

std::string
mender::rebase_replacement(const MatchCandidate& candidate,
                           const std::string& search_text,
                           const std::string& replace_text,
                           std::vector<std::string>& warnings) {
    std::vector<Line> search_lines;
    std::vector<Line> window_lines;
    parselines(search_text, search_lines);
    parselines(candidate.matched_text, window_lines);

    auto from = base_indentation(search_lines);
    auto to = base_indentation(window_lines);
    if (from == to) {
        return replace_text;
    }

    warnings.push_back(fmt::format("replacement re-indented from {} to {} ({})",
                                   describe_indentation(from),
                                   describe_indentation(to),
                                   describe_lines(candidate.start_line, candidate.end_line)));
    return reindent(replace_text, from, to);
}

std::string
IndentationPreservingStrategy::prepare_replacement(const MatchCandidate& candidate,
                                                   const std::string& search_text,
                                                   const std::string& replace_text,
                                                   std::vector<std::string>& warnings) const {
    return rebase_replacement(candidate, search_text, replace_text, warnings);
}
