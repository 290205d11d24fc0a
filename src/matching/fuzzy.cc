#include "fuzzy.hpp"

#include "algorithms/edit_distance.hpp"
#include "indentation_preserving.hpp"
#include "processing/whitespace.hpp"
#include "util/trace.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>

using namespace mender;

namespace {

// Words a one-line window may lack and still count as a near miss.
constexpr std::size_t kMaxMissingWordsOneLine = 1;

bool
is_word_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

std::size_t
count_non_blank(gsl::span<const Line> lines) {
    return static_cast<std::size_t>(
        std::count_if(lines.begin(), lines.end(), [](const Line& line) { return !line.is_blank(); }));
}

}  // namespace

std::vector<std::string_view>
mender::split_words(std::string_view text) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(text[i])) {
            i++;
            continue;
        }
        auto start = i;
        while (i < text.size() && is_word_char(text[i])) {
            i++;
        }
        words.push_back(text.substr(start, i - start));
    }
    return words;
}

std::size_t
mender::count_missing_words(std::string_view search, std::string_view window) {
    auto a = split_words(search);
    auto b = split_words(window);
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());

    std::vector<std::string_view> missing;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(missing));
    return missing.size();
}

std::vector<MatchCandidate>
FuzzyStrategy::find(const MatchInput& input) const {
    std::vector<MatchCandidate> candidates;

    const auto& lines = input.content_lines;
    const auto n = input.search_lines.size();
    if (n == 0 || n > lines.size()) {
        return candidates;
    }

    const auto needle = collapse_whitespace(input.search_text);
    if (needle.empty()) {
        return candidates;
    }
    const bool one_line = count_non_blank(input.search_lines) == 1;

    // Window start lines, inclusive.
    std::size_t first = 0;
    std::size_t last = lines.size() - n;
    if (scan_lines_ > 0) {
        const auto span = static_cast<std::size_t>(scan_lines_);
        if (input.position_hint) {
            const auto half = span / 2;
            const auto center = line_index_at(lines, *input.position_hint);
            first = center > half ? center - half : 0;
            last = std::min(last, center + half);
            first = std::min(first, last);
        } else {
            last = std::min(last, span - 1);
        }
    }

    MENDER_TRACE("fuzzy: scanning windows {}..{} of {} lines, threshold {}\n", first, last, n, threshold_);

    for (auto i = first; i <= last; i++) {
        auto window = lines.subspan(i, n);
        auto start = window[0].offset;
        auto end = window[n - 1].end_offset();
        auto normalized = collapse_whitespace(std::string_view(input.content).substr(start, end - start));

        auto max_len = static_cast<int64_t>(std::max(needle.size(), normalized.size()));
        auto bound = max_distance_for(threshold_, max_len);
        auto distance = edit_distance(needle, normalized, bound);
        if (distance > bound) {
            continue;
        }

        auto score = similarity_from_distance(distance, max_len);
        if (score < threshold_) {
            continue;
        }
        if (one_line && count_missing_words(needle, normalized) > kMaxMissingWordsOneLine) {
            MENDER_TRACE("fuzzy: line {} rejected, too many changed words\n", window[0].line_number);
            continue;
        }
        candidates.push_back(window_candidate(window, score));
    }
    return candidates;
}

std::string
FuzzyStrategy::prepare_replacement(const MatchCandidate& candidate,
                                   const std::string& search_text,
                                   const std::string& replace_text,
                                   std::vector<std::string>& warnings) const {
    warnings.push_back(fmt::format("applied fuzzy match at {} ({:.1f}% similar)",
                                   describe_lines(candidate.start_line, candidate.end_line),
                                   candidate.similarity * 100.0));
    return rebase_replacement(candidate, search_text, replace_text, warnings);
}
