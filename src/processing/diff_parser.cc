#include "diff_parser.hpp"

#include "util/trace.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <vector>

using namespace mender;

const char* const mender::kSearchMarker = "<<<<<<< SEARCH";
const char* const mender::kSeparatorMarker = "=======";
const char* const mender::kReplaceMarker = ">>>>>>> REPLACE";

void
DiffParseResult::set_error(uint32_t at_line, std::size_t at_offset, std::string error_message) {
    kind = ErrorKind::ParseError;
    line = at_line;
    offset = at_offset;
    error = fmt::format("line {}: {}", at_line, error_message);
}

namespace {

enum class State {
    FreeText,
    Search,
    Replace,
};

enum class Marker {
    None,
    Search,
    Separator,
    Replace,
};

std::string_view
right_trim(std::string_view s) {
    auto end = s.find_last_not_of(" \t\r\f\v");
    return (end == std::string_view::npos) ? std::string_view{} : s.substr(0, end + 1);
}

Marker
classify(std::string_view line) {
    auto trimmed = right_trim(line);
    if (trimmed == kSearchMarker) {
        return Marker::Search;
    } else if (trimmed == kSeparatorMarker) {
        return Marker::Separator;
    } else if (trimmed == kReplaceMarker) {
        return Marker::Replace;
    }
    return Marker::None;
}

std::optional<std::string>
comment_from(std::string_view line) {
    auto trimmed = right_trim(line);
    auto start = trimmed.find_first_not_of(" \t");
    if (start == std::string_view::npos || trimmed[start] != '#') {
        return std::nullopt;
    }
    trimmed.remove_prefix(start);
    while (!trimmed.empty() && trimmed.front() == '#') {
        trimmed.remove_prefix(1);
    }
    auto text_start = trimmed.find_first_not_of(" \t");
    if (text_start == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(trimmed.substr(text_start));
}

std::string
join(const std::vector<std::string_view>& lines) {
    std::string text;
    for (std::size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            text += '\n';
        }
        text.append(lines[i].data(), lines[i].size());
    }
    return text;
}

}  // namespace

bool
mender::parse_diff(const std::string& diff_text, DiffParseResult& result, std::vector<DiffBlock>& blocks) {
    blocks.clear();
    result = DiffParseResult{};

    State state = State::FreeText;
    std::optional<std::string> pending_comment;
    std::vector<std::string_view> search_lines;
    std::vector<std::string_view> replace_lines;
    uint32_t block_line = 0;
    std::size_t block_offset = 0;

    std::string_view text{diff_text};
    uint32_t line_number = 0;
    std::size_t offset = 0;
    while (offset <= text.size()) {
        auto newline = text.find('\n', offset);
        auto end = newline == std::string_view::npos ? text.size() : newline;
        auto line = text.substr(offset, end - offset);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        line_number++;

        auto marker = classify(line);
        switch (state) {
            case State::FreeText: {
                if (marker == Marker::Search) {
                    state = State::Search;
                    block_line = line_number;
                    block_offset = offset;
                    search_lines.clear();
                    replace_lines.clear();
                    MENDER_TRACE("diff_parser: block {} opens at line {}\n", blocks.size() + 1, line_number);
                } else if (auto comment = comment_from(line); comment) {
                    pending_comment = comment;
                }
                // Stray separator/replace markers outside a block are free text too.
            } break;
            case State::Search: {
                if (marker == Marker::Separator) {
                    state = State::Replace;
                } else if (marker == Marker::Search) {
                    result.set_error(line_number, offset,
                                     fmt::format("unexpected '{}'; block opened at line {} has no '{}'",
                                                 kSearchMarker, block_line, kSeparatorMarker));
                    return false;
                } else if (marker == Marker::Replace) {
                    result.set_error(line_number, offset,
                                     fmt::format("'{}' before '{}' in block opened at line {}", kReplaceMarker,
                                                 kSeparatorMarker, block_line));
                    return false;
                } else {
                    search_lines.push_back(line);
                }
            } break;
            case State::Replace: {
                if (marker == Marker::Replace) {
                    DiffBlock block;
                    block.index = static_cast<int>(blocks.size()) + 1;
                    block.search_text = join(search_lines);
                    block.replace_text = join(replace_lines);
                    block.comment = std::move(pending_comment);
                    block.line_number = block_line;
                    blocks.push_back(std::move(block));

                    pending_comment.reset();
                    state = State::FreeText;
                } else if (marker == Marker::None) {
                    replace_lines.push_back(line);
                } else {
                    result.set_error(line_number, offset,
                                     fmt::format("unexpected '{}'; block opened at line {} has no '{}'",
                                                 marker == Marker::Search ? kSearchMarker : kSeparatorMarker,
                                                 block_line, kReplaceMarker));
                    return false;
                }
            } break;
        }

        if (newline == std::string_view::npos) {
            break;
        }
        offset = newline + 1;
    }

    if (state == State::Search) {
        result.set_error(block_line, block_offset,
                         fmt::format("block is missing '{}' and '{}'", kSeparatorMarker, kReplaceMarker));
        return false;
    }
    if (state == State::Replace) {
        result.set_error(block_line, block_offset, fmt::format("block is missing '{}'", kReplaceMarker));
        return false;
    }

    return true;
}
