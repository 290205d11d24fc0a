#pragma once

/*
    Split LLM-authored diff text into search/replace blocks.

        # optional commentary, attached to the next block
        <<<<<<< SEARCH
        text to find
        =======
        text to put there instead
        >>>>>>> REPLACE

    Marker lines must match exactly; only trailing whitespace (and the '\r'
    of a CRLF line ending) is tolerated. Anything outside a block is free
    text and ignored. Leniency belongs to the matching strategies, not here.
*/

#include "util/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mender {

extern const char* const kSearchMarker;
extern const char* const kSeparatorMarker;
extern const char* const kReplaceMarker;

struct DiffBlock {
    int index;  // 1-based, in diff order
    std::string search_text;
    std::string replace_text;
    std::optional<std::string> comment;

    // Line of the search marker within the diff text.
    uint32_t line_number = 0;
};

struct DiffParseResult {
    ErrorKind kind = ErrorKind::None;
    std::string error;

    // Where the problem was detected (1-based line, byte offset).
    uint32_t line = 0;
    std::size_t offset = 0;

    bool
    is_ok() const {
        return kind == ErrorKind::None;
    }

    void
    set_error(uint32_t at_line, std::size_t at_offset, std::string error_message);
};

// Returns false on malformed markers. Zero blocks is not an error.
bool
parse_diff(const std::string& diff_text, DiffParseResult& result, std::vector<DiffBlock>& blocks);

}  // namespace mender
