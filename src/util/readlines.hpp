#pragma once

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

struct Line {
    uint32_t line_number;  // 1-based
    uint32_t checksum;     // of body(), i.e. without surrounding whitespace

    // Byte offset of the first character in the text the line was parsed from.
    std::size_t offset;

    // Line contents without the terminating '\n'. A '\r' is kept.
    std::string line;

    // Leading whitespace, in bytes and in columns (tab = 4 columns).
    std::size_t indent_length;
    int indentation_level;

    // Length of the line with leading and trailing whitespace removed.
    std::size_t body_length;

    std::size_t
    end_offset() const {
        return offset + line.size();
    }

    std::string_view
    body() const {
        return std::string_view(line).substr(indent_length, body_length);
    }

    std::string_view
    indentation() const {
        return std::string_view(line).substr(0, indent_length);
    }

    bool
    is_blank() const {
        return body_length == 0;
    }
};

// Split text on '\n'. Always yields count('\n') + 1 lines, so a trailing
// newline produces a final empty line and offsets can be mapped back
// exactly.
void
parselines(const std::string& input_text, std::vector<Line>& lines);

// Index of the line containing `offset`. Offsets on a line terminator
// belong to the line the terminator ends.
std::size_t
line_index_at(gsl::span<const Line> lines, std::size_t offset);

bool
readfile(const std::string& path, std::string& contents);

bool
writefile(const std::string& path, const std::string& contents);

}  // namespace mender
