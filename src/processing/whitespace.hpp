#pragma once

/*
    Whitespace normalization used by the lenient matching strategies.

    collapse_whitespace turns every run of whitespace (line breaks included)
    into a single space and trims both ends. The mapped variant remembers,
    for every character it produces, where that character came from so a
    match in normalized text can be mapped back to the original buffer.
*/

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

bool
is_whitespace(char c);

bool
is_empty(std::string_view s);

std::string_view
trim(std::string_view s);

std::string
collapse_whitespace(std::string_view text);

struct NormalizedText {
    std::string text;

    // source_offsets[i] is the offset in the source text of text[i]. For a
    // collapsed run it is the offset of the first whitespace character.
    std::vector<std::size_t> source_offsets;
};

NormalizedText
collapse_whitespace_mapped(std::string_view text, std::size_t base_offset = 0);

// Number of '\n' in text, plus one.
std::size_t
count_lines(std::string_view text);

}  // namespace mender
