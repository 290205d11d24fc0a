#include "whitespace.hpp"

#include <string>
#include <vector>

using namespace mender;

bool
mender::is_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v";
    for (std::size_t i = 0; i < sizeof(whitespaces) - 1; i++) {
        if (whitespaces[i] == c) {
            return true;
        }
    }
    return false;
}

bool
mender::is_empty(std::string_view s) {
    for (char c : s) {
        if (!mender::is_whitespace(c)) {
            return false;
        }
    }
    return true;
}

std::string_view
mender::trim(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && is_whitespace(s[start])) {
        start++;
    }
    std::size_t end = s.size();
    while (end > start && is_whitespace(s[end - 1])) {
        end--;
    }
    return s.substr(start, end - start);
}

NormalizedText
mender::collapse_whitespace_mapped(std::string_view text, std::size_t base_offset) {
    NormalizedText result;
    result.text.reserve(text.size());
    result.source_offsets.reserve(text.size());

    bool pending_space = false;
    std::size_t pending_offset = 0;
    for (std::size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (is_whitespace(c)) {
            if (!pending_space) {
                pending_space = true;
                pending_offset = i;
            }
            continue;
        }

        // Leading whitespace is dropped; interior runs become one space.
        if (pending_space && !result.text.empty()) {
            result.text.push_back(' ');
            result.source_offsets.push_back(base_offset + pending_offset);
        }
        pending_space = false;

        result.text.push_back(c);
        result.source_offsets.push_back(base_offset + i);
    }

    return result;
}

std::string
mender::collapse_whitespace(std::string_view text) {
    return collapse_whitespace_mapped(text).text;
}

std::size_t
mender::count_lines(std::string_view text) {
    std::size_t count = 1;
    for (char c : text) {
        if (c == '\n') {
            count++;
        }
    }
    return count;
}
