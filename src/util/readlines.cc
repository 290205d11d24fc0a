#include "util/readlines.hpp"

#include "util/hash.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace internal {

bool
is_blank_char(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

mender::Line
make_line(uint32_t line_number, std::size_t offset, std::string text) {
    mender::Line line{line_number, 0, offset, std::move(text), 0, 0, 0};

    std::size_t i = 0;
    while (i < line.line.size() && is_blank_char(line.line[i])) {
        line.indentation_level += (line.line[i] == '\t') ? 4 : 1;
        i++;
    }
    line.indent_length = i;

    std::size_t end = line.line.size();
    while (end > i && is_blank_char(line.line[end - 1])) {
        end--;
    }
    line.body_length = end - i;

    auto body = line.body();
    line.checksum = mender::hash::hash(body.data(), body.size());
    return line;
}

}  // namespace internal

void
mender::parselines(const std::string& input_text, std::vector<Line>& lines) {
    lines.clear();

    uint32_t line_number = 1;
    std::size_t start = 0;
    while (true) {
        auto newline = input_text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(internal::make_line(line_number, start, input_text.substr(start)));
            break;
        }
        lines.push_back(internal::make_line(line_number, start, input_text.substr(start, newline - start)));
        start = newline + 1;
        line_number++;
    }
}

std::size_t
mender::line_index_at(gsl::span<const Line> lines, std::size_t offset) {
    // First line starting after `offset`, minus one.
    auto it = std::upper_bound(lines.begin(), lines.end(), offset,
                               [](std::size_t value, const Line& line) { return value < line.offset; });
    if (it == lines.begin()) {
        return 0;
    }
    return static_cast<std::size_t>(it - lines.begin()) - 1;
}

bool
mender::readfile(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = path == "-" ? stdin : fopen(path.c_str(), "rb");
    if (!stream) {
        return false;
    }

    char buffer[16 * 1024];
    std::size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        contents.append(buffer, count);
    }

    bool ok = ferror(stream) == 0;
    if (stream != stdin) {
        fclose(stream);
    }
    return ok;
}

bool
mender::writefile(const std::string& path, const std::string& contents) {
    FILE* stream = fopen(path.c_str(), "wb");
    if (!stream) {
        return false;
    }
    bool ok = fwrite(contents.data(), 1, contents.size(), stream) == contents.size();
    ok = (fclose(stream) == 0) && ok;
    return ok;
}
