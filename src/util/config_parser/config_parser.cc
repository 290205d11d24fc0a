#include "config_parser.hpp"

#include "util/trace.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <tuple>

using namespace mender;

namespace internal {

constexpr int kMaxArrayDepth = 16;

std::tuple<std::string_view, std::string_view>
str_split2(const std::string_view s, char delimiter) {
    auto pos = s.find(delimiter);
    if (pos == std::string::npos) {
        return std::make_tuple(s, std::string_view{});
    }
    return std::make_tuple(s.substr(0, pos), s.substr(pos + 1, std::string::npos));
}

bool
is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

std::string_view
trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

bool
is_valid_key(std::string_view key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
            return false;
        }
    }
    return true;
}

bool
looks_numeric(std::string_view word) {
    std::size_t i = 0;
    if (i < word.size() && (word[i] == '-' || word[i] == '+')) {
        i++;
    }
    return i < word.size() && (std::isdigit(static_cast<unsigned char>(word[i])) || word[i] == '.');
}

// Reads one value from a single line of text.
class ValueScanner {
   public:
    explicit ValueScanner(std::string_view text) : text_(text) {
    }

    bool
    parse(Value& value, std::string& error) {
        return parse_value(value, error, 0);
    }

    // Only whitespace or a comment left.
    bool
    at_end() {
        skip_spaces();
        return pos_ >= text_.size() || text_[pos_] == '#';
    }

   private:
    void
    skip_spaces() {
        while (pos_ < text_.size() && is_space(text_[pos_])) {
            pos_++;
        }
    }

    bool
    parse_value(Value& value, std::string& error, int depth) {
        skip_spaces();
        if (pos_ >= text_.size() || text_[pos_] == '#') {
            error = "expected a value";
            return false;
        }

        char c = text_[pos_];
        if (c == '[') {
            return parse_array(value, error, depth);
        }
        if (c == '\'' || c == '"') {
            return parse_string(value, error);
        }
        return parse_scalar(value, error);
    }

    bool
    parse_array(Value& value, std::string& error, int depth) {
        if (depth >= kMaxArrayDepth) {
            error = "arrays nested too deeply";
            return false;
        }
        pos_++;  // [

        Value::Array array;
        for (;;) {
            skip_spaces();
            if (pos_ >= text_.size()) {
                error = "unterminated array";
                return false;
            }
            if (text_[pos_] == ']') {
                pos_++;
                break;
            }

            Value element;
            if (!parse_value(element, error, depth + 1)) {
                return false;
            }
            array.push_back(std::move(element));

            skip_spaces();
            if (pos_ < text_.size() && text_[pos_] == ',') {
                pos_++;
            } else if (pos_ >= text_.size() || text_[pos_] != ']') {
                error = "expected ',' or ']' in array";
                return false;
            }
        }
        value = Value{std::move(array)};
        return true;
    }

    bool
    parse_string(Value& value, std::string& error) {
        const char quote = text_[pos_++];
        std::string s;
        while (pos_ < text_.size() && text_[pos_] != quote) {
            char c = text_[pos_++];
            // Single quoted strings are literal.
            if (c == '\\' && quote == '"' && pos_ < text_.size()) {
                char escaped = text_[pos_++];
                switch (escaped) {
                    case 'n':
                        c = '\n';
                        break;
                    case 't':
                        c = '\t';
                        break;
                    case '\\':
                    case '"':
                        c = escaped;
                        break;
                    default:
                        error = fmt::format("unknown escape sequence '\\{}'", escaped);
                        return false;
                }
            }
            s.push_back(c);
        }
        if (pos_ >= text_.size()) {
            error = "unterminated string";
            return false;
        }
        pos_++;  // closing quote
        value = Value{Value::String{std::move(s)}};
        return true;
    }

    bool
    parse_scalar(Value& value, std::string& error) {
        auto start = pos_;
        while (pos_ < text_.size() && !is_space(text_[pos_]) && text_[pos_] != ',' && text_[pos_] != ']' &&
               text_[pos_] != '#') {
            pos_++;
        }
        auto word = text_.substr(start, pos_ - start);

        if (word == "true" || word == "false") {
            value = Value{Value::Bool{word == "true"}};
            return true;
        }

        if (looks_numeric(word)) {
            std::string number{word};
            char* end = nullptr;
            bool is_float = number.find_first_of(".eE") != std::string::npos;
            if (!is_float) {
                auto parsed = std::strtoll(number.c_str(), &end, 10);
                if (end == number.c_str() + number.size()) {
                    value = Value{Value::Int{parsed}};
                    return true;
                }
            } else {
                auto parsed = std::strtod(number.c_str(), &end);
                if (end == number.c_str() + number.size()) {
                    value = Value{Value::Float{parsed}};
                    return true;
                }
            }
            error = fmt::format("invalid number '{}'", word);
            return false;
        }

        error = word.empty() ? std::string("expected a value")
                             : fmt::format("unexpected '{}' (strings must be quoted)", word);
        return false;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace internal

void
mender::ParseResult::set_error(uint32_t at_line, std::string error_message) {
    this->kind = ParseErrorKind::Parsing;
    this->line = at_line;
    this->error = fmt::format("line {}: {}", at_line, error_message);
}

std::optional<std::reference_wrapper<Value>>
Value::lookup_value_by_path(std::string_view dotted_path) {
    Value* result_value = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (!result_value->contains(key)) {
            return std::nullopt;
        }
        result_value = &(*result_value)[key];
        remaining = rest;
    }
    return std::ref(*result_value);
}

bool
Value::set_value_at(std::string_view dotted_path, Value value) {
    Value* iter = this;
    std::string_view remaining{dotted_path};
    for (;;) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (key.empty() || !iter->is_table()) {
            return false;
        }

        if (rest.empty()) {
            iter->as_table().insert(key, std::move(value));
            return true;
        }

        if (!iter->contains(key)) {
            iter->as_table().insert(key, Value{Value::Table{}});
        }
        iter = &(*iter)[key];
        remaining = rest;
    }
}

bool
mender::cfg_parse_value(std::string_view input_data, ParseResult& result, Value& value) {
    result = ParseResult{};

    internal::ValueScanner scanner(input_data);
    std::string error;
    if (!scanner.parse(value, error)) {
        result.set_error(1, error);
        return false;
    }
    if (!scanner.at_end()) {
        result.set_error(1, "unexpected text after value");
        return false;
    }
    return true;
}

bool
mender::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& root) {
    result = ParseResult{};
    root = Value{Value::Table{}};

    // Table receiving keys: the root until the first section header.
    Value* section = &root;
    std::vector<std::string> comments;

    uint32_t line_number = 0;
    std::string_view remaining{input_data};
    bool more = !remaining.empty();
    while (more) {
        auto newline = remaining.find('\n');
        auto raw_line = remaining.substr(0, newline);
        more = newline != std::string_view::npos;
        remaining = more ? remaining.substr(newline + 1) : std::string_view{};
        line_number++;

        auto line = internal::trim(raw_line);
        if (line.empty()) {
            continue;
        }

        if (line[0] == '#') {
            comments.emplace_back(line);
            continue;
        }

        if (line[0] == '[') {
            auto close = line.find(']');
            if (close == std::string_view::npos) {
                result.set_error(line_number, "unterminated section header");
                return false;
            }
            auto name = internal::trim(line.substr(1, close - 1));
            if (!internal::is_valid_key(name)) {
                result.set_error(line_number, fmt::format("invalid section name '{}'", name));
                return false;
            }
            auto after = internal::trim(line.substr(close + 1));
            if (!after.empty() && after[0] != '#') {
                result.set_error(line_number, "unexpected text after section header");
                return false;
            }

            std::string key{name};
            if (root.contains(key)) {
                result.set_error(line_number, fmt::format("'{}' is defined more than once", key));
                return false;
            }

            Value table{Value::Table{}};
            table.key_comments = std::move(comments);
            comments.clear();
            root.as_table().insert(key, std::move(table));
            section = &root[key];
            MENDER_TRACE("config: [{}]\n", key);
            continue;
        }

        auto [key_part, value_part] = internal::str_split2(line, '=');
        if (line.find('=') == std::string_view::npos) {
            result.set_error(line_number, "expected 'key = value'");
            return false;
        }

        auto name = internal::trim(key_part);
        if (!internal::is_valid_key(name)) {
            result.set_error(line_number, fmt::format("invalid key '{}'", name));
            return false;
        }

        std::string key{name};
        if (section->contains(key)) {
            result.set_error(line_number, fmt::format("key '{}' is defined more than once", key));
            return false;
        }

        Value value;
        internal::ValueScanner scanner(value_part);
        std::string error;
        if (!scanner.parse(value, error)) {
            result.set_error(line_number, fmt::format("{} for key '{}'", error, key));
            return false;
        }
        if (!scanner.at_end()) {
            result.set_error(line_number, fmt::format("unexpected text after value of '{}'", key));
            return false;
        }

        value.key_comments = std::move(comments);
        comments.clear();
        MENDER_TRACE("config: {} = {}\n", key, repr(value));
        section->as_table().insert(key, std::move(value));
    }

    return true;
}

std::string
mender::repr(const Value& v) {
    if (v.is_table()) {
        return fmt::format("Table<{}>", v.as_table().size());
    } else if (v.is_array()) {
        return fmt::format("Array<{}>", v.as_array().size());
    } else if (v.is_int()) {
        return fmt::format("Integer<{}>", v.as_int());
    } else if (v.is_float()) {
        return fmt::format("Float<{}>", v.as_float());
    } else if (v.is_bool()) {
        return fmt::format("Boolean<{}>", v.as_bool());
    } else if (v.is_string()) {
        return fmt::format("String<'{}'>", v.as_string());
    }
    return "Unknown";
}
