#pragma once

#include "ordered_map.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mender {

/**

 Configuration language parser

 It's basically "INI with arrays, strings, ints, floats and bools", a
 subset of TOML:

    # Comment lines are attached to the next section or key.
    top_level = 1

    [general]
    strict = false
    fuzzy_threshold = 0.8
    name = 'single' # or "double" quoted
    strategies = ['exact', 'fuzzy']

 Every line is one of: blank, comment, [section] or key = value. Values
 and arrays fit on one line; arrays may nest. Keys before the first
 section header land in the root table.
*/

struct Value {
    using Table = OrderedMap<std::string, Value>;
    using Array = std::vector<Value>;
    using Int = int64_t;
    using Float = double;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Array, Int, Float, Bool, String> v;

    // Comment lines preceding the key this value is assigned to, '#'
    // included.
    std::vector<std::string> key_comments;

    Value&
    operator[](const std::string& key) {
        return as_table()[key];
    }

    bool
    contains(const std::string& key) const {
        return is_table() && as_table().contains(key);
    }

    // Find a nested value using e.g. "general.fuzzy_threshold"
    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(std::string_view dotted_path);

    // Sets a nested value using e.g. set_value_at("general.strict", Value{Value::Bool{true}}).
    // Missing tables along the path are created. Fails if a path component
    // names something that is not a table.
    bool
    set_value_at(std::string_view dotted_path, Value value);

    // clang-format off
    bool is_array() const { return std::holds_alternative<Value::Array>(v); }
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_float() const { return std::holds_alternative<Value::Float>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Array& as_array() { return std::get<Value::Array>(v); }
    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Float& as_float() { return std::get<Value::Float>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }

    const Array& as_array() const { return std::get<Value::Array>(v); }
    const Table& as_table() const { return std::get<Value::Table>(v); }
    const Int& as_int() const { return std::get<Value::Int>(v); }
    const Float& as_float() const { return std::get<Value::Float>(v); }
    const Bool& as_bool() const { return std::get<Value::Bool>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(const Value& v);

enum class ParseErrorKind {
    None,
    File,
    Parsing,
};

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    // 1-based line of the problem, for Parsing errors.
    uint32_t line = 0;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(uint32_t at_line, std::string error_message);
};

// Parse a whole document into a root table.
bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& root);

// Parse a single value, e.g. "[1, 'two', 3.0]".
bool
cfg_parse_value(std::string_view input_data, ParseResult& result, Value& value);

}  // namespace mender
