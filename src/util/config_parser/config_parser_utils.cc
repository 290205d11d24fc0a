#include "config_parser_utils.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

using namespace mender;

namespace internal {

std::string
serialize_float(double value) {
    auto s = fmt::format("{}", value);
    // Keep the type when reading it back: 1.0 must not become the integer 1.
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string
serialize_string(const std::string& value) {
    if (value.find('\'') == std::string::npos && value.find('\n') == std::string::npos) {
        return fmt::format("'{}'", value);
    }

    std::string quoted = "\"";
    for (char c : value) {
        switch (c) {
            case '\n':
                quoted += "\\n";
                break;
            case '\t':
                quoted += "\\t";
                break;
            case '\\':
                quoted += "\\\\";
                break;
            case '"':
                quoted += "\\\"";
                break;
            default:
                quoted.push_back(c);
        }
    }
    quoted += "\"";
    return quoted;
}

void
serialize_comments(const Value& value, std::string& output) {
    for (const auto& comment : value.key_comments) {
        output += comment;
        if (comment.empty() || comment.back() != '\n') {
            output += "\n";
        }
    }
}

void
serialize_entries(const Value::Table& table, std::string& output) {
    for (const auto& [key, value] : table) {
        if (value.is_table()) {
            continue;
        }
        serialize_comments(value, output);
        output += fmt::format("{} = {}\n", key, cfg_serialize_obj(value));
    }
}

}  // namespace internal

bool
mender::cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj) {
    std::ifstream input(file_path, std::ios::in | std::ios::binary);
    if (!input) {
        result.kind = ParseErrorKind::File;
        result.error = fmt::format("could not open '{}'", file_path);
        return false;
    }

    std::stringstream buffer;
    buffer << input.rdbuf();
    return cfg_parse_value_tree(buffer.str(), result, result_obj);
}

std::string
mender::cfg_serialize_obj(const Value& value) {
    if (value.is_array()) {
        std::string output = "[";
        const auto& array = value.as_array();
        for (std::size_t i = 0; i < array.size(); i++) {
            if (i > 0) {
                output += ", ";
            }
            output += cfg_serialize_obj(array[i]);
        }
        return output + "]";
    } else if (value.is_int()) {
        return fmt::format("{}", value.as_int());
    } else if (value.is_float()) {
        return internal::serialize_float(value.as_float());
    } else if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    } else if (value.is_string()) {
        return internal::serialize_string(value.as_string());
    }
    // Tables only exist as sections.
    return "";
}

std::string
mender::cfg_serialize(const Value& value) {
    std::string output;
    if (!value.is_table()) {
        return output;
    }

    const auto& root = value.as_table();
    internal::serialize_entries(root, output);

    for (const auto& [key, section] : root) {
        if (!section.is_table()) {
            continue;
        }
        if (!output.empty()) {
            output += "\n";
        }
        internal::serialize_comments(section, output);
        output += fmt::format("[{}]\n", key);
        internal::serialize_entries(section.as_table(), output);
    }
    return output;
}
