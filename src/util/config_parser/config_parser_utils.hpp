#pragma once

#include "config_parser.hpp"

#include <string>

namespace mender {

// Load a file and construct a value tree based on the contents. A file
// that cannot be read is a ParseErrorKind::File error.
bool
cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj);

// Serialize all entries in the given Value. Keys holding scalars and
// arrays come first, then a [section] for every key holding a table. The
// input Value must hold a Value::Table.
std::string
cfg_serialize(const Value& value);

// Serialize a value without sections, e.g. "['exact', 'fuzzy']".
std::string
cfg_serialize_obj(const Value& value);

}  // namespace mender
