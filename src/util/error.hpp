#pragma once

#include <string>

namespace mender {

// Machine-distinguishable failure reasons. ParseError and InvalidOptions
// abort a call before any block runs; NoMatchFound and Ambiguous are
// per-block and only abort a call in strict mode.
enum class ErrorKind {
    None,
    ParseError,
    NoMatchFound,
    Ambiguous,
    InvalidOptions,
};

std::string
to_string(ErrorKind kind);

}  // namespace mender
