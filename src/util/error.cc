#include "util/error.hpp"

std::string
mender::to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::ParseError:
            return "ParseError";
        case ErrorKind::NoMatchFound:
            return "NoMatchFound";
        case ErrorKind::Ambiguous:
            return "Ambiguous";
        case ErrorKind::InvalidOptions:
            return "InvalidOptions";
    }
    return "Unknown";
}
