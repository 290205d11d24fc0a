#pragma once

#include "apply/options.hpp"
#include "util/config_parser/config_parser.hpp"

#include <string>

namespace mender {

struct ProgramOptions {
    ApplyOptions apply;

    bool help = false;
    bool version = false;
    bool quiet = false;
    bool in_place = false;

    std::string output_file;

    std::string source_file;
    std::string diff_file;  // "-" reads stdin
};

std::string
config_get_directory();

std::string
config_get_path();

// Copy the [general] settings found in `config` into `options`. Settings
// missing from `config` are added to it with the current option values,
// so `config` can be written back as a complete file. Returns false on
// the first setting with the wrong type or an unknown strategy name.
bool
config_apply_values(Value& config, ApplyOptions& options, std::string& error);

// Load defaults from the user's mender.conf. A missing file is created
// with the built-in defaults; an invalid file is reported and ignored.
void
config_apply_options(ProgramOptions& program_options);

}  // namespace mender
