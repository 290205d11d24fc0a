#include "config.hpp"

#include "util/config_parser/config_parser_utils.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <tuple>
#include <vector>

using namespace mender;

static std::string config_doc_general = R"foo(# General configuration for `mender`
#
# Defaults for applying search/replace diffs. Command line options
# override these.
#
#   strict           stop at the first block that fails and leave the
#                    file untouched
#   telemetry        print per-block timing and match details
#   strategies       matching strategies, tried in order:
#                    'exact', 'whitespace', 'indentation', 'fuzzy'
#   fuzzy_threshold  minimum similarity for a fuzzy match, in (0, 1]
#   fuzzy_scan_lines limit the fuzzy scan to this many lines around the
#                    previous edit (the first lines before any edit);
#                    0 scans the whole file
#   preview_length   characters of search text shown for failed blocks
#
)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    Float,
    StrategyList,
};

std::string
mender::config_get_directory() {
    return fmt::format("{}/mender", sago::getConfigHome());
}

std::string
mender::config_get_path() {
    return fmt::format("{}/mender.conf", config_get_directory());
}

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

static ConfigLoadResult
config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Ok;
    }
    if (load_result.kind == ParseErrorKind::File) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

static void
config_save(const std::string& config_root, const std::string& config_name, const Value& config_value) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        fmt::print(stderr, "warning: failed to create '{}': {}\n", config_root, ec.message());
        return;
    }

    FILE* f = fopen(config_name.c_str(), "wb");
    if (!f) {
        fmt::print(stderr, "warning: failed to open '{}' for writing: {}\n", config_name, strerror(errno));
        return;
    }

    std::string serialized = cfg_serialize(config_value);
    bool ok = fwrite(serialized.c_str(), 1, serialized.size(), f) == serialized.size();
    ok = fclose(f) == 0 && ok;
    if (!ok) {
        fmt::print(stderr, "warning: failed to write '{}'\n", config_name);
    }
}

namespace {

Value
strategies_to_value(const std::vector<StrategyId>& strategies) {
    Value::Array names;
    for (auto id : strategies) {
        names.push_back(Value{Value::String{to_string(id)}});
    }
    return Value{std::move(names)};
}

bool
strategies_from_value(const Value& value, std::vector<StrategyId>& strategies, std::string& error) {
    if (!value.is_array()) {
        error = "expected an array of strategy names";
        return false;
    }

    std::vector<StrategyId> parsed;
    for (const auto& element : value.as_array()) {
        if (!element.is_string()) {
            error = "expected an array of strategy names";
            return false;
        }
        auto id = strategy_from_string(element.as_string());
        if (id == StrategyId::kInvalid) {
            error = fmt::format("unknown strategy '{}'", element.as_string());
            return false;
        }
        parsed.push_back(id);
    }
    strategies = std::move(parsed);
    return true;
}

}  // namespace

bool
mender::config_apply_values(Value& config, ApplyOptions& options, std::string& error) {
    using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

    // clang-format off
    const OptionVector option_table = {
        { "general.strict",           ConfigVariableType::Bool,         &options.strict },
        { "general.telemetry",        ConfigVariableType::Bool,         &options.enable_telemetry },
        { "general.strategies",       ConfigVariableType::StrategyList, &options.matching_strategies },
        { "general.fuzzy_threshold",  ConfigVariableType::Float,        &options.fuzzy_threshold },
        { "general.fuzzy_scan_lines", ConfigVariableType::Int,          &options.fuzzy_scan_lines },
        { "general.preview_length",   ConfigVariableType::Int,          &options.preview_length },
    };
    // clang-format on

    if (!config.is_table()) {
        config = Value{Value::Table{}};
    }

    for (const auto& [path, type, ptr] : option_table) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            const Value& stored = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (!stored.is_bool()) {
                        error = fmt::format("{}: expected true or false, got {}", path, repr(stored));
                        return false;
                    }
                    *static_cast<bool*>(ptr) = stored.as_bool();
                } break;
                case ConfigVariableType::Int: {
                    if (!stored.is_int()) {
                        error = fmt::format("{}: expected an integer, got {}", path, repr(stored));
                        return false;
                    }
                    *static_cast<int*>(ptr) = static_cast<int>(stored.as_int());
                } break;
                case ConfigVariableType::Float: {
                    if (stored.is_int()) {
                        *static_cast<double*>(ptr) = static_cast<double>(stored.as_int());
                    } else if (stored.is_float()) {
                        *static_cast<double*>(ptr) = stored.as_float();
                    } else {
                        error = fmt::format("{}: expected a number, got {}", path, repr(stored));
                        return false;
                    }
                } break;
                case ConfigVariableType::StrategyList: {
                    std::string problem;
                    if (!strategies_from_value(stored, *static_cast<std::vector<StrategyId>*>(ptr), problem)) {
                        error = fmt::format("{}: {}", path, problem);
                        return false;
                    }
                } break;
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, Value{Value::Bool{*static_cast<bool*>(ptr)}});
                } break;
                case ConfigVariableType::Int: {
                    config.set_value_at(path, Value{Value::Int{*static_cast<int*>(ptr)}});
                } break;
                case ConfigVariableType::Float: {
                    config.set_value_at(path, Value{Value::Float{*static_cast<double*>(ptr)}});
                } break;
                case ConfigVariableType::StrategyList: {
                    config.set_value_at(path, strategies_to_value(*static_cast<std::vector<StrategyId>*>(ptr)));
                } break;
            }
        }
    }
    return true;
}

void
mender::config_apply_options(ProgramOptions& program_options) {
    const std::string config_root = config_get_directory();
    const std::string config_path = config_get_path();

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value;
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            return;
        } break;
        case ConfigLoadResult::DoesNotExist: {
            fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
            flush_config_to_disk = true;
        } break;
    };

    // Work on a copy so a bad file leaves the built-in defaults alone.
    ApplyOptions options = program_options.apply;
    std::string error;
    if (!config_apply_values(config_file_table_value, options, error)) {
        fmt::print(stderr, "error: {}\n\twhile reading: {}\n", error, config_path);
        return;
    }
    if (!validate_options(options, error)) {
        fmt::print(stderr, "error: {}\n\twhile reading: {}\n", error, config_path);
        return;
    }
    program_options.apply = options;

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_file_table_value["general"].key_comments.push_back(config_doc_general);
        config_save(config_root, config_path, config_file_table_value);
    }
}
