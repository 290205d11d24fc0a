#include "apply/apply_diff.hpp"
#include "config/config.hpp"
#include "output/report.hpp"
#include "util/readlines.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#ifndef MENDER_VERSION
#define MENDER_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace mender {

enum class FileStatus {
    kOk,
    kNullPath,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

FileStatus
check_file_status(const std::string& path) {
    if (path.empty()) {
        return FileStatus::kNullPath;
    }

    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none) &&
        ((perms & fs::perms::others_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
to_string(const FileStatus error_code) {
    switch (error_code) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
        case FileStatus::kNullPath:
            return "Null path";
        default:
            return "Unknown error";
    }
}

bool
parse_strategy_list(const std::string& list, std::vector<StrategyId>& strategies) {
    std::vector<StrategyId> parsed;
    std::size_t start = 0;
    while (start <= list.size()) {
        auto comma = list.find(',', start);
        auto name = list.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        auto id = strategy_from_string(name);
        if (id == StrategyId::kInvalid) {
            return false;
        }
        parsed.push_back(id);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    strategies = std::move(parsed);
    return true;
}

bool
parse_number(const char* text, double& value) {
    char* end = nullptr;
    value = std::strtod(text, &end);
    return end != text && *end == '\0';
}

bool
parse_number(const char* text, int& value) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

void
print_lines(FILE* stream, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        fmt::print(stream, "{}", line);
    }
}

}  // namespace mender

// Exit status
constexpr int kExitOk = 0;
constexpr int kExitBlocksFailed = 1;
constexpr int kExitFatal = 2;

int
main(int argc, char* argv[]) {
    mender::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] source_file diff_file

Apply search/replace blocks to a file

    <<<<<<< SEARCH
    text to find
    =======
    text to put there instead
    >>>>>>> REPLACE

Blocks are applied in order. Use '-' as diff_file to read the diff from
standard input. The patched file is written to standard output unless
-o or -i is given; the report goes to standard error.

Options:
    -h, --help                   show this help and exit
    -v, --version                show program version and exit

    -s, --strict                 fail without changes on the first block that does not apply
    -S, --no-strict              apply what can be applied, report the rest (default)

    -m, --strategies [list]      comma separated matching strategies, in order:
                                    exact        (e)
                                    whitespace   (w)
                                    indentation  (i)
                                    fuzzy        (f)
    -f, --fuzzy-threshold [x]    minimum fuzzy similarity, in (0, 1]
    -r, --realtime               stricter fuzzy threshold ({}) for correction passes
    -l, --scan-lines [n]         limit the fuzzy scan to n lines around the previous edit

    -o, --output [file]          write the patched text to file
    -i, --in-place               overwrite source_file
    -t, --telemetry              report timing and match details per block
    -q, --quiet                  no report unless something fails

Exit status:
    0  all blocks applied
    1  some blocks failed (non-strict)
    2  strict failure, malformed diff, invalid options or I/O error
)",
                                       argv[0], mender::kRealtimeCorrectorThreshold);

        help += "\nConfig file:\n    " + mender::config_get_path() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message + "\n";
            fmt::print(stderr, "{}", help);
        } else {
            fmt::print("{}", help);
        }
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"strict", no_argument, 0, 's'},
                                               {"no-strict", no_argument, 0, 'S'},
                                               {"strategies", required_argument, 0, 'm'},
                                               {"fuzzy-threshold", required_argument, 0, 'f'},
                                               {"realtime", no_argument, 0, 'r'},
                                               {"scan-lines", required_argument, 0, 'l'},
                                               {"output", required_argument, 0, 'o'},
                                               {"in-place", no_argument, 0, 'i'},
                                               {"telemetry", no_argument, 0, 't'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvsSm:f:rl:o:itq", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    opts.version = true;
                    return true;
                case 'h':
                    opts.help = true;
                    return true;
                case 's':
                    opts.apply.strict = true;
                    break;
                case 'S':
                    opts.apply.strict = false;
                    break;
                case 'm':
                    if (!mender::parse_strategy_list(optarg, opts.apply.matching_strategies)) {
                        show_help(fmt::format("error: invalid strategy list '{}'", optarg));
                        return false;
                    }
                    break;
                case 'f':
                    if (!mender::parse_number(optarg, opts.apply.fuzzy_threshold)) {
                        show_help(fmt::format("error: invalid value for -f ({})", optarg));
                        return false;
                    }
                    break;
                case 'r':
                    opts.apply.fuzzy_threshold = mender::kRealtimeCorrectorThreshold;
                    break;
                case 'l':
                    if (!mender::parse_number(optarg, opts.apply.fuzzy_scan_lines)) {
                        show_help(fmt::format("error: invalid value for -l ({})", optarg));
                        return false;
                    }
                    break;
                case 'o':
                    opts.output_file = optarg;
                    break;
                case 'i':
                    opts.in_place = true;
                    break;
                case 't':
                    opts.apply.enable_telemetry = true;
                    break;
                case 'q':
                    opts.quiet = true;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (opts.in_place && !opts.output_file.empty()) {
            show_help("error: -i and -o are mutually exclusive");
            return false;
        }

        int positional_count = in_argc - optind;
        if (positional_count != 2) {
            show_help("error: expected source_file and diff_file");
            return false;
        }

        opts.source_file = in_argv[optind];
        opts.diff_file = in_argv[optind + 1];

        std::string err;
        auto source_status = mender::check_file_status(opts.source_file);
        if (source_status != mender::FileStatus::kOk) {
            err += fmt::format("Source file '{}': {}\n", opts.source_file, mender::to_string(source_status));
        }
        if (opts.diff_file != "-") {
            auto diff_status = mender::check_file_status(opts.diff_file);
            if (diff_status != mender::FileStatus::kOk) {
                err += fmt::format("Diff file '{}': {}\n", opts.diff_file, mender::to_string(diff_status));
            }
        }
        if (!err.empty()) {
            fmt::print(stderr, "error: {}", err);
            return false;
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    mender::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return kExitFatal;
    }

    if (opts.version) {
        fmt::print("mender {}\n", MENDER_VERSION);
        return kExitOk;
    }

    if (opts.help) {
        show_help("");
        return kExitOk;
    }

    std::string source;
    std::string diff_text;
    if (!mender::readfile(opts.source_file, source)) {
        fmt::print(stderr, "error: could not read '{}'\n", opts.source_file);
        return kExitFatal;
    }
    if (!mender::readfile(opts.diff_file, diff_text)) {
        fmt::print(stderr, "error: could not read '{}'\n", opts.diff_file);
        return kExitFatal;
    }

    mender::ApplyDiffResult result;
    mender::ApplyError error;
    if (!mender::apply_diff(source, diff_text, opts.apply, result, error)) {
        fmt::print(stderr, "error: ");
        mender::print_lines(stderr, mender::render_error(error));
        return kExitFatal;
    }

    if (opts.in_place || !opts.output_file.empty()) {
        const auto& path = opts.in_place ? opts.source_file : opts.output_file;
        if (!mender::writefile(path, result.content)) {
            fmt::print(stderr, "error: could not write '{}'\n", path);
            return kExitFatal;
        }
    } else {
        fmt::print("{}", result.content);
    }

    const bool failed = result.results.blocks_failed > 0;
    if (!opts.quiet || failed) {
        mender::print_lines(stderr, mender::render_report(result));
    }
    if (opts.apply.enable_telemetry) {
        mender::print_lines(stderr, mender::render_telemetry(result));
    }

    return failed ? kExitBlocksFailed : kExitOk;
}
