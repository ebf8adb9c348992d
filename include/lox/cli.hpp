#pragma once

#include <lox/config.hpp>
#include <lox/result.hpp>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace lox {

// Process exit codes, as in sysexits.h
constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitDataErr = 65;
constexpr int kExitSoftware = 70;
constexpr int kExitIOErr = 74;

const char* usage_text();

// Command line: lox [--debug-ast] [--config PATH] [-v|--verbose] [-h|--help] [FILE]
struct Options {
    std::optional<std::string> file;
    std::optional<std::string> config_path;
    bool debug_ast = false;
    int verbosity = 0;
    bool help = false;
};

// args excludes the program name
Result<Options> parse_args(const std::vector<std::string>& args);

// --config PATH, or the global config file if one exists, with the
// command-line flags merged on top
Result<Config> load_config(const Options& opts);

Result<std::string> read_source(const std::string& path);

// 65 scan/parse, 70 runtime, 64 usage, 74 for any other host error
int exit_code_for(const ErrorState& err);

// Run a script file. Program output and diagnostics go to out, host errors
// to err. Returns the process exit code.
int run_file(const std::string& path, const Config& cfg,
             std::ostream& out, std::ostream& err);

} // namespace lox
