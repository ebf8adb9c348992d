#pragma once

#include <lox/log.hpp>
#include <lox/result.hpp>
#include <string>

namespace lox {

// Interpreter settings read from TOML:
//
//   [run]  debug-ast = true
//   [repl] prompt = "> "
//   [log]  level = "warn", color = true
//
// Each field remembers whether it was set so that merge() only overrides
// what the other layer actually specified.
struct Config {
    bool debug_ast = false;
    std::string prompt = "> ";
    log::Level log_level = log::Warn;
    bool color = false;

    bool debug_ast_set = false;
    bool prompt_set = false;
    bool log_level_set = false;
    bool color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Push log level and color settings into lox::log
    void apply_logging() const;
};

// Default config file location: ~/.lox/config.toml (empty if HOME is unset)
std::string global_config_path();

} // namespace lox
