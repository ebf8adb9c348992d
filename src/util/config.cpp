#include <lox/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace lox {

static LoxError type_error(const std::string& key, const char* expected) {
    return LoxError{LoxError::Config,
        "config key '" + key + "' must be a " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return LoxError{LoxError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [run] section
    if (auto run = doc["run"].as_table()) {
        if (auto node = run->get("debug-ast")) {
            auto v = node->value<bool>();
            if (!v) return type_error("run.debug-ast", "boolean");
            cfg.debug_ast = *v;
            cfg.debug_ast_set = true;
        }
    }

    // [repl] section
    if (auto repl = doc["repl"].as_table()) {
        if (auto node = repl->get("prompt")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("repl.prompt", "string");
            cfg.prompt = *v;
            cfg.prompt_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("log.level", "string");
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return LoxError{LoxError::Config,
                    "unknown log level: " + *v,
                    "expected one of: trace, debug, info, warn, error, off"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) return type_error("log.color", "boolean");
            cfg.color = *v;
            cfg.color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoxError{LoxError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        // Point the error at the file it came from
        LoxError e = cfg.error().first();
        e.file = path;
        return e;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.debug_ast_set) {
        debug_ast = other.debug_ast;
        debug_ast_set = true;
    }
    if (other.prompt_set) {
        prompt = other.prompt;
        prompt_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (color_set) {
        log::set_color_enabled(color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.lox/config.toml";
}

} // namespace lox
