#include <lox/cli.hpp>
#include <lox/log.hpp>
#include <lox/session.hpp>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>

namespace fs = std::filesystem;

namespace lox {

const char* usage_text() {
    return
        "usage: lox [options] [FILE]\n"
        "\n"
        "  --debug-ast        print each declaration's tree before executing it\n"
        "  --config PATH      load configuration from PATH\n"
        "  -v, --verbose      log at debug level (repeat for trace)\n"
        "  -h, --help         show this message\n";
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--debug-ast") {
            opts.debug_ast = true;
        } else if (arg == "-v" || arg == "--verbose") {
            ++opts.verbosity;
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                return LoxError{LoxError::Usage, "--config requires a path", usage_text()};
            }
            opts.config_path = args[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            return LoxError{LoxError::Usage, "unknown option: " + arg, usage_text()};
        } else if (opts.file) {
            return LoxError{LoxError::Usage, "only one script file may be given", usage_text()};
        } else {
            opts.file = arg;
        }
    }
    return Result<Options>::ok(std::move(opts));
}

Result<Config> load_config(const Options& opts) {
    Config cfg;
    if (opts.config_path) {
        auto loaded = Config::load(*opts.config_path);
        LOX_TRY(loaded);
        cfg.merge(loaded.value());
    } else {
        std::string path = global_config_path();
        if (!path.empty() && fs::exists(path)) {
            log::debug("loading config from %s", path.c_str());
            auto loaded = Config::load(path);
            LOX_TRY(loaded);
            cfg.merge(loaded.value());
        }
    }

    Config cli;
    if (opts.debug_ast) {
        cli.debug_ast = true;
        cli.debug_ast_set = true;
    }
    if (opts.verbosity > 0) {
        cli.log_level = opts.verbosity > 1 ? log::Trace : log::Debug;
        cli.log_level_set = true;
    }
    cfg.merge(cli);
    return Result<Config>::ok(std::move(cfg));
}

Result<std::string> read_source(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return LoxError{
            LoxError::IO,
            "could not open file: " + path,
            "check the path and file permissions"
        };
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

int exit_code_for(const ErrorState& err) {
    switch (err.phase()) {
    case ErrorState::Scan:
    case ErrorState::Parse:   return kExitDataErr;
    case ErrorState::Runtime: return kExitSoftware;
    case ErrorState::Host:    break;
    }
    if (!err.empty() && err.first().code == LoxError::Usage) return kExitUsage;
    return kExitIOErr;
}

int run_file(const std::string& path, const Config& cfg,
             std::ostream& out, std::ostream& err) {
    auto source = read_source(path);
    if (source.is_err()) {
        err << source.error().format() << "\n";
        return exit_code_for(source.error());
    }
    log::debug("running %s (%zu bytes)", path.c_str(), source.value().size());

    Session session(out, cfg);
    auto status = session.run(source.value());
    if (status.is_err()) {
        out << status.error().format() << "\n";
        out.flush();
        return exit_code_for(status.error());
    }
    return kExitOk;
}

} // namespace lox
