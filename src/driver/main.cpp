// lox: run a script file, or start an interactive prompt when no file is given.
//
//     lox [--debug-ast] [--config PATH] [-v|--verbose] [FILE]
//
// Exit codes follow sysexits.h: 64 usage, 65 scan/parse errors, 70 runtime
// error, 74 I/O or configuration error.

#include <lox/cli.hpp>
#include <lox/session.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace lox;

int main(int argc, char** argv) {
    auto opts = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return exit_code_for(opts.error());
    }
    if (opts.value().help) {
        std::cout << usage_text();
        return kExitOk;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return exit_code_for(cfg.error());
    }
    cfg.value().apply_logging();

    if (opts.value().file) {
        return run_file(*opts.value().file, cfg.value(), std::cout, std::cerr);
    }

    Session session(std::cout, cfg.value());
    session.repl(std::cin);
    return kExitOk;
}
