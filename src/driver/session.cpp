#include <lox/session.hpp>
#include <lox/lang/parser.hpp>
#include <lox/lang/scanner.hpp>
#include <lox/log.hpp>
#include <istream>
#include <ostream>

namespace lox {

Session::Session(std::ostream& out, const Config& cfg)
    : out_(out), interp_(out), prompt_(cfg.prompt) {
    interp_.set_debug_ast(cfg.debug_ast);
}

Status Session::run(const std::string& source, int starting_line) {
    auto tokens = scan(source, starting_line);
    LOX_TRY(tokens);

    auto program = parse(tokens.value());
    LOX_TRY(program);

    return interp_.execute(program.value());
}

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

int Session::repl(std::istream& in) {
    int failures = 0;
    int lineno = 0;
    std::string raw;

    out_ << prompt_ << std::flush;
    while (std::getline(in, raw)) {
        ++lineno;
        std::string line = trim(raw);
        if (line.empty()) {
            out_ << prompt_ << std::flush;
            continue;
        }
        if (line.back() != ';') {
            line += ';';
        }

        auto status = run(line, lineno);
        if (status.is_err()) {
            ++failures;
            log::debug("%s error on input line %d",
                       ErrorState::phase_name(status.error().phase()), lineno);
            out_ << status.error().format() << "\n";
        }
        out_ << prompt_ << std::flush;
    }

    // Leave the terminal on a fresh line after ^D
    out_ << "\n";
    return failures;
}

} // namespace lox
