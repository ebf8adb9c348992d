#pragma once

#include <lox/config.hpp>
#include <lox/lang/interpreter.hpp>
#include <lox/result.hpp>
#include <iosfwd>
#include <string>

namespace lox {

// Runs source text through scan -> parse -> execute against one interpreter.
// Variables defined by one run() stay visible to the next.
class Session {
public:
    Session(std::ostream& out, const Config& cfg = Config{});

    // Returns the ErrorState of the first phase that failed
    Status run(const std::string& source, int starting_line = 1);

    // Line-at-a-time loop until in is exhausted. Blank lines are skipped and
    // a missing trailing ';' is appended so bare expressions are accepted.
    // Prompts and errors go to the stream given at construction and the
    // loop continues. Returns the number of lines that failed.
    int repl(std::istream& in);

    Interpreter& interpreter() { return interp_; }

private:
    std::ostream& out_;
    Interpreter interp_;
    std::string prompt_;
};

} // namespace lox
