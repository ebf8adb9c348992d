#pragma once

#include <lox/lang/ast.hpp>
#include <lox/lang/environment.hpp>
#include <lox/lang/value.hpp>
#include <lox/result.hpp>
#include <iosfwd>

namespace lox {

// Evaluate an expression against env. Pure: env is only read.
// Type errors and unbound names yield ErrorState::Runtime.
Result<Value> evaluate(const Expr& expr, const Environment& env);

// Executes declarations against a single global environment that persists
// across calls, so a REPL can feed one line at a time.
class Interpreter {
public:
    // `print` output goes to out
    explicit Interpreter(std::ostream& out);

    // Stops at the first runtime error; nothing after it runs
    Status execute(const Program& program);
    Status execute(const Decl& decl);

    // Write each declaration's tree to out before executing it
    void set_debug_ast(bool on) { debug_ast_ = on; }
    bool debug_ast() const { return debug_ast_; }

    const Environment& environment() const { return env_; }

private:
    std::ostream& out_;
    Environment env_;
    bool debug_ast_ = false;
};

} // namespace lox
