#pragma once

#include <lox/lang/ast.hpp>
#include <lox/lang/token.hpp>
#include <lox/result.hpp>
#include <vector>

namespace lox {

// Parse a scanned token sequence (terminated by Eof) into a program.
// A failed declaration is skipped up to the next ';' so that later
// declarations are still checked; every error is reported together.
Result<Program> parse(const std::vector<Token>& tokens);

} // namespace lox
