#pragma once

#include <lox/lang/ast.hpp>
#include <string>

namespace lox {

// Debug rendering of a tree: one node per line, children indented four
// spaces, binary operators printed between their operand blocks. Line
// numbers are not shown.
std::string pretty(const Expr& expr, int indent = 0);
std::string pretty(const Decl& decl);

} // namespace lox
