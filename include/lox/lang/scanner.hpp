#pragma once

#include <lox/lang/token.hpp>
#include <lox/result.hpp>
#include <string>
#include <vector>

namespace lox {

// Scan source text into tokens. Line numbers start at starting_line so a REPL
// can scan one line at a time. Errors accumulate; on any error the result
// holds ErrorState::Scan with every error in source order.
Result<std::vector<Token>> scan(const std::string& source, int starting_line = 1);

} // namespace lox
