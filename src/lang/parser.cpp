#include <lox/lang/parser.hpp>
#include <lox/log.hpp>

namespace lox {

namespace {

using TK = TokenKind;

// ---------------------------------------------------------------------------
// Parser state machine
// ---------------------------------------------------------------------------

struct Parser {
    const std::vector<Token>& tokens;
    size_t pos;

    Program program;
    ErrorState errors;

    explicit Parser(const std::vector<Token>& toks)
        : tokens(toks), pos(0), errors(ErrorState::parser()) {}

    // -- Navigation ---------------------------------------------------------

    bool at_end() const {
        return pos >= tokens.size() || tokens[pos].kind == TK::Eof;
    }

    const Token& peek() const {
        if (pos >= tokens.size()) return tokens.back();
        return tokens[pos];
    }

    const Token& advance() {
        const auto& tok = peek();
        if (!at_end()) ++pos;
        return tok;
    }

    bool check(TK kind) const {
        return !at_end() && peek().kind == kind;
    }

    bool match(TK kind) {
        if (check(kind)) {
            advance();
            return true;
        }
        return false;
    }

    LoxError error_at(const Token& tok, const std::string& msg) const {
        return LoxError{LoxError::Parse, msg + ", got " + tok.describe(), tok.line};
    }

    Status expect(TK kind, const std::string& what) {
        if (match(kind)) return ok_status();
        return error_at(peek(), std::string("expected '") + token_lexeme(kind) + "' " + what);
    }

    // -- Recovery -----------------------------------------------------------

    // Discard tokens through the next ';' (consumed) or up to Eof
    void synchronize() {
        while (!at_end()) {
            if (advance().kind == TK::Semicolon) return;
        }
    }

    // -- Declarations -------------------------------------------------------

    Result<Program> run() {
        if (tokens.empty()) {
            return Result<Program>::ok(Program{});
        }

        while (!at_end()) {
            auto decl = declaration();
            if (decl.is_ok()) {
                program.push_back(std::move(decl).value());
                continue;
            }
            for (const auto& e : decl.error().errors()) {
                errors.add(e);
            }
            synchronize();
        }

        log::debug("parsed %zu declarations, %zu errors", program.size(), errors.size());

        if (!errors.empty()) {
            return std::move(errors);
        }
        return Result<Program>::ok(std::move(program));
    }

    Result<Decl> declaration() {
        if (check(TK::KwVar)) {
            return var_declaration();
        }
        return statement();
    }

    Result<Decl> var_declaration() {
        int line = advance().line; // var

        auto name = identifier();
        LOX_TRY(name);
        LOX_TRY(expect(TK::Equal, "after variable name"));

        auto init = expression();
        LOX_TRY(init);
        LOX_TRY(expect(TK::Semicolon, "after variable declaration"));

        return Result<Decl>::ok(
            Decl::var(std::move(name).value(), std::move(init).value(), line));
    }

    // Variable names are not expressions, so they get their own rule
    Result<ExprPtr> identifier() {
        const auto& tok = peek();
        if (tok.kind != TK::Identifier) {
            return error_at(tok, "expected variable name");
        }
        advance();
        return Result<ExprPtr>::ok(Expr::identifier(tok.text, tok.line));
    }

    Result<Decl> statement() {
        if (check(TK::KwPrint)) {
            int line = advance().line;
            auto e = expression();
            LOX_TRY(e);
            LOX_TRY(expect(TK::Semicolon, "after value"));
            return Result<Decl>::ok(Decl::print(std::move(e).value(), line));
        }

        int line = peek().line;
        auto e = expression();
        LOX_TRY(e);
        LOX_TRY(expect(TK::Semicolon, "after expression"));
        return Result<Decl>::ok(Decl::expression(std::move(e).value(), line));
    }

    // -- Expressions --------------------------------------------------------
    //
    // One function per precedence level, lowest first. Each binary level
    // folds its operands to the left so that a - b - c is (a - b) - c.

    Result<ExprPtr> expression() {
        return equality();
    }

    template<typename Next, typename OpFor>
    Result<ExprPtr> binary_level(Next next, OpFor op_for) {
        auto lhs = (this->*next)();
        LOX_TRY(lhs);
        ExprPtr expr = std::move(lhs).value();

        BinaryOp op = BinaryOp::Eq;
        while (!at_end() && op_for(peek().kind, op)) {
            advance();
            auto rhs = (this->*next)();
            LOX_TRY(rhs);
            int line = expr->line;
            expr = Expr::binary(op, std::move(expr), std::move(rhs).value(), line);
        }
        return Result<ExprPtr>::ok(std::move(expr));
    }

    Result<ExprPtr> equality() {
        return binary_level(&Parser::comparison, [](TK k, BinaryOp& op) {
            switch (k) {
            case TK::BangEqual:  op = BinaryOp::Neq; return true;
            case TK::EqualEqual: op = BinaryOp::Eq;  return true;
            default:             return false;
            }
        });
    }

    Result<ExprPtr> comparison() {
        return binary_level(&Parser::term, [](TK k, BinaryOp& op) {
            switch (k) {
            case TK::Greater:      op = BinaryOp::Gt;   return true;
            case TK::GreaterEqual: op = BinaryOp::GtEq; return true;
            case TK::Less:         op = BinaryOp::Lt;   return true;
            case TK::LessEqual:    op = BinaryOp::LtEq; return true;
            default:               return false;
            }
        });
    }

    Result<ExprPtr> term() {
        return binary_level(&Parser::factor, [](TK k, BinaryOp& op) {
            switch (k) {
            case TK::Plus:  op = BinaryOp::Add; return true;
            case TK::Minus: op = BinaryOp::Sub; return true;
            default:        return false;
            }
        });
    }

    Result<ExprPtr> factor() {
        return binary_level(&Parser::unary, [](TK k, BinaryOp& op) {
            switch (k) {
            case TK::Slash: op = BinaryOp::Div;  return true;
            case TK::Star:  op = BinaryOp::Mult; return true;
            default:        return false;
            }
        });
    }

    Result<ExprPtr> unary() {
        if (check(TK::Minus) || check(TK::Bang)) {
            const auto& tok = advance();
            UnaryOp op = tok.kind == TK::Minus ? UnaryOp::Negative : UnaryOp::Inverse;
            auto operand = unary();
            LOX_TRY(operand);
            return Result<ExprPtr>::ok(Expr::unary(op, std::move(operand).value(), tok.line));
        }
        return primary();
    }

    Result<ExprPtr> primary() {
        const auto& tok = peek();
        switch (tok.kind) {
        case TK::Identifier:
            advance();
            return Result<ExprPtr>::ok(Expr::identifier(tok.text, tok.line));
        case TK::String:
            advance();
            return Result<ExprPtr>::ok(Expr::string_literal(tok.text, tok.line));
        case TK::Number:
            advance();
            return Result<ExprPtr>::ok(Expr::number_literal(tok.number, tok.line));
        case TK::KwTrue:
            advance();
            return Result<ExprPtr>::ok(Expr::boolean(true, tok.line));
        case TK::KwFalse:
            advance();
            return Result<ExprPtr>::ok(Expr::boolean(false, tok.line));
        case TK::KwNil:
            advance();
            return Result<ExprPtr>::ok(Expr::nil(tok.line));
        case TK::LeftParen: {
            advance();
            auto inner = expression();
            LOX_TRY(inner);
            LOX_TRY(expect(TK::RightParen, "after expression"));
            ExprPtr expr = std::move(inner).value();
            expr->line = tok.line;
            return Result<ExprPtr>::ok(std::move(expr));
        }
        default:
            return error_at(tok, "expected expression");
        }
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<Program> parse(const std::vector<Token>& tokens) {
    Parser parser(tokens);
    return parser.run();
}

} // namespace lox
