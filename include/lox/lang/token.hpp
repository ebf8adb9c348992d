#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace lox {

enum class TokenKind {
    // Single-character tokens
    LeftParen,
    RightParen,
    LeftBrace,
    RightBrace,
    Comma,
    Dot,
    Minus,
    Plus,
    Semicolon,
    Slash,
    Star,

    // One or two character tokens
    Bang,
    BangEqual,
    Equal,
    EqualEqual,
    Greater,
    GreaterEqual,
    Less,
    LessEqual,

    // Literals
    Identifier,
    String,
    Number,

    // Keywords
    KwAnd,
    KwClass,
    KwElse,
    KwFalse,
    KwFun,
    KwFor,
    KwIf,
    KwNil,
    KwOr,
    KwPrint,
    KwReturn,
    KwSuper,
    KwThis,
    KwTrue,
    KwVar,
    KwWhile,

    Eof
};

// Immutable lexical unit. `text` holds the payload of Identifier and String
// tokens, `number` the payload of Number tokens.
struct Token {
    TokenKind kind = TokenKind::Eof;
    int line = 0;
    std::string text;
    float number = 0.0f;

    static Token simple(TokenKind k, int line) { return {k, line, {}, 0.0f}; }
    static Token identifier(std::string name, int line) {
        return {TokenKind::Identifier, line, std::move(name), 0.0f};
    }
    static Token string(std::string s, int line) {
        return {TokenKind::String, line, std::move(s), 0.0f};
    }
    static Token number_literal(float n, int line) {
        return {TokenKind::Number, line, {}, n};
    }

    // Human-readable description for diagnostics, e.g. "'+'" or "identifier 'x'"
    std::string describe() const;
};

bool operator==(const Token& a, const Token& b);
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

const char* token_kind_name(TokenKind k);

// Source spelling of punctuation, operators and keywords; empty for literals and Eof
const char* token_lexeme(TokenKind k);

const std::unordered_map<std::string, TokenKind>& keywords();

} // namespace lox
