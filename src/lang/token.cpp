#include <lox/lang/token.hpp>
#include <lox/lang/value.hpp>

namespace lox {

const std::unordered_map<std::string, TokenKind>& keywords() {
    static const std::unordered_map<std::string, TokenKind> table = {
        {"and",    TokenKind::KwAnd},
        {"class",  TokenKind::KwClass},
        {"else",   TokenKind::KwElse},
        {"false",  TokenKind::KwFalse},
        {"fun",    TokenKind::KwFun},
        {"for",    TokenKind::KwFor},
        {"if",     TokenKind::KwIf},
        {"nil",    TokenKind::KwNil},
        {"or",     TokenKind::KwOr},
        {"print",  TokenKind::KwPrint},
        {"return", TokenKind::KwReturn},
        {"super",  TokenKind::KwSuper},
        {"this",   TokenKind::KwThis},
        {"true",   TokenKind::KwTrue},
        {"var",    TokenKind::KwVar},
        {"while",  TokenKind::KwWhile},
    };
    return table;
}

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::LeftParen:    return "LeftParen";
    case TokenKind::RightParen:   return "RightParen";
    case TokenKind::LeftBrace:    return "LeftBrace";
    case TokenKind::RightBrace:   return "RightBrace";
    case TokenKind::Comma:        return "Comma";
    case TokenKind::Dot:          return "Dot";
    case TokenKind::Minus:        return "Minus";
    case TokenKind::Plus:         return "Plus";
    case TokenKind::Semicolon:    return "Semicolon";
    case TokenKind::Slash:        return "Slash";
    case TokenKind::Star:         return "Star";
    case TokenKind::Bang:         return "Bang";
    case TokenKind::BangEqual:    return "BangEqual";
    case TokenKind::Equal:        return "Equal";
    case TokenKind::EqualEqual:   return "EqualEqual";
    case TokenKind::Greater:      return "Greater";
    case TokenKind::GreaterEqual: return "GreaterEqual";
    case TokenKind::Less:         return "Less";
    case TokenKind::LessEqual:    return "LessEqual";
    case TokenKind::Identifier:   return "Identifier";
    case TokenKind::String:       return "String";
    case TokenKind::Number:       return "Number";
    case TokenKind::KwAnd:        return "And";
    case TokenKind::KwClass:      return "Class";
    case TokenKind::KwElse:       return "Else";
    case TokenKind::KwFalse:      return "False";
    case TokenKind::KwFun:        return "Fun";
    case TokenKind::KwFor:        return "For";
    case TokenKind::KwIf:         return "If";
    case TokenKind::KwNil:        return "Nil";
    case TokenKind::KwOr:         return "Or";
    case TokenKind::KwPrint:      return "Print";
    case TokenKind::KwReturn:     return "Return";
    case TokenKind::KwSuper:      return "Super";
    case TokenKind::KwThis:       return "This";
    case TokenKind::KwTrue:       return "True";
    case TokenKind::KwVar:        return "Var";
    case TokenKind::KwWhile:      return "While";
    case TokenKind::Eof:          return "Eof";
    }
    return "Unknown";
}

const char* token_lexeme(TokenKind k) {
    switch (k) {
    case TokenKind::LeftParen:    return "(";
    case TokenKind::RightParen:   return ")";
    case TokenKind::LeftBrace:    return "{";
    case TokenKind::RightBrace:   return "}";
    case TokenKind::Comma:        return ",";
    case TokenKind::Dot:          return ".";
    case TokenKind::Minus:        return "-";
    case TokenKind::Plus:         return "+";
    case TokenKind::Semicolon:    return ";";
    case TokenKind::Slash:        return "/";
    case TokenKind::Star:         return "*";
    case TokenKind::Bang:         return "!";
    case TokenKind::BangEqual:    return "!=";
    case TokenKind::Equal:        return "=";
    case TokenKind::EqualEqual:   return "==";
    case TokenKind::Greater:      return ">";
    case TokenKind::GreaterEqual: return ">=";
    case TokenKind::Less:         return "<";
    case TokenKind::LessEqual:    return "<=";
    case TokenKind::KwAnd:        return "and";
    case TokenKind::KwClass:      return "class";
    case TokenKind::KwElse:       return "else";
    case TokenKind::KwFalse:      return "false";
    case TokenKind::KwFun:        return "fun";
    case TokenKind::KwFor:        return "for";
    case TokenKind::KwIf:         return "if";
    case TokenKind::KwNil:        return "nil";
    case TokenKind::KwOr:         return "or";
    case TokenKind::KwPrint:      return "print";
    case TokenKind::KwReturn:     return "return";
    case TokenKind::KwSuper:      return "super";
    case TokenKind::KwThis:       return "this";
    case TokenKind::KwTrue:       return "true";
    case TokenKind::KwVar:        return "var";
    case TokenKind::KwWhile:      return "while";
    case TokenKind::Identifier:
    case TokenKind::String:
    case TokenKind::Number:
    case TokenKind::Eof:
        return "";
    }
    return "";
}

std::string Token::describe() const {
    switch (kind) {
    case TokenKind::Identifier: return "identifier '" + text + "'";
    case TokenKind::String:     return "string \"" + text + "\"";
    case TokenKind::Number:     return "number " + format_number(number);
    case TokenKind::Eof:        return "end of input";
    default:
        return std::string("'") + token_lexeme(kind) + "'";
    }
}

bool operator==(const Token& a, const Token& b) {
    if (a.kind != b.kind || a.line != b.line) return false;
    switch (a.kind) {
    case TokenKind::Identifier:
    case TokenKind::String:
        return a.text == b.text;
    case TokenKind::Number:
        return a.number == b.number;
    default:
        return true;
    }
}

} // namespace lox
