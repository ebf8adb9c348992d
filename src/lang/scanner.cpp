#include <lox/lang/scanner.hpp>
#include <lox/log.hpp>
#include <cctype>
#include <cstdlib>

namespace lox {

namespace {

bool is_word_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// ---------------------------------------------------------------------------
// Scanner state machine
// ---------------------------------------------------------------------------

struct Scanner {
    const std::string& source;
    size_t pos;
    int line;

    std::vector<Token> tokens;
    ErrorState errors;

    Scanner(const std::string& src, int starting_line)
        : source(src), pos(0), line(starting_line),
          errors(ErrorState::scanner()) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return at_end() ? '\0' : source[pos]; }

    char advance() { return source[pos++]; }

    void emit(TokenKind kind) {
        tokens.push_back(Token::simple(kind, line));
    }

    void fail(const std::string& msg, int at_line) {
        errors.add(LoxError{LoxError::Scan, msg, at_line});
    }

    // Consume the next character if it is '=' and pick the two-char form
    void emit_either(TokenKind with_equal, TokenKind without) {
        if (peek() == '=') {
            advance();
            emit(with_equal);
        } else {
            emit(without);
        }
    }

    Result<std::vector<Token>> run() {
        while (!at_end()) {
            scan_token();
        }
        emit(TokenKind::Eof);

        log::debug("scanned %zu tokens, %zu errors", tokens.size(), errors.size());

        if (!errors.empty()) {
            return std::move(errors);
        }
        return Result<std::vector<Token>>::ok(std::move(tokens));
    }

    void scan_token() {
        char c = advance();
        switch (c) {
        case '(': emit(TokenKind::LeftParen); break;
        case ')': emit(TokenKind::RightParen); break;
        case '{': emit(TokenKind::LeftBrace); break;
        case '}': emit(TokenKind::RightBrace); break;
        case ',': emit(TokenKind::Comma); break;
        case '.': emit(TokenKind::Dot); break;
        case '-': emit(TokenKind::Minus); break;
        case '+': emit(TokenKind::Plus); break;
        case ';': emit(TokenKind::Semicolon); break;
        case '*': emit(TokenKind::Star); break;

        case '!': emit_either(TokenKind::BangEqual, TokenKind::Bang); break;
        case '=': emit_either(TokenKind::EqualEqual, TokenKind::Equal); break;
        case '>': emit_either(TokenKind::GreaterEqual, TokenKind::Greater); break;
        case '<': emit_either(TokenKind::LessEqual, TokenKind::Less); break;

        case '/':
            if (peek() == '/') {
                skip_line_comment();
            } else {
                emit(TokenKind::Slash);
            }
            break;

        case '"':
            scan_string();
            break;

        case ' ':
        case '\r':
        case '\t':
            break;

        case '\n':
            ++line;
            break;

        default:
            if (is_digit(c)) {
                scan_number(c);
            } else if (is_word_char(c)) {
                scan_word(c);
            } else {
                fail("unexpected character: " + take_character(c), line);
            }
            break;
        }
    }

    // Source is UTF-8: a lead byte takes its continuation bytes with it
    std::string take_character(char first) {
        std::string text(1, first);
        if (static_cast<unsigned char>(first) >= 0xC0) {
            while (!at_end() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
                text += advance();
            }
        }
        return text;
    }

    // The newline itself is left for scan_token so the line count advances
    void skip_line_comment() {
        while (!at_end() && peek() != '\n') {
            advance();
        }
    }

    void scan_string() {
        int start_line = line;
        std::string text;
        while (!at_end() && peek() != '"') {
            char c = advance();
            if (c == '\n') ++line;
            text += c;
        }

        if (at_end()) {
            fail("unterminated string", start_line);
            return;
        }

        advance(); // closing "
        tokens.push_back(Token::string(std::move(text), start_line));
    }

    void scan_number(char first) {
        std::string text(1, first);
        while (!at_end() && (is_digit(peek()) || peek() == '.')) {
            text += advance();
        }

        const char* begin = text.c_str();
        char* end = nullptr;
        float n = std::strtof(begin, &end);
        if (end != begin + text.size()) {
            fail("invalid number literal: " + text, line);
            return;
        }
        tokens.push_back(Token::number_literal(n, line));
    }

    void scan_word(char first) {
        std::string text(1, first);
        while (!at_end() && is_word_char(peek())) {
            text += advance();
        }

        auto& kws = keywords();
        auto it = kws.find(text);
        if (it != kws.end()) {
            emit(it->second);
        } else {
            tokens.push_back(Token::identifier(std::move(text), line));
        }
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<std::vector<Token>> scan(const std::string& source, int starting_line) {
    Scanner scanner(source, starting_line);
    return scanner.run();
}

} // namespace lox
