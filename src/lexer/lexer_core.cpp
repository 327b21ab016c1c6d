//! # Lexer Core
//!
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error_token()`
//! - **Trivia**: spaces and comments, including `///` doc comments
//! - **Identifiers**: `[A-Za-z_][A-Za-z0-9_]*`

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace sidl::lexer {

auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : token_start_);

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_),
                 .value = std::monostate{}};
}

auto Lexer::make_error_token(const std::string& message) -> Token {
    auto token = make_token(TokenKind::Error);
    SIDL_LOG_DEBUG("lexer", message << " at " << token.span.start.to_string());
    errors_.push_back(LexerError{.message = message, .span = token.span});
    token.value = message;
    return token;
}

auto Lexer::lex_space() -> Token {
    while (peek() == ' ' || peek() == '\t') {
        advance();
    }
    return make_token(TokenKind::Space);
}

auto Lexer::lex_comment() -> Token {
    // Skip //
    advance();
    advance();

    // Exactly three slashes; //// and longer are plain comments
    bool is_doc = peek() == '/' && peek_next() != '/';
    if (!is_doc) {
        while (!is_at_end() && peek() != '\n' && peek() != '\r') {
            advance();
        }
        return make_token(TokenKind::Comment);
    }

    advance(); // third /
    if (peek() == ' ') {
        advance();
    }

    size_t text_start = pos_;
    while (!is_at_end() && peek() != '\n' && peek() != '\r') {
        advance();
    }

    auto token = make_token(TokenKind::DocComment);
    token.value = std::string(source_.slice(text_start, pos_));
    return token;
}

auto Lexer::lex_identifier() -> Token {
    while (is_identifier_continue(peek())) {
        advance();
    }
    return make_token(TokenKind::Identifier);
}

} // namespace sidl::lexer
