//! # Lexer - Token Dispatch
//!
//! The `next_token()` entry point and the punctuation table.
//!
//! ## Dispatch Order
//!
//! 1. `Eof` at end of input
//! 2. Trivia: spaces, newlines, commas, comments and doc comments
//! 3. Identifiers
//! 4. Numbers (including a leading `-`)
//! 5. Strings and text blocks
//! 6. Punctuation

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace sidl::lexer {

auto Lexer::next_token() -> Token {
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (c == ' ' || c == '\t') {
        return lex_space();
    }

    if (c == '\n') {
        advance();
        return make_token(TokenKind::Newline);
    }

    if (c == '\r' && peek_next() == '\n') {
        advance();
        advance();
        return make_token(TokenKind::Newline);
    }

    if (c == ',') {
        advance();
        return make_token(TokenKind::Comma);
    }

    if (c == '/' && peek_next() == '/') {
        return lex_comment();
    }

    if (is_identifier_start(c)) {
        return lex_identifier();
    }

    if ((c >= '0' && c <= '9') || c == '-') {
        return lex_number();
    }

    if (c == '"') {
        return lex_string();
    }

    return lex_punctuation();
}

auto Lexer::lex_punctuation() -> Token {
    char c = advance();

    switch (c) {
    case '@':
        return make_token(TokenKind::At);
    case ':':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::Walrus);
        }
        return make_token(TokenKind::Colon);
    case '=':
        return make_token(TokenKind::Equal);
    case '.':
        return make_token(TokenKind::Dot);
    case '#':
        return make_token(TokenKind::Pound);
    case '$':
        return make_token(TokenKind::Dollar);
    case '{':
        return make_token(TokenKind::LBrace);
    case '}':
        return make_token(TokenKind::RBrace);
    case '[':
        return make_token(TokenKind::LBracket);
    case ']':
        return make_token(TokenKind::RBracket);
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    default:
        return make_error_token("Unexpected character '" + std::string(1, c) + "'");
    }
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;

    while (true) {
        Token token = next_token();
        bool done = token.is_eof();
        tokens.push_back(std::move(token));
        if (done) {
            break;
        }
    }

    SIDL_LOG_TRACE("lexer", "Tokenized " << source_.filename() << ": " << tokens.size()
                                         << " tokens, " << errors_.size() << " errors");
    return tokens;
}

} // namespace sidl::lexer
