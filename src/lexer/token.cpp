//! # Token Utilities
//!
//! - `token_kind_to_string()`: display names for diagnostics
//! - `is_insignificant()`: trivia classification used by the cursor
//! - Typed accessors for token payloads

#include "lexer/token.hpp"

namespace sidl::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Space:
        return "space";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Comma:
        return "','";
    case TokenKind::Comment:
        return "comment";
    case TokenKind::DocComment:
        return "documentation comment";
    case TokenKind::String:
        return "string";
    case TokenKind::TextBlock:
        return "text block";
    case TokenKind::Number:
        return "number";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Dot:
        return "'.'";
    case TokenKind::Pound:
        return "'#'";
    case TokenKind::Dollar:
        return "'$'";
    case TokenKind::At:
        return "'@'";
    case TokenKind::Colon:
        return "':'";
    case TokenKind::Walrus:
        return "':='";
    case TokenKind::Equal:
        return "'='";
    case TokenKind::LBrace:
        return "'{'";
    case TokenKind::RBrace:
        return "'}'";
    case TokenKind::LBracket:
        return "'['";
    case TokenKind::RBracket:
        return "']'";
    case TokenKind::LParen:
        return "'('";
    case TokenKind::RParen:
        return "')'";
    case TokenKind::Error:
        return "error";
    case TokenKind::Eof:
        return "end of file";
    }
    return "unknown";
}

auto is_insignificant(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::Space:
    case TokenKind::Newline:
    case TokenKind::Comma:
    case TokenKind::Comment:
        return true;
    case TokenKind::DocComment:
    case TokenKind::String:
    case TokenKind::TextBlock:
    case TokenKind::Number:
    case TokenKind::Identifier:
    case TokenKind::Dot:
    case TokenKind::Pound:
    case TokenKind::Dollar:
    case TokenKind::At:
    case TokenKind::Colon:
    case TokenKind::Walrus:
    case TokenKind::Equal:
    case TokenKind::LBrace:
    case TokenKind::RBrace:
    case TokenKind::LBracket:
    case TokenKind::RBracket:
    case TokenKind::LParen:
    case TokenKind::RParen:
    case TokenKind::Error:
    case TokenKind::Eof:
        return false;
    }
    return false;
}

auto Token::string_value() const -> const std::string& {
    return std::get<std::string>(value);
}

auto Token::number_value() const -> const node::Number& {
    return std::get<node::Number>(value);
}

} // namespace sidl::lexer
