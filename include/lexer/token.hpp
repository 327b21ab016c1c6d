//! # Token Definitions
//!
//! The token kinds produced by the sidl lexer.
//!
//! ## Overview
//!
//! sidl tokens fall into a few groups:
//!
//! - **Trivia**: spaces, newlines, commas and line comments
//! - **Documentation**: `///` comments, which become documentation traits
//! - **Literals**: quoted strings, text blocks and numbers
//! - **Names**: identifiers and the `.` `#` `$` separators of shape ids
//! - **Punctuation**: `@`, `:`, `:=`, `=` and the three bracket pairs
//!
//! Commas are trivia in this IDL: `@range(min: 1, max: 2)` and
//! `@range(min: 1 max: 2)` produce the same significant tokens.

#ifndef SIDL_LEXER_TOKEN_HPP
#define SIDL_LEXER_TOKEN_HPP

#include "common.hpp"
#include "node/node.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sidl::lexer {

/// All token kinds of the IDL.
enum class TokenKind : uint8_t {
    // ========================================================================
    // Trivia
    // ========================================================================
    Space,   ///< Run of spaces or tabs
    Newline, ///< `\n` or `\r\n`
    Comma,   ///< `,`
    Comment, ///< `// ...`

    // ========================================================================
    // Documentation
    // ========================================================================
    DocComment, ///< `/// ...`

    // ========================================================================
    // Literals
    // ========================================================================
    String,    ///< `"text"`
    TextBlock, ///< `"""` block `"""`
    Number,    ///< `42`, `-1.5`, `2e10`

    // ========================================================================
    // Names
    // ========================================================================
    Identifier, ///< `foo`, `smithy_api`
    Dot,        ///< `.`
    Pound,      ///< `#`
    Dollar,     ///< `$`

    // ========================================================================
    // Punctuation
    // ========================================================================
    At,       ///< `@`
    Colon,    ///< `:`
    Walrus,   ///< `:=`
    Equal,    ///< `=`
    LBrace,   ///< `{`
    RBrace,   ///< `}`
    LBracket, ///< `[`
    RBracket, ///< `]`
    LParen,   ///< `(`
    RParen,   ///< `)`

    // ========================================================================
    // Special
    // ========================================================================
    Error, ///< Malformed input; the message is in the lexer's error list
    Eof,   ///< End of input
};

/// Returns the display name of a token kind, as used in diagnostics.
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Returns true for kinds the parser skips between significant tokens.
[[nodiscard]] auto is_insignificant(TokenKind kind) -> bool;

/// A lexical token.
struct Token {
    /// The kind of token.
    TokenKind kind;

    /// Source location of this token.
    SourceSpan span;

    /// Raw text from source code.
    std::string_view lexeme;

    /// Decoded payload.
    ///
    /// - `std::string` for `String`, `TextBlock` (unescaped text), `DocComment`
    ///   (the line without `///` and one leading space) and `Error` (message)
    /// - `node::Number` for `Number`
    /// - `std::monostate` otherwise
    std::variant<std::monostate, std::string, node::Number> value;

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] auto is_error() const -> bool {
        return kind == TokenKind::Error;
    }

    /// Gets the decoded text of a string, text block, doc comment or error.
    [[nodiscard]] auto string_value() const -> const std::string&;

    /// Gets the value of a number token.
    [[nodiscard]] auto number_value() const -> const node::Number&;
};

} // namespace sidl::lexer

#endif // SIDL_LEXER_TOKEN_HPP
