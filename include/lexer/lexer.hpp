//! # sidl Lexer
//!
//! Converts IDL source text into a stream of tokens.
//!
//! ## Features
//!
//! - **Full-fidelity trivia**: spaces, newlines, commas and comments are
//!   emitted as tokens so the cursor decides what to skip
//! - **Doc comments**: `///` lines become `DocComment` tokens carrying their text
//! - **Text blocks**: `"""` blocks with incidental indentation removed
//! - **Precise numbers**: integers keep 64-bit precision
//!
//! ## Error Recovery
//!
//! The lexer continues after errors, producing `TokenKind::Error` tokens
//! whose payload is the error message. All errors are also collected and can
//! be retrieved via `errors()`.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("@required\n");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize();
//! ```

#ifndef SIDL_LEXER_LEXER_HPP
#define SIDL_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sidl::lexer {

/// An error encountered during lexical analysis.
struct LexerError {
    std::string message; ///< Human-readable error description.
    SourceSpan span;     ///< Location of the error in source.
};

/// Lexical analyzer for IDL source text.
class Lexer {
public:
    /// Constructs a lexer for the given source.
    ///
    /// The source must outlive the lexer and every token it produces.
    explicit Lexer(const Source& source);

    /// Returns the next token, or `Eof` at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the entire source. The result ends with exactly one `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;           ///< Reference to source being lexed.
    size_t pos_ = 0;                 ///< Current byte position in source.
    size_t token_start_ = 0;         ///< Start position of current token.
    std::vector<LexerError> errors_; ///< Accumulated lexer errors.

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    /// Creates a token of the given kind spanning `[token_start_, pos_)`.
    [[nodiscard]] auto make_token(TokenKind kind) -> Token;

    /// Records an error and returns an `Error` token carrying the message.
    [[nodiscard]] auto make_error_token(const std::string& message) -> Token;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    /// Lexes a run of spaces and tabs.
    [[nodiscard]] auto lex_space() -> Token;

    /// Lexes `//` comments; exactly three slashes make a doc comment.
    [[nodiscard]] auto lex_comment() -> Token;

    [[nodiscard]] auto lex_identifier() -> Token;

    /// Lexes a decimal number with optional fraction and exponent.
    [[nodiscard]] auto lex_number() -> Token;

    /// Lexes a quoted string or, when it opens with `"""`, a text block.
    [[nodiscard]] auto lex_string() -> Token;

    [[nodiscard]] auto lex_text_block() -> Token;

    [[nodiscard]] auto lex_punctuation() -> Token;
};

/// Returns true for `[A-Za-z_]`.
[[nodiscard]] auto is_identifier_start(char c) -> bool;

/// Returns true for `[A-Za-z0-9_]`.
[[nodiscard]] auto is_identifier_continue(char c) -> bool;

/// Decodes the escape sequences of a string or text block body, appending
/// the result to `out`.
///
/// Supports `\" \' \\ \/ \b \f \n \r \t \uXXXX` (surrogate pairs are
/// combined) and a backslash before a line break, which removes the break.
[[nodiscard]] auto unescape(std::string_view raw, std::string& out) -> Result<Unit, std::string>;

} // namespace sidl::lexer

#endif // SIDL_LEXER_LEXER_HPP
