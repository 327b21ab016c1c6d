//! # Token Cursor
//!
//! A positioned view over the lexer's token vector, shared by reference by
//! every parser in sidl. Exactly one parser advances it at a time; recursion
//! is the only reentrancy.
//!
//! ## Token Navigation
//!
//! | Method                          | Description                               |
//! |---------------------------------|-------------------------------------------|
//! | `current()`                     | Look at the current token                 |
//! | `advance()`                     | Move one token forward (stops at `Eof`)   |
//! | `skip_insignificant()`          | Skip spaces, newlines, commas, comments   |
//! | `skip_insignificant_and_docs()` | Same, and collect `///` lines             |
//! | `expect()`                      | Require one of the given kinds            |
//!
//! ## Documentation Comments
//!
//! Moving past a `DocComment` token appends its text to the pending doc
//! lines, which `take_pending_doc_text()` hands to the trait-list parser.
//! Moving past any other significant token while lines are still pending
//! discards them and records a `ParseWarning`: such comments sit in a place
//! where they document nothing (for example after a shape's traits).
//!
//! ## Nesting
//!
//! Recursive constructs hold a `NestingGuard` for their whole extent; the
//! guard restores the depth on every exit path.

#ifndef SIDL_PARSER_TOKEN_CURSOR_HPP
#define SIDL_PARSER_TOKEN_CURSOR_HPP

#include "common.hpp"
#include "lexer/token.hpp"
#include "parser/parse_error.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sidl::parser {

class TokenCursor {
public:
    /// Takes ownership of a token vector that ends with `Eof`.
    ///
    /// Tokens hold views into their `Source`, which must outlive the cursor.
    explicit TokenCursor(std::vector<lexer::Token> tokens, ParserOptions options = {});

    TokenCursor(const TokenCursor&) = delete;
    TokenCursor& operator=(const TokenCursor&) = delete;

    // ========================================================================
    // Current Token
    // ========================================================================

    [[nodiscard]] auto current() const -> const lexer::Token&;

    [[nodiscard]] auto current_kind() const -> lexer::TokenKind {
        return current().kind;
    }

    [[nodiscard]] auto current_location() const -> SourceLocation {
        return current().span.start;
    }

    [[nodiscard]] auto current_lexeme() const -> std::string_view {
        return current().lexeme;
    }

    /// Decoded text of the current `String` or `TextBlock` token.
    [[nodiscard]] auto current_string() const -> const std::string& {
        return current().string_value();
    }

    [[nodiscard]] auto current_number() const -> const node::Number& {
        return current().number_value();
    }

    [[nodiscard]] auto is_at_end() const -> bool {
        return current().is_eof();
    }

    // ========================================================================
    // Movement
    // ========================================================================

    void advance();

    void skip_insignificant();

    void skip_insignificant_and_docs();

    /// Succeeds when the current token is one of `kinds`; does not advance.
    [[nodiscard]] auto expect(std::initializer_list<lexer::TokenKind> kinds) const
        -> Result<Unit, ParseError>;

    /// Builds the error `expect` would return for the current token.
    [[nodiscard]] auto unexpected(std::initializer_list<lexer::TokenKind> kinds) const
        -> ParseError;

    // ========================================================================
    // Strings and Documentation
    // ========================================================================

    /// Returns a pooled copy of `text` that lives as long as the cursor.
    auto intern(std::string_view text) -> const std::string&;

    /// Returns the pending doc lines joined with '\n' and clears them, or
    /// `nullopt` when no line is pending.
    [[nodiscard]] auto take_pending_doc_text() -> std::optional<std::string>;

    [[nodiscard]] auto warnings() const -> const std::vector<ParseWarning>& {
        return warnings_;
    }

    // ========================================================================
    // Nesting
    // ========================================================================

    [[nodiscard]] auto options() const -> const ParserOptions& {
        return options_;
    }

    [[nodiscard]] auto depth() const -> size_t {
        return depth_;
    }

    /// Scoped increment of the cursor's nesting depth.
    class NestingGuard {
    public:
        explicit NestingGuard(TokenCursor& cursor) : cursor_(cursor) {
            ++cursor_.depth_;
        }

        ~NestingGuard() {
            --cursor_.depth_;
        }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

        /// True when the depth is above `ParserOptions::max_nesting_depth`.
        [[nodiscard]] auto exceeded() const -> bool {
            return cursor_.depth_ > cursor_.options_.max_nesting_depth;
        }

        /// The ResourceLimit error for the current token.
        [[nodiscard]] auto error() const -> ParseError;

    private:
        TokenCursor& cursor_;
    };

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    ParserOptions options_;
    size_t depth_ = 0;
    std::vector<std::string> pending_docs_;
    std::vector<ParseWarning> warnings_;
    std::unordered_set<std::string> strings_;
};

} // namespace sidl::parser

#endif // SIDL_PARSER_TOKEN_CURSOR_HPP
