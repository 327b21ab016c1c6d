#include "parser/token_cursor.hpp"

#include "log/log.hpp"

namespace sidl::parser {

namespace {

auto describe(const lexer::Token& token) -> std::string {
    std::string text(lexer::token_kind_to_string(token.kind));
    switch (token.kind) {
    case lexer::TokenKind::Identifier:
    case lexer::TokenKind::Number:
    case lexer::TokenKind::String:
        text += " '";
        text += token.lexeme;
        text += "'";
        break;
    case lexer::TokenKind::Space:
    case lexer::TokenKind::Newline:
    case lexer::TokenKind::Comma:
    case lexer::TokenKind::Comment:
    case lexer::TokenKind::DocComment:
    case lexer::TokenKind::TextBlock:
    case lexer::TokenKind::Dot:
    case lexer::TokenKind::Pound:
    case lexer::TokenKind::Dollar:
    case lexer::TokenKind::At:
    case lexer::TokenKind::Colon:
    case lexer::TokenKind::Walrus:
    case lexer::TokenKind::Equal:
    case lexer::TokenKind::LBrace:
    case lexer::TokenKind::RBrace:
    case lexer::TokenKind::LBracket:
    case lexer::TokenKind::RBracket:
    case lexer::TokenKind::LParen:
    case lexer::TokenKind::RParen:
    case lexer::TokenKind::Error:
    case lexer::TokenKind::Eof:
        break;
    }
    return text;
}

} // namespace

TokenCursor::TokenCursor(std::vector<lexer::Token> tokens, ParserOptions options)
    : tokens_(std::move(tokens)), options_(options) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        tokens_.push_back(lexer::Token{.kind = lexer::TokenKind::Eof,
                                       .span = {},
                                       .lexeme = {},
                                       .value = std::monostate{}});
    }
}

auto TokenCursor::current() const -> const lexer::Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // Eof
    }
    return tokens_[pos_];
}

void TokenCursor::advance() {
    const auto& token = current();
    if (token.is_eof()) {
        return;
    }

    if (token.kind == lexer::TokenKind::DocComment) {
        pending_docs_.push_back(token.string_value());
    } else if (!lexer::is_insignificant(token.kind) && !pending_docs_.empty()) {
        // The comment preceded something other than a shape or member
        auto loc = token.span.start;
        SIDL_LOG_WARN("parser", loc.to_string()
                                    << ": documentation comment is not attached to a shape or "
                                       "member and was ignored");
        warnings_.push_back(ParseWarning{
            .message = "documentation comment is not attached to a shape or member",
            .location = loc});
        pending_docs_.clear();
    }

    ++pos_;
}

void TokenCursor::skip_insignificant() {
    while (lexer::is_insignificant(current_kind())) {
        advance();
    }
}

void TokenCursor::skip_insignificant_and_docs() {
    while (lexer::is_insignificant(current_kind()) ||
           current_kind() == lexer::TokenKind::DocComment) {
        advance();
    }
}

auto TokenCursor::unexpected(std::initializer_list<lexer::TokenKind> kinds) const -> ParseError {
    const auto& token = current();

    std::vector<std::string> expected;
    for (auto kind : kinds) {
        expected.emplace_back(lexer::token_kind_to_string(kind));
    }

    if (token.is_error()) {
        return ParseError{.kind = ErrorKind::Syntax,
                          .message = token.string_value(),
                          .location = token.span.start,
                          .expected = std::move(expected)};
    }

    std::string message;
    if (expected.size() == 1) {
        message = "Expected " + expected.front();
    } else {
        message = "Expected one of ";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0) {
                message += ", ";
            }
            message += expected[i];
        }
    }
    message += " but found " + describe(token);

    return ParseError{.kind = ErrorKind::Syntax,
                      .message = std::move(message),
                      .location = token.span.start,
                      .expected = std::move(expected)};
}

auto TokenCursor::expect(std::initializer_list<lexer::TokenKind> kinds) const
    -> Result<Unit, ParseError> {
    for (auto kind : kinds) {
        if (current_kind() == kind) {
            return Unit{};
        }
    }
    return unexpected(kinds);
}

auto TokenCursor::intern(std::string_view text) -> const std::string& {
    return *strings_.emplace(text).first;
}

auto TokenCursor::take_pending_doc_text() -> std::optional<std::string> {
    if (pending_docs_.empty()) {
        return std::nullopt;
    }

    std::string text;
    for (size_t i = 0; i < pending_docs_.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += pending_docs_[i];
    }
    pending_docs_.clear();
    return text;
}

auto TokenCursor::NestingGuard::error() const -> ParseError {
    return ParseError::resource_limit("Parser exceeded the maximum allowed depth of " +
                                          std::to_string(cursor_.options_.max_nesting_depth),
                                      cursor_.current_location());
}

} // namespace sidl::parser
