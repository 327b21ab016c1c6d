#include "parser/shape_id_parser.hpp"

namespace sidl::parser {

namespace {

/// Appends the current identifier to `out` and advances past it.
auto take_identifier(TokenCursor& cursor, std::string& out) -> Result<Unit, ParseError> {
    auto ok = cursor.expect({lexer::TokenKind::Identifier});
    if (is_err(ok)) {
        return unwrap_err(ok);
    }
    out += cursor.current_lexeme();
    cursor.advance();
    return Unit{};
}

} // namespace

auto expect_and_skip_shape_id(TokenCursor& cursor) -> Result<std::string, ParseError> {
    std::string id;

    auto first = take_identifier(cursor, id);
    if (is_err(first)) {
        return unwrap_err(first);
    }

    // Namespace segments
    while (cursor.current_kind() == lexer::TokenKind::Dot) {
        id += '.';
        cursor.advance();
        auto segment = take_identifier(cursor, id);
        if (is_err(segment)) {
            return unwrap_err(segment);
        }
    }

    if (cursor.current_kind() == lexer::TokenKind::Pound) {
        id += '#';
        cursor.advance();
        auto name = take_identifier(cursor, id);
        if (is_err(name)) {
            return unwrap_err(name);
        }
    }

    if (cursor.current_kind() == lexer::TokenKind::Dollar) {
        id += '$';
        cursor.advance();
        auto member = take_identifier(cursor, id);
        if (is_err(member)) {
            return unwrap_err(member);
        }
    }

    return id;
}

} // namespace sidl::parser
