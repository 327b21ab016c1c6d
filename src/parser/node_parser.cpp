//! # Node Parser
//!
//! | Token          | Result                                       |
//! |----------------|----------------------------------------------|
//! | `String`       | String node                                  |
//! | `TextBlock`    | String node                                  |
//! | `Number`       | Number node                                  |
//! | `Identifier`   | Shape id, resolved by the `ReferenceResolver` |
//! | `{`            | Object node                                  |
//! | `[`            | Array node                                   |

#include "parser/node_parser.hpp"

#include "parser/shape_id_parser.hpp"

namespace sidl::parser {

namespace {

using lexer::TokenKind;

auto parse_object(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<node::Node, ParseError> {
    TokenCursor::NestingGuard guard(cursor);
    if (guard.exceeded()) {
        return guard.error();
    }

    auto location = cursor.current_location();
    cursor.advance(); // {
    cursor.skip_insignificant_and_docs();

    node::NodeObject members;
    while (cursor.current_kind() != TokenKind::RBrace) {
        auto key_ok = cursor.expect({TokenKind::Identifier, TokenKind::String, TokenKind::RBrace});
        if (is_err(key_ok)) {
            return unwrap_err(key_ok);
        }

        auto key_location = cursor.current_location();
        std::string key = cursor.current_kind() == TokenKind::String
                              ? cursor.current_string()
                              : std::string(cursor.current_lexeme());
        cursor.advance();
        cursor.skip_insignificant_and_docs();

        auto colon = cursor.expect({TokenKind::Colon});
        if (is_err(colon)) {
            return unwrap_err(colon);
        }
        cursor.advance();
        cursor.skip_insignificant_and_docs();

        auto value = expect_and_skip_node(cursor, resolver);
        if (is_err(value)) {
            return unwrap_err(value);
        }

        if (!members.try_insert(key, key_location, std::move(unwrap(value)))) {
            return ParseError::syntax("Duplicate member of object: '" + key + "'", key_location);
        }
        cursor.skip_insignificant_and_docs();
    }
    cursor.advance(); // }

    return node::Node(std::move(members), location);
}

auto parse_array(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<node::Node, ParseError> {
    TokenCursor::NestingGuard guard(cursor);
    if (guard.exceeded()) {
        return guard.error();
    }

    auto location = cursor.current_location();
    cursor.advance(); // [
    cursor.skip_insignificant_and_docs();

    node::NodeArray items;
    while (cursor.current_kind() != TokenKind::RBracket) {
        auto value = expect_and_skip_node(cursor, resolver);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        items.push_back(std::move(unwrap(value)));
        cursor.skip_insignificant_and_docs();
    }
    cursor.advance(); // ]

    return node::Node(std::move(items), location);
}

} // namespace

auto expect_and_skip_node(TokenCursor& cursor, ReferenceResolver& resolver,
                          std::optional<SourceLocation> location)
    -> Result<node::Node, ParseError> {
    auto loc = location.value_or(cursor.current_location());

    switch (cursor.current_kind()) {
    case TokenKind::String:
    case TokenKind::TextBlock: {
        node::Node result(cursor.current_string(), loc);
        cursor.advance();
        return result;
    }
    case TokenKind::Number: {
        node::Node result(cursor.current_number(), loc);
        cursor.advance();
        return result;
    }
    case TokenKind::Identifier: {
        auto id = expect_and_skip_shape_id(cursor);
        if (is_err(id)) {
            return unwrap_err(id);
        }
        return resolver.resolve_bare_identifier(cursor.intern(unwrap(id)), loc);
    }
    case TokenKind::LBrace:
        return parse_object(cursor, resolver);
    case TokenKind::LBracket:
        return parse_array(cursor, resolver);
    case TokenKind::Space:
    case TokenKind::Newline:
    case TokenKind::Comma:
    case TokenKind::Comment:
    case TokenKind::DocComment:
    case TokenKind::Dot:
    case TokenKind::Pound:
    case TokenKind::Dollar:
    case TokenKind::At:
    case TokenKind::Colon:
    case TokenKind::Walrus:
    case TokenKind::Equal:
    case TokenKind::RBrace:
    case TokenKind::RBracket:
    case TokenKind::LParen:
    case TokenKind::RParen:
    case TokenKind::Error:
    case TokenKind::Eof:
        break;
    }

    return cursor.unexpected({TokenKind::String, TokenKind::TextBlock, TokenKind::Number,
                              TokenKind::Identifier, TokenKind::LBrace, TokenKind::LBracket});
}

} // namespace sidl::parser
