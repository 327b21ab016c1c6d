//! # Trait Parser
//!
//! ## Trait Body Dispatch
//!
//! | First token        | Next significant token | Result                        |
//! |--------------------|------------------------|-------------------------------|
//! | `{` or `[`         | -                      | Node parser                   |
//! | `TextBlock`        | -                      | String                        |
//! | `Number`           | -                      | Number                        |
//! | `String`           | `:`                    | Shorthand object              |
//! | `String`           | other                  | String                        |
//! | `Identifier`       | `:`                    | Shorthand object              |
//! | `Identifier`       | other                  | `ReferenceResolver` result    |
//!
//! Scalar trait values are located at the trait's `@`.

#include "parser/trait_parser.hpp"

#include "log/log.hpp"
#include "parser/node_parser.hpp"
#include "parser/shape_id_parser.hpp"

namespace sidl::parser {

namespace {

using lexer::TokenKind;

/// Parses `key: value (key: value)*` up to, not including, the `)`.
///
/// The cursor is just past the first key's `:`. The object is located at
/// the first key.
auto parse_structured_trait(TokenCursor& cursor, ReferenceResolver& resolver,
                            std::string first_key, SourceLocation first_key_location)
    -> Result<node::Node, ParseError> {
    TokenCursor::NestingGuard guard(cursor);
    if (guard.exceeded()) {
        return guard.error();
    }

    node::NodeObject members;

    auto first_value = expect_and_skip_node(cursor, resolver);
    if (is_err(first_value)) {
        return unwrap_err(first_value);
    }
    members.insert_unique(std::move(first_key), first_key_location,
                          std::move(unwrap(first_value)));
    cursor.skip_insignificant_and_docs();

    while (cursor.current_kind() != TokenKind::RParen) {
        auto key_ok = cursor.expect({TokenKind::Identifier, TokenKind::String});
        if (is_err(key_ok)) {
            return unwrap_err(key_ok);
        }

        auto key_location = cursor.current_location();
        const std::string& key = cursor.current_kind() == TokenKind::String
                                     ? cursor.intern(cursor.current_string())
                                     : cursor.intern(cursor.current_lexeme());
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
            return ParseError::syntax("Duplicate member of trait: '" + key + "'", key_location);
        }
        cursor.skip_insignificant_and_docs();
    }

    return node::Node(std::move(members), first_key_location);
}

/// Parses the value between `(` and `)` of a non-empty trait body.
auto parse_trait_value_body(TokenCursor& cursor, ReferenceResolver& resolver,
                            SourceLocation location) -> Result<node::Node, ParseError> {
    switch (cursor.current_kind()) {
    case TokenKind::LBrace:
    case TokenKind::LBracket: {
        auto result = expect_and_skip_node(cursor, resolver, location);
        cursor.skip_insignificant_and_docs();
        return result;
    }
    case TokenKind::TextBlock: {
        node::Node result(cursor.current_string(), location);
        cursor.advance();
        cursor.skip_insignificant_and_docs();
        return result;
    }
    case TokenKind::Number: {
        node::Node result(cursor.current_number(), location);
        cursor.advance();
        cursor.skip_insignificant_and_docs();
        return result;
    }
    case TokenKind::String: {
        std::string value = cursor.current_string();
        auto key_location = cursor.current_location();
        cursor.advance();
        cursor.skip_insignificant_and_docs();
        if (cursor.current_kind() == TokenKind::Colon) {
            cursor.advance();
            cursor.skip_insignificant_and_docs();
            return parse_structured_trait(cursor, resolver, std::move(value), key_location);
        }
        return node::Node(std::move(value), location);
    }
    case TokenKind::Identifier: {
        const std::string& identifier = cursor.intern(cursor.current_lexeme());
        auto key_location = cursor.current_location();
        cursor.advance();
        cursor.skip_insignificant_and_docs();
        if (cursor.current_kind() == TokenKind::Colon) {
            cursor.advance();
            cursor.skip_insignificant_and_docs();
            return parse_structured_trait(cursor, resolver, identifier, key_location);
        }
        return resolver.resolve_bare_identifier(identifier, location);
    }
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

    return cursor.unexpected({TokenKind::LBrace, TokenKind::LBracket, TokenKind::TextBlock,
                              TokenKind::String, TokenKind::Number, TokenKind::Identifier});
}

} // namespace

auto trait_kind_to_string(TraitKind kind) -> std::string_view {
    switch (kind) {
    case TraitKind::Value:
        return "value";
    case TraitKind::Annotation:
        return "annotation";
    case TraitKind::DocComment:
        return "doc_comment";
    }
    return "unknown";
}

auto expect_and_skip_trait(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<TraitApplication, ParseError> {
    auto location = cursor.current_location();
    auto at = cursor.expect({TokenKind::At});
    if (is_err(at)) {
        return unwrap_err(at);
    }
    cursor.advance();

    auto id = expect_and_skip_shape_id(cursor);
    if (is_err(id)) {
        return unwrap_err(id);
    }
    std::string name = std::move(unwrap(id));

    if (cursor.current_kind() != TokenKind::LParen) {
        SIDL_LOG_TRACE("parser", "Annotation trait @" << name << " at " << location.to_string());
        return TraitApplication{.name = std::move(name),
                                .value = node::Node(location),
                                .kind = TraitKind::Annotation,
                                .location = location};
    }

    cursor.advance();
    cursor.skip_insignificant_and_docs();

    if (cursor.current_kind() == TokenKind::RParen) {
        cursor.advance();
        return TraitApplication{.name = std::move(name),
                                .value = node::Node(location),
                                .kind = TraitKind::Annotation,
                                .location = location};
    }

    auto value = parse_trait_value_body(cursor, resolver, location);
    if (is_err(value)) {
        return unwrap_err(value);
    }

    cursor.skip_insignificant_and_docs();
    auto close = cursor.expect({TokenKind::RParen});
    if (is_err(close)) {
        return unwrap_err(close);
    }
    cursor.advance();

    SIDL_LOG_TRACE("parser", "Value trait @" << name << " at " << location.to_string());
    return TraitApplication{.name = std::move(name),
                            .value = std::move(unwrap(value)),
                            .kind = TraitKind::Value,
                            .location = location};
}

auto expect_and_skip_traits(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<std::vector<TraitApplication>, ParseError> {
    std::vector<TraitApplication> traits;
    while (cursor.current_kind() == TokenKind::At) {
        auto trait = expect_and_skip_trait(cursor, resolver);
        if (is_err(trait)) {
            return unwrap_err(trait);
        }
        traits.push_back(std::move(unwrap(trait)));
        cursor.skip_insignificant_and_docs();
    }
    return traits;
}

auto parse_leading_traits(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<std::vector<TraitApplication>, ParseError> {
    cursor.skip_insignificant();

    std::optional<TraitApplication> doc_comment;
    if (cursor.current_kind() == TokenKind::DocComment) {
        auto doc_location = cursor.current_location();
        cursor.skip_insignificant_and_docs();
        if (auto text = cursor.take_pending_doc_text()) {
            doc_comment = TraitApplication{.name = std::string(DOCUMENTATION_TRAIT),
                                           .value = node::Node(std::move(*text), doc_location),
                                           .kind = TraitKind::DocComment,
                                           .location = doc_location};
        }
    } else {
        cursor.skip_insignificant_and_docs();
    }

    auto traits = expect_and_skip_traits(cursor, resolver);
    if (is_err(traits)) {
        return unwrap_err(traits);
    }

    auto& result = unwrap(traits);
    if (doc_comment) {
        result.push_back(std::move(*doc_comment));
    }
    cursor.skip_insignificant_and_docs();

    return std::move(result);
}

} // namespace sidl::parser
