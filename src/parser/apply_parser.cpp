#include "parser/apply_parser.hpp"

#include "log/log.hpp"
#include "parser/shape_id_parser.hpp"

namespace sidl::parser {

using lexer::TokenKind;

auto expect_and_skip_apply_statement(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<ApplyStatement, ParseError> {
    auto location = cursor.current_location();
    if (cursor.current_kind() != TokenKind::Identifier || cursor.current_lexeme() != "apply") {
        auto error = cursor.unexpected({TokenKind::Identifier});
        if (!cursor.current().is_error()) {
            error.message = "Expected 'apply' statement";
        }
        return error;
    }
    cursor.advance();

    auto space = cursor.expect({TokenKind::Space, TokenKind::Newline});
    if (is_err(space)) {
        return unwrap_err(space);
    }
    cursor.skip_insignificant();

    auto target = expect_and_skip_shape_id(cursor);
    if (is_err(target)) {
        return unwrap_err(target);
    }
    cursor.skip_insignificant();

    ApplyStatement statement{
        .target = std::move(unwrap(target)), .location = location, .traits = {}};

    switch (cursor.current_kind()) {
    case TokenKind::At: {
        auto trait = expect_and_skip_trait(cursor, resolver);
        if (is_err(trait)) {
            return unwrap_err(trait);
        }
        statement.traits.push_back(std::move(unwrap(trait)));
        break;
    }
    case TokenKind::LBrace: {
        cursor.advance();
        cursor.skip_insignificant_and_docs();
        auto traits = expect_and_skip_traits(cursor, resolver);
        if (is_err(traits)) {
            return unwrap_err(traits);
        }
        statement.traits = std::move(unwrap(traits));
        auto close = cursor.expect({TokenKind::RBrace});
        if (is_err(close)) {
            return unwrap_err(close);
        }
        cursor.advance();
        break;
    }
    default:
        return cursor.unexpected({TokenKind::At, TokenKind::LBrace});
    }

    SIDL_LOG_DEBUG("parser", "apply " << statement.target << ": " << statement.traits.size()
                                      << " trait(s)");
    return statement;
}

auto to_node(const ApplyStatement& statement) -> node::Node {
    node::NodeArray traits;
    for (const auto& trait : statement.traits) {
        node::NodeObject entry;
        entry.insert_unique("name", trait.location, node::Node(trait.name, trait.location));
        entry.insert_unique("kind", trait.location,
                            node::Node(std::string(trait_kind_to_string(trait.kind)),
                                       trait.location));
        entry.insert_unique("value", trait.value.location, trait.value.clone());
        traits.push_back(node::Node(std::move(entry), trait.location));
    }

    node::NodeObject result;
    result.insert_unique("target", statement.location,
                         node::Node(statement.target, statement.location));
    result.insert_unique("traits", statement.location,
                         node::Node(std::move(traits), statement.location));
    return node::Node(std::move(result), statement.location);
}

auto parse_apply_statements(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<std::vector<ApplyStatement>, ParseError> {
    std::vector<ApplyStatement> statements;

    cursor.skip_insignificant_and_docs();
    while (!cursor.is_at_end()) {
        auto statement = expect_and_skip_apply_statement(cursor, resolver);
        if (is_err(statement)) {
            return unwrap_err(statement);
        }
        statements.push_back(std::move(unwrap(statement)));
        cursor.skip_insignificant_and_docs();
    }

    return statements;
}

} // namespace sidl::parser
