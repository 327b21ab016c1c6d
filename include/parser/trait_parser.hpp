//! # Trait Applications
//!
//! Parses the documentation comment and `@trait` applications written in
//! front of a shape or member, or inside an `apply` block.
//!
//! ## Grammar
//!
//! ```text
//! trait_list       := trait*
//! trait            := "@" shape_id [ "(" trait_body? ")" ]
//! trait_body       := node | shorthand_object
//! shorthand_object := key ":" node (key ":" node)*      key := identifier | string
//! ```
//!
//! ## Forms
//!
//! | Source                   | Kind         | Value                     |
//! |--------------------------|--------------|---------------------------|
//! | `@sensitive`             | `Annotation` | null                      |
//! | `@sensitive()`           | `Annotation` | null                      |
//! | `@length(10)`            | `Value`      | number                    |
//! | `@range(min: 1, max: 5)` | `Value`      | object `{min, max}`       |
//! | `@tags(["a", "b"])`      | `Value`      | array                     |
//! | `/// Docs`               | `DocComment` | string                    |
//!
//! Trait names are returned exactly as written. Resolving them against the
//! namespace and checking values against trait schemas happens later.

#ifndef SIDL_PARSER_TRAIT_PARSER_HPP
#define SIDL_PARSER_TRAIT_PARSER_HPP

#include "node/node.hpp"
#include "parser/reference_resolver.hpp"
#include "parser/token_cursor.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sidl::parser {

/// Name given to the record synthesized from a documentation comment.
inline constexpr std::string_view DOCUMENTATION_TRAIT = "sidl.api#documentation";

enum class TraitKind : uint8_t {
    Value,      ///< `@name(body)`
    Annotation, ///< `@name` or `@name()`, always with a null value
    DocComment, ///< Synthesized from `///` lines
};

[[nodiscard]] auto trait_kind_to_string(TraitKind kind) -> std::string_view;

/// A parsed but unresolved trait application.
struct TraitApplication {
    std::string name;        ///< Shape id as written (possibly relative)
    node::Node value;        ///< Null for annotations
    TraitKind kind;
    SourceLocation location; ///< The `@`, or the first `///` for doc comments
};

/// Parses the doc comment and traits in front of a shape or member.
///
/// When a documentation comment precedes the traits its record is appended
/// after all of them, whatever the textual order. Any error discards the
/// whole list.
[[nodiscard]] auto parse_leading_traits(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<std::vector<TraitApplication>, ParseError>;

/// Parses consecutive `@trait` applications; stops at the first other token.
[[nodiscard]] auto expect_and_skip_traits(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<std::vector<TraitApplication>, ParseError>;

/// Parses one application; the cursor must be on `@`.
[[nodiscard]] auto expect_and_skip_trait(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<TraitApplication, ParseError>;

} // namespace sidl::parser

#endif // SIDL_PARSER_TRAIT_PARSER_HPP
