//! # Apply Statements
//!
//! Attaches traits to a shape defined elsewhere:
//!
//! ```text
//! apply_statement := "apply" shape_id (trait | "{" trait* "}")
//! ```
//!
//! ```text
//! apply example.weather#City @tags(["public"])
//!
//! apply example.weather#City$name {
//!     @required
//!     @length(min: 1, max: 64)
//! }
//! ```

#ifndef SIDL_PARSER_APPLY_PARSER_HPP
#define SIDL_PARSER_APPLY_PARSER_HPP

#include "parser/trait_parser.hpp"

#include <string>
#include <vector>

namespace sidl::parser {

/// One `apply` statement with the traits it applies, in source order.
struct ApplyStatement {
    std::string target;      ///< Shape id as written
    SourceLocation location; ///< The `apply` keyword
    std::vector<TraitApplication> traits;
};

/// Parses a single statement; the cursor must be on the `apply` keyword.
[[nodiscard]] auto expect_and_skip_apply_statement(TokenCursor& cursor,
                                                   ReferenceResolver& resolver)
    -> Result<ApplyStatement, ParseError>;

/// Renders a statement as `{"target": ..., "traits": [{"name", "kind", "value"}]}`.
[[nodiscard]] auto to_node(const ApplyStatement& statement) -> node::Node;

/// Parses a document made only of apply statements, comments and
/// whitespace. The first error aborts the whole document.
[[nodiscard]] auto parse_apply_statements(TokenCursor& cursor, ReferenceResolver& resolver)
    -> Result<std::vector<ApplyStatement>, ParseError>;

} // namespace sidl::parser

#endif // SIDL_PARSER_APPLY_PARSER_HPP
