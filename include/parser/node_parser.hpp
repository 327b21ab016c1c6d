//! # Node Values
//!
//! Parses the literal value grammar shared by trait bodies and other
//! value positions.
//!
//! ```text
//! node   := string | text_block | number | shape_id | object | array
//! object := "{" (key ":" node)* "}"        key := identifier | string
//! array  := "[" node* "]"
//! ```
//!
//! Commas are whitespace, so `[1, 2]` and `[1 2]` are the same array.
//! A bare shape id is handed to the `ReferenceResolver`.

#ifndef SIDL_PARSER_NODE_PARSER_HPP
#define SIDL_PARSER_NODE_PARSER_HPP

#include "node/node.hpp"
#include "parser/reference_resolver.hpp"
#include "parser/token_cursor.hpp"

#include <optional>

namespace sidl::parser {

/// Parses one value starting at the current token and leaves the cursor on
/// the token after it.
///
/// Scalars are located at `location` when one is given and at their own
/// token otherwise. Objects and arrays are always located at their opening
/// delimiter. Duplicate object keys are a Syntax error; nesting deeper than
/// the cursor allows is a ResourceLimit error.
[[nodiscard]] auto expect_and_skip_node(TokenCursor& cursor, ReferenceResolver& resolver,
                                        std::optional<SourceLocation> location = std::nullopt)
    -> Result<node::Node, ParseError>;

} // namespace sidl::parser

#endif // SIDL_PARSER_NODE_PARSER_HPP
