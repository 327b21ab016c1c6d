//! # Shape Identifiers
//!
//! ```text
//! shape_id := identifier ("." identifier)* ["#" identifier] ["$" identifier]
//! ```
//!
//! No whitespace is allowed between the parts. The parser returns the raw
//! text; relative names like `required` are resolved later against the
//! document's namespace and imports.

#ifndef SIDL_PARSER_SHAPE_ID_PARSER_HPP
#define SIDL_PARSER_SHAPE_ID_PARSER_HPP

#include "parser/token_cursor.hpp"

#include <string>

namespace sidl::parser {

/// Consumes a shape id starting at the current token and returns its text.
[[nodiscard]] auto expect_and_skip_shape_id(TokenCursor& cursor)
    -> Result<std::string, ParseError>;

} // namespace sidl::parser

#endif // SIDL_PARSER_SHAPE_ID_PARSER_HPP
