//! # Parse Errors
//!
//! The single error type returned by every parser in sidl. Parsers never
//! throw; a failed parse returns `ParseError` through `Result` and the
//! caller decides whether to stop or move on to the next document.

#ifndef SIDL_PARSER_PARSE_ERROR_HPP
#define SIDL_PARSER_PARSE_ERROR_HPP

#include "common.hpp"

#include <string>
#include <vector>

namespace sidl::parser {

/// Error categories.
enum class ErrorKind : uint8_t {
    Syntax,        ///< Unexpected token, malformed construct or duplicate key
    ResourceLimit, ///< Nesting deeper than `ParserOptions::max_nesting_depth`
};

/// A located parse failure.
struct ParseError {
    ErrorKind kind = ErrorKind::Syntax;
    std::string message;
    SourceLocation location;
    /// Display names of the token kinds that would have been accepted.
    std::vector<std::string> expected;

    /// Formats as `file:line:column: error: message`.
    [[nodiscard]] auto to_string() const -> std::string {
        return location.to_string() + ": error: " + message;
    }

    [[nodiscard]] static auto syntax(std::string message, SourceLocation location) -> ParseError {
        return ParseError{.kind = ErrorKind::Syntax,
                          .message = std::move(message),
                          .location = location,
                          .expected = {}};
    }

    [[nodiscard]] static auto resource_limit(std::string message, SourceLocation location)
        -> ParseError {
        return ParseError{.kind = ErrorKind::ResourceLimit,
                          .message = std::move(message),
                          .location = location,
                          .expected = {}};
    }
};

/// A non-fatal diagnostic collected during a parse.
struct ParseWarning {
    std::string message;
    SourceLocation location;
};

} // namespace sidl::parser

#endif // SIDL_PARSER_PARSE_ERROR_HPP
