//! # Common Definitions
//!
//! Types shared by every sidl component: source locations, the `Result`
//! error-return type, smart pointer aliases and the parser configuration.
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership
//! - **Located Data**: Everything the parser produces carries a `SourceLocation`

#ifndef SIDL_COMMON_HPP
#define SIDL_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace sidl {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Parser Configuration
// ============================================================================

/// Options that bound a single parse.
///
/// One instance is handed to each `TokenCursor`; nothing here is global.
struct ParserOptions {
    /// Maximum depth of nested objects, arrays and shorthand trait values.
    size_t max_nesting_depth = 64;
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// # Fields
///
/// - `file`: Name of the source (view into the owning `Source`)
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from file start
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;

    /// Formats the location as `file:line:column`.
    [[nodiscard]] auto to_string() const -> std::string {
        return std::string(file) + ":" + std::to_string(line) + ":" + std::to_string(column);
    }
};

/// A span of source code from start to end location.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = parse_leading_traits(cursor, resolver);
/// if (is_err(result)) {
///     report(unwrap_err(result));
///     return;
/// }
/// auto traits = std::move(unwrap(result));
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Success payload for operations that produce no value.
using Unit = std::monostate;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace sidl

#endif // SIDL_COMMON_HPP
