//! # Source Text
//!
//! An IDL document held in memory together with a line index, so byte offsets
//! produced by the lexer can be turned into line/column locations for
//! diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto loaded = Source::from_file("model/weather.sidl");
//! if (is_err(loaded)) {
//!     std::cerr << unwrap_err(loaded) << "\n";
//!     return;
//! }
//! Source source = std::move(unwrap(loaded));
//! SourceLocation loc = source.location(12);
//! ```

#ifndef SIDL_LEXER_SOURCE_HPP
#define SIDL_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sidl::lexer {

/// A named source document.
///
/// String views returned by `content()`, `slice()` and `line()`, and the
/// `file` field of every `SourceLocation` produced here, stay valid for as
/// long as the `Source` object exists.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns the text in `[start, end)`, clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns a line (1-based) without its line terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    /// Loads a document from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Wraps an in-memory document (tests, embedded models).
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace sidl::lexer

#endif // SIDL_LEXER_SOURCE_HPP
