//! # Lexer - Strings
//!
//! Quoted strings and text blocks.
//!
//! ## String Types
//!
//! | Type       | Syntax             | Description                           |
//! |------------|--------------------|---------------------------------------|
//! | Quoted     | `"hello"`          | May span lines; escapes processed     |
//! | Text block | `"""` ... `"""`    | Incidental indentation removed        |
//!
//! ## Escape Sequences
//!
//! | Escape   | Character                   |
//! |----------|-----------------------------|
//! | `\n`     | Newline                     |
//! | `\t`     | Tab                         |
//! | `\r`     | Carriage return             |
//! | `\b`     | Backspace                   |
//! | `\f`     | Form feed                   |
//! | `\\`     | Backslash                   |
//! | `\"`     | Double quote                |
//! | `\'`     | Single quote                |
//! | `\/`     | Slash                       |
//! | `\uXXXX` | UTF-16 code unit            |
//! | `\` EOL  | Line continuation (removed) |
//!
//! ## Text Blocks
//!
//! The opening `"""` must be followed by a line break, which is not part of
//! the value. The smallest indentation over all non-blank lines (and over
//! the closing line when it holds only whitespace) is removed from every
//! line, trailing spaces are stripped, and then escapes are processed.

#include "lexer/lexer.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

namespace sidl::lexer {

namespace {

void encode_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto hex_digit(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

/// Reads the four hex digits of `\uXXXX` starting at `pos`.
auto read_code_unit(std::string_view raw, size_t pos) -> std::optional<char32_t> {
    if (pos + 4 > raw.size()) {
        return std::nullopt;
    }
    char32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        int digit = hex_digit(raw[pos + i]);
        if (digit < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<char32_t>(digit);
    }
    return value;
}

auto is_blank(std::string_view line) -> bool {
    return std::all_of(line.begin(), line.end(), [](char c) { return c == ' ' || c == '\t'; });
}

auto leading_whitespace(std::string_view line) -> size_t {
    size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
        ++n;
    }
    return n;
}

/// Applies the text block indentation rules to the raw body.
auto format_text_block(std::string_view body) -> std::string {
    std::vector<std::string_view> lines;
    size_t start = 0;
    for (size_t i = 0; i <= body.size(); ++i) {
        if (i == body.size() || body[i] == '\n') {
            auto line = body.substr(start, i - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.push_back(line);
            start = i + 1;
        }
    }

    size_t min_indent = std::numeric_limits<size_t>::max();
    for (size_t i = 0; i < lines.size(); ++i) {
        bool closing = i + 1 == lines.size();
        if (!is_blank(lines[i]) || closing) {
            min_indent = std::min(min_indent, leading_whitespace(lines[i]));
        }
    }
    if (min_indent == std::numeric_limits<size_t>::max()) {
        min_indent = 0;
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = lines[i];
        bool closing = i + 1 == lines.size();
        if (is_blank(line)) {
            line = {};
        } else {
            line.remove_prefix(std::min(min_indent, line.size()));
            while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
                line.remove_suffix(1);
            }
        }
        result += line;
        if (!closing) {
            result += '\n';
        }
    }
    return result;
}

} // namespace

auto unescape(std::string_view raw, std::string& out) -> Result<Unit, std::string> {
    out.reserve(out.size() + raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            out += c;
            continue;
        }

        if (++i >= raw.size()) {
            return std::string("Unterminated escape sequence");
        }

        switch (raw[i]) {
        case '"':
            out += '"';
            break;
        case '\'':
            out += '\'';
            break;
        case '\\':
            out += '\\';
            break;
        case '/':
            out += '/';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case '\n':
            break;
        case '\r':
            if (i + 1 < raw.size() && raw[i + 1] == '\n') {
                ++i;
            }
            break;
        case 'u': {
            auto unit = read_code_unit(raw, i + 1);
            if (!unit) {
                return std::string("Invalid unicode escape: expected four hex digits after \\u");
            }
            i += 4;
            char32_t cp = *unit;
            // High surrogate followed by an escaped low surrogate
            if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
                raw[i + 2] == 'u') {
                auto low = read_code_unit(raw, i + 3);
                if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
                    i += 6;
                }
            }
            if (cp >= 0xD800 && cp <= 0xDFFF) {
                return std::string("Invalid unicode escape: unpaired surrogate");
            }
            encode_utf8(out, cp);
            break;
        }
        default:
            return "Invalid escape sequence: \\" + std::string(1, raw[i]);
        }
    }
    return Unit{};
}

auto Lexer::lex_string() -> Token {
    if (peek_next() == '"' && peek_n(2) == '"') {
        return lex_text_block();
    }

    // Skip opening quote
    advance();
    size_t body_start = pos_;

    while (!is_at_end() && peek() != '"') {
        if (peek() == '\\') {
            advance();
        }
        advance();
    }

    if (is_at_end()) {
        return make_error_token("Unterminated string literal");
    }

    auto raw = source_.slice(body_start, pos_);
    advance(); // closing quote

    std::string value;
    auto decoded = unescape(raw, value);
    if (is_err(decoded)) {
        return make_error_token(unwrap_err(decoded));
    }

    auto token = make_token(TokenKind::String);
    token.value = std::move(value);
    return token;
}

auto Lexer::lex_text_block() -> Token {
    // Skip """
    advance();
    advance();
    advance();

    if (peek() == '\r' && peek_next() == '\n') {
        advance();
    }
    if (peek() != '\n') {
        return make_error_token("Text block must start with a line break after the opening \"\"\"");
    }
    advance();
    size_t body_start = pos_;

    while (!is_at_end() && !(peek() == '"' && peek_next() == '"' && peek_n(2) == '"')) {
        if (peek() == '\\') {
            advance();
        }
        advance();
    }

    if (is_at_end()) {
        return make_error_token("Unterminated text block");
    }

    auto raw = source_.slice(body_start, pos_);
    advance();
    advance();
    advance();

    std::string value;
    auto decoded = unescape(format_text_block(raw), value);
    if (is_err(decoded)) {
        return make_error_token(unwrap_err(decoded));
    }

    auto token = make_token(TokenKind::TextBlock);
    token.value = std::move(value);
    return token;
}

} // namespace sidl::lexer
