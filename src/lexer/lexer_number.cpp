//! # Lexer - Numbers
//!
//! ## Grammar
//!
//! ```text
//! number := "-"? ("0" | [1-9][0-9]*) ("." [0-9]+)? ([eE] [+-]? [0-9]+)?
//! ```
//!
//! ## Storage
//!
//! | Literal                      | `Number::Kind` |
//! |------------------------------|----------------|
//! | Integer fitting `int64_t`    | `Int64`        |
//! | Larger non-negative integer  | `Uint64`       |
//! | Anything else                | `Double`       |

#include "lexer/lexer.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace sidl::lexer {

auto Lexer::lex_number() -> Token {
    bool negative = false;
    if (peek() == '-') {
        negative = true;
        advance();
    }

    if (!(peek() >= '0' && peek() <= '9')) {
        return make_error_token("Expected a digit after '-'");
    }

    if (peek() == '0') {
        advance();
        if (peek() >= '0' && peek() <= '9') {
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
            return make_error_token("Numbers cannot have leading zeros");
        }
    } else {
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }

    bool is_float = false;

    if (peek() == '.') {
        advance();
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error_token("Expected a digit after the decimal point");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
        is_float = true;
    }

    if (peek() == 'e' || peek() == 'E') {
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error_token("Expected a digit in the exponent");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
        is_float = true;
    }

    if (is_identifier_start(peek())) {
        while (is_identifier_continue(peek())) {
            advance();
        }
        return make_error_token("Invalid character in number literal");
    }

    auto text = source_.slice(token_start_, pos_);
    const char* first = text.data();
    const char* last = text.data() + text.size();

    auto token = make_token(TokenKind::Number);

    if (!is_float) {
        int64_t i64 = 0;
        auto [ptr, ec] = std::from_chars(first, last, i64);
        if (ec == std::errc() && ptr == last) {
            token.value = node::Number(i64);
            return token;
        }
        if (!negative) {
            uint64_t u64 = 0;
            auto [uptr, uec] = std::from_chars(first, last, u64);
            if (uec == std::errc() && uptr == last) {
                token.value = node::Number(u64);
                return token;
            }
        }
    }

    std::string buffer(text);
    token.value = node::Number(std::strtod(buffer.c_str(), nullptr));
    return token;
}

} // namespace sidl::lexer
