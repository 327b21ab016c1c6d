//! # Node Serializer
//!
//! Renders nodes as JSON text, either compact or indented. Objects are
//! written in member insertion order, so the output mirrors the order in
//! which keys appeared in the IDL source.
//!
//! | Character | Escape |
//! |-----------|--------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Line feed, carriage return, tab, backspace, form feed | `\n` `\r` `\t` `\b` `\f` |
//! | Other control (0x00-0x1F) | `\u00XX` |

#include "node/node.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace sidl::node {

namespace {

void append_escaped(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                out += oss.str();
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

auto format_number(const Number& num) -> std::string {
    switch (num.kind) {
    case Number::Kind::Int64:
        return std::to_string(num.i64);
    case Number::Kind::Uint64:
        return std::to_string(num.u64);
    case Number::Kind::Double: {
        if (std::isnan(num.f64) || std::isinf(num.f64)) {
            return "null";
        }
        std::ostringstream oss;
        oss << std::setprecision(17) << num.f64;
        std::string result = oss.str();
        if (result.find_first_of(".eE") == std::string::npos) {
            result += ".0";
        }
        return result;
    }
    }
    return "0";
}

/// Shared writer for both layouts; `indent == 0` selects compact output.
void serialize(const Node& node, std::string& out, int indent, int depth) {
    auto newline = [&](int level) {
        if (indent > 0) {
            out += '\n';
            out.append(static_cast<size_t>(indent * level), ' ');
        }
    };

    switch (node.kind()) {
    case NodeKind::Null:
        out += "null";
        return;
    case NodeKind::Boolean:
        out += node.as_bool() ? "true" : "false";
        return;
    case NodeKind::Number:
        out += format_number(node.as_number());
        return;
    case NodeKind::String:
        append_escaped(out, node.as_string());
        return;
    case NodeKind::Array: {
        const auto& items = node.as_array();
        if (items.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(depth + 1);
            serialize(items[i], out, indent, depth + 1);
        }
        newline(depth);
        out += ']';
        return;
    }
    case NodeKind::Object: {
        const auto& obj = node.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        bool first = true;
        for (const auto& member : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            newline(depth + 1);
            append_escaped(out, member.key);
            out += indent > 0 ? ": " : ":";
            serialize(member.value, out, indent, depth + 1);
        }
        newline(depth);
        out += '}';
        return;
    }
    }
}

} // namespace

auto Node::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, 0, 0);
    return out;
}

auto Node::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent, 0);
    return out;
}

auto Node::write_to(std::ostream& os) const -> std::ostream& {
    return os << to_string();
}

auto operator<<(std::ostream& os, const Node& node) -> std::ostream& {
    return node.write_to(os);
}

} // namespace sidl::node
