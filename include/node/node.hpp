//! # Node Values
//!
//! The located value tree used for trait arguments and literal values in the
//! IDL. A `Node` is one of null, boolean, number, string, array or object,
//! and always carries the `SourceLocation` it was parsed from.
//!
//! ## Objects
//!
//! `NodeObject` keeps its members in insertion order and never overwrites a
//! member silently: `try_insert` refuses a key that is already present so the
//! caller can report the duplicate with both locations.
//!
//! ## Example
//!
//! ```cpp
//! NodeObject members;
//! members.try_insert("min", loc, Node(Number(int64_t{1}), loc));
//! Node range(std::move(members), loc);
//! std::cout << range.to_string() << "\n"; // {"min":1}
//! ```

#ifndef SIDL_NODE_NODE_HPP
#define SIDL_NODE_NODE_HPP

#include "common.hpp"

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sidl::node {

struct Node;

/// Discriminates the alternatives a `Node` can hold.
enum class NodeKind : uint8_t { Null, Boolean, Number, String, Array, Object };

/// Returns the lowercase display name of a node kind.
[[nodiscard]] auto node_kind_to_string(NodeKind kind) -> std::string_view;

// ============================================================================
// Number
// ============================================================================

/// A numeric literal stored in its most precise representation.
///
/// Literals without a fraction or exponent are integers (`Int64`, or `Uint64`
/// when too large for a signed value); everything else is `Double`.
struct Number {
    enum class Kind : uint8_t { Int64, Uint64, Double };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    explicit Number(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit Number(uint64_t value) : kind(Kind::Uint64), u64(value) {}
    explicit Number(double value) : kind(Kind::Double), f64(value) {}
    Number() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind != Kind::Double;
    }

    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Double;
    }

    /// Returns the value as `int64_t` when that is lossless.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        switch (kind) {
        case Kind::Int64:
            return i64;
        case Kind::Uint64:
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u64);
            }
            return std::nullopt;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// Returns the value as `double` (may lose precision above 2^53).
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }

    /// Numbers of different kinds compare by their double value.
    [[nodiscard]] auto operator==(const Number& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        switch (kind) {
        case Kind::Int64:
            return i64 == other.i64;
        case Kind::Uint64:
            return u64 == other.u64;
        case Kind::Double:
            return f64 == other.f64;
        }
        return false;
    }

    [[nodiscard]] auto operator!=(const Number& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Containers
// ============================================================================

class NodeObject;

/// An ordered sequence of nodes.
using NodeArray = std::vector<Node>;

// ============================================================================
// Node
// ============================================================================

/// A located value.
///
/// | Kind | Storage | Query | Accessor |
/// |------|---------|-------|----------|
/// | null | `std::monostate` | `is_null()` | - |
/// | boolean | `bool` | `is_bool()` | `as_bool()` |
/// | number | `Number` | `is_number()` | `as_number()` |
/// | string | `std::string` | `is_string()` | `as_string()` |
/// | array | `Box<NodeArray>` | `is_array()` | `as_array()` |
/// | object | `Box<NodeObject>` | `is_object()` | `as_object()` |
///
/// Nodes are move-only; use `clone()` for a deep copy.
struct Node {
    using Null = std::monostate;
    using ValueVariant =
        std::variant<Null, bool, Number, std::string, Box<NodeArray>, Box<NodeObject>>;

    ValueVariant data;
    SourceLocation location;

    Node() = default;
    explicit Node(SourceLocation loc) : data(Null{}), location(loc) {}
    Node(bool value, SourceLocation loc) : data(value), location(loc) {}
    Node(Number value, SourceLocation loc) : data(value), location(loc) {}
    Node(std::string value, SourceLocation loc) : data(std::move(value)), location(loc) {}
    Node(const char* value, SourceLocation loc) : data(std::string(value)), location(loc) {}
    Node(NodeArray value, SourceLocation loc);
    Node(NodeObject value, SourceLocation loc);

    Node(Node&&) noexcept = default;
    Node& operator=(Node&&) noexcept = default;
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    [[nodiscard]] auto kind() const -> NodeKind {
        return static_cast<NodeKind>(data.index());
    }

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<Number>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<NodeArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<NodeObject>>(data);
    }

    /// Typed accessors; throw `std::bad_variant_access` on a kind mismatch.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const Number& {
        return std::get<Number>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const NodeArray& {
        return *std::get<Box<NodeArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const NodeObject& {
        return *std::get<Box<NodeObject>>(data);
    }

    /// Returns the member value under `key` for objects, otherwise null.
    [[nodiscard]] auto get(std::string_view key) const -> const Node*;

    /// Compact JSON rendering.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Indented JSON rendering.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    auto write_to(std::ostream& os) const -> std::ostream&;

    [[nodiscard]] auto clone() const -> Node;

    /// Structural equality: kinds and values match, object member order
    /// included. Locations are not compared.
    [[nodiscard]] auto operator==(const Node& other) const -> bool;
    [[nodiscard]] auto operator!=(const Node& other) const -> bool {
        return !(*this == other);
    }
};

/// One member of an object: the key, where the key was written, and the value.
struct Member {
    std::string key;
    SourceLocation key_location;
    Node value;
};

/// An insertion-ordered object with unique keys.
///
/// Lookup goes through a key index; iteration follows insertion order.
class NodeObject {
public:
    NodeObject() = default;
    NodeObject(NodeObject&&) noexcept = default;
    NodeObject& operator=(NodeObject&&) noexcept = default;
    NodeObject(const NodeObject&) = delete;
    NodeObject& operator=(const NodeObject&) = delete;
    ~NodeObject();

    /// Appends a member unless `key` is already present.
    ///
    /// Returns `false` and leaves the object untouched on a duplicate key;
    /// `value` is not consumed in that case.
    [[nodiscard]] auto try_insert(std::string key, SourceLocation key_location, Node&& value)
        -> bool;

    /// Appends a member whose key the caller knows is new, such as the first
    /// member of an empty object or the fixed fields of a rendered record.
    /// A key that is already present keeps its first value.
    void insert_unique(std::string key, SourceLocation key_location, Node&& value);

    /// Returns the member stored under `key`, if any.
    [[nodiscard]] auto find(std::string_view key) const -> const Member*;

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return find(key) != nullptr;
    }

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto empty() const -> bool;

    /// Keys in insertion order.
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

    [[nodiscard]] auto begin() const -> std::vector<Member>::const_iterator;
    [[nodiscard]] auto end() const -> std::vector<Member>::const_iterator;

    [[nodiscard]] auto clone() const -> NodeObject;

private:
    std::vector<Member> members_;
    std::unordered_map<std::string, size_t> index_;
};

auto operator<<(std::ostream& os, const Node& node) -> std::ostream&;

} // namespace sidl::node

#endif // SIDL_NODE_NODE_HPP
