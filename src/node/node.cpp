//! # Node Implementation
//!
//! Construction of container nodes, the ordered object map, deep copies and
//! structural equality.
//!
//! ## Equality Semantics
//!
//! | Kind | Rule |
//! |------|------|
//! | null | All nulls are equal |
//! | boolean | Value comparison |
//! | number | `Number::operator==` |
//! | string | Byte comparison |
//! | array | Element-by-element in order |
//! | object | Same keys in the same order with equal values |
//!
//! Source locations never take part in equality, so the same text parsed
//! from two different files compares equal.

#include "node/node.hpp"

namespace sidl::node {

auto node_kind_to_string(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Null:
        return "null";
    case NodeKind::Boolean:
        return "boolean";
    case NodeKind::Number:
        return "number";
    case NodeKind::String:
        return "string";
    case NodeKind::Array:
        return "array";
    case NodeKind::Object:
        return "object";
    }
    return "unknown";
}

// ============================================================================
// NodeObject
// ============================================================================

NodeObject::~NodeObject() = default;

auto NodeObject::try_insert(std::string key, SourceLocation key_location, Node&& value) -> bool {
    auto [it, inserted] = index_.try_emplace(key, members_.size());
    if (!inserted) {
        return false;
    }
    members_.push_back(
        Member{.key = std::move(key), .key_location = key_location, .value = std::move(value)});
    return true;
}

void NodeObject::insert_unique(std::string key, SourceLocation key_location, Node&& value) {
    if (index_.contains(key)) {
        return;
    }
    index_.emplace(key, members_.size());
    members_.push_back(
        Member{.key = std::move(key), .key_location = key_location, .value = std::move(value)});
}

auto NodeObject::find(std::string_view key) const -> const Member* {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &members_[it->second];
}

auto NodeObject::size() const -> size_t {
    return members_.size();
}

auto NodeObject::empty() const -> bool {
    return members_.empty();
}

auto NodeObject::keys() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(members_.size());
    for (const auto& member : members_) {
        result.push_back(member.key);
    }
    return result;
}

auto NodeObject::begin() const -> std::vector<Member>::const_iterator {
    return members_.begin();
}

auto NodeObject::end() const -> std::vector<Member>::const_iterator {
    return members_.end();
}

auto NodeObject::clone() const -> NodeObject {
    NodeObject copy;
    for (const auto& member : members_) {
        // Keys are unique here, so every insert succeeds
        copy.insert_unique(member.key, member.key_location, member.value.clone());
    }
    return copy;
}

// ============================================================================
// Node
// ============================================================================

Node::Node(NodeArray value, SourceLocation loc)
    : data(make_box<NodeArray>(std::move(value))), location(loc) {}

Node::Node(NodeObject value, SourceLocation loc)
    : data(make_box<NodeObject>(std::move(value))), location(loc) {}

auto Node::get(std::string_view key) const -> const Node* {
    if (auto* obj = std::get_if<Box<NodeObject>>(&data)) {
        if (const auto* member = (*obj)->find(key)) {
            return &member->value;
        }
    }
    return nullptr;
}

auto Node::clone() const -> Node {
    switch (kind()) {
    case NodeKind::Null:
        return Node(location);
    case NodeKind::Boolean:
        return Node(as_bool(), location);
    case NodeKind::Number:
        return Node(as_number(), location);
    case NodeKind::String:
        return Node(as_string(), location);
    case NodeKind::Array: {
        NodeArray items;
        items.reserve(as_array().size());
        for (const auto& item : as_array()) {
            items.push_back(item.clone());
        }
        return Node(std::move(items), location);
    }
    case NodeKind::Object:
        return Node(as_object().clone(), location);
    }
    return Node(location);
}

auto Node::operator==(const Node& other) const -> bool {
    if (kind() != other.kind()) {
        return false;
    }

    switch (kind()) {
    case NodeKind::Null:
        return true;
    case NodeKind::Boolean:
        return as_bool() == other.as_bool();
    case NodeKind::Number:
        return as_number() == other.as_number();
    case NodeKind::String:
        return as_string() == other.as_string();
    case NodeKind::Array: {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }
    case NodeKind::Object: {
        const auto& lhs = as_object();
        const auto& rhs = other.as_object();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        auto rit = rhs.begin();
        for (const auto& member : lhs) {
            if (member.key != rit->key || member.value != rit->value) {
                return false;
            }
            ++rit;
        }
        return true;
    }
    }
    return false;
}

} // namespace sidl::node
