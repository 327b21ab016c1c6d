//! # Node Tests
//!
//! Construction, ordered objects, equality, deep copies and JSON rendering.

#include "node/node.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace sidl;
using namespace sidl::node;

namespace {

auto at(uint32_t line, uint32_t column) -> SourceLocation {
    return SourceLocation{.file = "test.sidl", .line = line, .column = column};
}

auto number(int64_t value) -> Node {
    return Node(Number(value), at(1, 1));
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(NodeTest, ScalarKinds) {
    EXPECT_EQ(Node(at(1, 1)).kind(), NodeKind::Null);
    EXPECT_EQ(Node(true, at(1, 1)).kind(), NodeKind::Boolean);
    EXPECT_EQ(number(3).kind(), NodeKind::Number);
    EXPECT_EQ(Node("s", at(1, 1)).kind(), NodeKind::String);
    EXPECT_EQ(Node(NodeArray{}, at(1, 1)).kind(), NodeKind::Array);
    EXPECT_EQ(Node(NodeObject{}, at(1, 1)).kind(), NodeKind::Object);
}

TEST(NodeTest, KindNames) {
    EXPECT_EQ(node_kind_to_string(NodeKind::Null), "null");
    EXPECT_EQ(node_kind_to_string(NodeKind::Object), "object");
}

TEST(NodeTest, KeepsLocation) {
    Node node("x", at(4, 9));
    EXPECT_EQ(node.location.line, 4u);
    EXPECT_EQ(node.location.column, 9u);
    EXPECT_EQ(node.location.to_string(), "test.sidl:4:9");
}

TEST(NodeTest, NumberAccessors) {
    Number big(uint64_t{18446744073709551615ull});
    EXPECT_TRUE(big.is_integer());
    EXPECT_FALSE(big.try_as_i64().has_value());
    EXPECT_EQ(Number(uint64_t{5}).try_as_i64().value_or(0), 5);
    EXPECT_TRUE(Number(1.5).is_float());
    EXPECT_EQ(Number(int64_t{2}), Number(2.0));
}

// ============================================================================
// Objects
// ============================================================================

TEST(NodeObjectTest, InsertionOrder) {
    NodeObject object;
    EXPECT_TRUE(object.try_insert("zeta", at(1, 1), number(1)));
    EXPECT_TRUE(object.try_insert("alpha", at(1, 5), number(2)));
    EXPECT_TRUE(object.try_insert("mid", at(1, 9), number(3)));

    EXPECT_EQ(object.keys(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
    EXPECT_EQ(object.size(), 3u);
}

TEST(NodeObjectTest, DuplicateKeyIsRefused) {
    NodeObject object;
    ASSERT_TRUE(object.try_insert("a", at(1, 1), number(1)));

    Node second = number(2);
    EXPECT_FALSE(object.try_insert("a", at(2, 1), std::move(second)));
    EXPECT_EQ(object.size(), 1u);
    EXPECT_EQ(object.find("a")->value.as_number().i64, 1);
    EXPECT_EQ(object.find("a")->key_location.line, 1u);
}

TEST(NodeObjectTest, InsertUniqueKeepsFirstValue) {
    NodeObject object;
    object.insert_unique("target", at(1, 1), Node("Foo", at(1, 7)));
    object.insert_unique("traits", at(1, 1), Node(NodeArray{}, at(1, 11)));
    object.insert_unique("target", at(2, 1), Node("Bar", at(2, 7)));

    EXPECT_EQ(object.keys(), (std::vector<std::string>{"target", "traits"}));
    EXPECT_EQ(object.find("target")->value.as_string(), "Foo");
    EXPECT_EQ(object.find("target")->key_location.line, 1u);
    EXPECT_FALSE(object.try_insert("traits", at(3, 1), number(1)));
}

TEST(NodeObjectTest, Find) {
    NodeObject object;
    ASSERT_TRUE(object.try_insert("a", at(1, 1), Node("v", at(1, 4))));
    EXPECT_TRUE(object.contains("a"));
    EXPECT_FALSE(object.contains("b"));
    EXPECT_EQ(object.find("b"), nullptr);

    Node node(std::move(object), at(1, 1));
    ASSERT_NE(node.get("a"), nullptr);
    EXPECT_EQ(node.get("a")->as_string(), "v");
    EXPECT_EQ(node.get("missing"), nullptr);
    EXPECT_EQ(Node("scalar", at(1, 1)).get("a"), nullptr);
}

// ============================================================================
// Equality and Copies
// ============================================================================

TEST(NodeTest, EqualityIgnoresLocations) {
    EXPECT_EQ(Node("x", at(1, 1)), Node("x", at(9, 9)));
    EXPECT_NE(Node("x", at(1, 1)), Node("y", at(1, 1)));
    EXPECT_NE(Node(true, at(1, 1)), Node("true", at(1, 1)));
}

TEST(NodeTest, ObjectEqualityIsOrderSensitive) {
    NodeObject ab;
    ASSERT_TRUE(ab.try_insert("a", at(1, 1), number(1)));
    ASSERT_TRUE(ab.try_insert("b", at(1, 1), number(2)));

    NodeObject ba;
    ASSERT_TRUE(ba.try_insert("b", at(1, 1), number(2)));
    ASSERT_TRUE(ba.try_insert("a", at(1, 1), number(1)));

    Node left(ab.clone(), at(1, 1));
    EXPECT_EQ(left, Node(std::move(ab), at(5, 5)));
    EXPECT_NE(left, Node(std::move(ba), at(1, 1)));
}

TEST(NodeTest, CloneIsDeep) {
    NodeArray items;
    items.push_back(number(1));
    NodeObject inner;
    ASSERT_TRUE(inner.try_insert("k", at(2, 3), Node(std::move(items), at(2, 6))));
    Node original(std::move(inner), at(1, 1));

    Node copy = original.clone();
    EXPECT_EQ(copy, original);
    EXPECT_NE(&copy.as_object(), &original.as_object());
    EXPECT_EQ(copy.as_object().find("k")->key_location.column, 3u);
    EXPECT_EQ(copy.get("k")->location.column, 6u);
}

// ============================================================================
// JSON Rendering
// ============================================================================

TEST(NodeSerializerTest, Scalars) {
    EXPECT_EQ(Node(at(1, 1)).to_string(), "null");
    EXPECT_EQ(Node(false, at(1, 1)).to_string(), "false");
    EXPECT_EQ(number(-12).to_string(), "-12");
    EXPECT_EQ(Node(Number(uint64_t{18446744073709551615ull}), at(1, 1)).to_string(),
              "18446744073709551615");
    EXPECT_EQ(Node(Number(2.0), at(1, 1)).to_string(), "2.0");
    EXPECT_EQ(Node(Number(0.5), at(1, 1)).to_string(), "0.5");
}

TEST(NodeSerializerTest, StringEscaping) {
    EXPECT_EQ(Node("a\"b\\c\nd\te", at(1, 1)).to_string(), R"("a\"b\\c\nd\te")");
    EXPECT_EQ(Node(std::string("\x01", 1), at(1, 1)).to_string(), R"("\u0001")");
    EXPECT_EQ(Node("caf\xC3\xA9", at(1, 1)).to_string(), "\"caf\xC3\xA9\"");
}

TEST(NodeSerializerTest, CompactContainers) {
    NodeArray items;
    items.push_back(number(1));
    items.push_back(Node("two", at(1, 1)));
    NodeObject object;
    ASSERT_TRUE(object.try_insert("list", at(1, 1), Node(std::move(items), at(1, 1))));
    ASSERT_TRUE(object.try_insert("empty", at(1, 1), Node(NodeObject{}, at(1, 1))));

    Node node(std::move(object), at(1, 1));
    EXPECT_EQ(node.to_string(), R"({"list":[1,"two"],"empty":{}})");

    std::ostringstream oss;
    oss << node;
    EXPECT_EQ(oss.str(), node.to_string());
}

TEST(NodeSerializerTest, PrettyOutput) {
    NodeArray items;
    items.push_back(number(1));
    NodeObject object;
    ASSERT_TRUE(object.try_insert("a", at(1, 1), Node(std::move(items), at(1, 1))));
    ASSERT_TRUE(object.try_insert("b", at(1, 1), Node(NodeArray{}, at(1, 1))));

    Node node(std::move(object), at(1, 1));
    EXPECT_EQ(node.to_string_pretty(), "{\n  \"a\": [\n    1\n  ],\n  \"b\": []\n}");
}
