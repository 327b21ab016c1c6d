//! # Node Parser Tests

#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "parser/node_parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace sidl;
using namespace sidl::parser;
using sidl::lexer::Lexer;
using sidl::lexer::Source;

class NodeParserTest : public ::testing::Test {
protected:
    std::unique_ptr<Source> source_;
    std::unique_ptr<TokenCursor> cursor_;
    ForwardReferenceResolver resolver_;

    auto parse(const std::string& code, ParserOptions options = {})
        -> Result<node::Node, ParseError> {
        source_ = std::make_unique<Source>(Source::from_string(code, "test.sidl"));
        Lexer lexer(*source_);
        cursor_ = std::make_unique<TokenCursor>(lexer.tokenize(), options);
        return expect_and_skip_node(*cursor_, resolver_);
    }

    auto parse_json(const std::string& code) -> std::string {
        auto result = parse(code);
        if (is_err(result)) {
            return "error: " + unwrap_err(result).message;
        }
        return unwrap(result).to_string();
    }
};

TEST_F(NodeParserTest, Scalars) {
    EXPECT_EQ(parse_json("\"text\""), "\"text\"");
    EXPECT_EQ(parse_json("12"), "12");
    EXPECT_EQ(parse_json("-1.5"), "-1.5");
    EXPECT_EQ(parse_json("true"), "true");
    EXPECT_EQ(parse_json("null"), "null");
}

TEST_F(NodeParserTest, ScalarLocatedAtItsToken) {
    auto result = parse("\"x\"");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).location.column, 1u);
    EXPECT_EQ(unwrap(result).location.file, "test.sidl");
}

TEST_F(NodeParserTest, ShapeIdIsDeferred) {
    EXPECT_EQ(parse_json("example.weather#City$name"), "\"example.weather#City$name\"");
    ASSERT_EQ(resolver_.references().size(), 1u);
    EXPECT_EQ(resolver_.references()[0].name, "example.weather#City$name");
}

TEST_F(NodeParserTest, Arrays) {
    EXPECT_EQ(parse_json("[]"), "[]");
    EXPECT_EQ(parse_json("[1, 2, 3]"), "[1,2,3]");
    EXPECT_EQ(parse_json("[1 2\n3]"), "[1,2,3]");
    EXPECT_EQ(parse_json("[[\"a\"], []]"), "[[\"a\"],[]]");
}

TEST_F(NodeParserTest, Objects) {
    EXPECT_EQ(parse_json("{}"), "{}");
    EXPECT_EQ(parse_json("{b: 1, a: 2}"), "{\"b\":1,\"a\":2}");
    EXPECT_EQ(parse_json("{\"quoted key\": [true]}"), "{\"quoted key\":[true]}");
}

TEST_F(NodeParserTest, ObjectLocatedAtBrace) {
    auto result = parse("{a: 1}");
    ASSERT_TRUE(is_ok(result));
    const auto& node = unwrap(result);
    EXPECT_EQ(node.location.column, 1u);
    EXPECT_EQ(node.as_object().find("a")->key_location.column, 2u);
    EXPECT_EQ(node.get("a")->location.column, 5u);
}

TEST_F(NodeParserTest, CursorStopsAfterValue) {
    auto result = parse("[1] )");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(cursor_->current_kind(), lexer::TokenKind::Space);
}

TEST_F(NodeParserTest, DuplicateObjectKey) {
    auto result = parse("{a: 1, \"a\": 2}");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, ErrorKind::Syntax);
    EXPECT_EQ(error.message, "Duplicate member of object: 'a'");
    EXPECT_EQ(error.location.column, 8u);
}

TEST_F(NodeParserTest, UnclosedContainers) {
    EXPECT_EQ(parse_json("[1, 2"),
              "error: Expected one of string, text block, number, identifier, '{', '[' but found "
              "end of file");
    EXPECT_EQ(parse_json("{a: 1"),
              "error: Expected one of identifier, string, '}' but found end of file");
}

TEST_F(NodeParserTest, MissingColon) {
    EXPECT_EQ(parse_json("{a 1}"), "error: Expected ':' but found number '1'");
}

TEST_F(NodeParserTest, LexerErrorIsReported) {
    EXPECT_EQ(parse_json("[012]"), "error: Numbers cannot have leading zeros");
}

TEST_F(NodeParserTest, NestingLimit) {
    auto result = parse("[[[1]]]", ParserOptions{.max_nesting_depth = 2});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ResourceLimit);
    EXPECT_EQ(cursor_->depth(), 0u);
}
