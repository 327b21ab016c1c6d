//! # Apply Statement Tests

#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "parser/apply_parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace sidl;
using namespace sidl::parser;
using sidl::lexer::Lexer;
using sidl::lexer::Source;

class ApplyParserTest : public ::testing::Test {
protected:
    std::unique_ptr<Source> source_;
    std::unique_ptr<TokenCursor> cursor_;
    ForwardReferenceResolver resolver_;

    auto parse(const std::string& code) -> Result<std::vector<ApplyStatement>, ParseError> {
        source_ = std::make_unique<Source>(Source::from_string(code, "apply.sidl"));
        Lexer lexer(*source_);
        cursor_ = std::make_unique<TokenCursor>(lexer.tokenize());
        return parse_apply_statements(*cursor_, resolver_);
    }

    auto parse_ok(const std::string& code) -> std::vector<ApplyStatement> {
        auto result = parse(code);
        if (is_err(result)) {
            ADD_FAILURE() << unwrap_err(result).to_string();
            return {};
        }
        return std::move(unwrap(result));
    }

    auto parse_error(const std::string& code) -> std::string {
        auto result = parse(code);
        if (is_ok(result)) {
            return "no error";
        }
        return unwrap_err(result).to_string();
    }
};

TEST_F(ApplyParserTest, EmptyDocument) {
    EXPECT_TRUE(parse_ok("").empty());
    EXPECT_TRUE(parse_ok("\n// only a comment\n").empty());
}

TEST_F(ApplyParserTest, SingleTrait) {
    auto statements = parse_ok("apply example.weather#City @tags([\"public\"])");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0].target, "example.weather#City");
    ASSERT_EQ(statements[0].traits.size(), 1u);
    EXPECT_EQ(statements[0].traits[0].name, "tags");
    EXPECT_EQ(statements[0].location.column, 1u);
}

TEST_F(ApplyParserTest, TraitBlock) {
    auto statements = parse_ok("apply City$name {\n"
                               "    @required\n"
                               "    @length(min: 1, max: 64)\n"
                               "}\n");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0].target, "City$name");
    ASSERT_EQ(statements[0].traits.size(), 2u);
    EXPECT_EQ(statements[0].traits[0].kind, TraitKind::Annotation);
    EXPECT_EQ(statements[0].traits[1].kind, TraitKind::Value);
    EXPECT_EQ(statements[0].traits[1].value.to_string(), R"({"min":1,"max":64})");
}

TEST_F(ApplyParserTest, EmptyTraitBlock) {
    auto statements = parse_ok("apply Foo {}");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_TRUE(statements[0].traits.empty());
}

TEST_F(ApplyParserTest, SeveralStatements) {
    auto statements = parse_ok("apply A @a\n\napply B @b\n");
    ASSERT_EQ(statements.size(), 2u);
    EXPECT_EQ(statements[0].target, "A");
    EXPECT_EQ(statements[1].target, "B");
    EXPECT_EQ(statements[1].location.line, 3u);
}

TEST_F(ApplyParserTest, RenderedAsJson) {
    auto statements = parse_ok("apply Foo {\n    @since(\"1.0\")\n    @sensitive\n}");
    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(to_node(statements[0]).to_string(),
              R"({"target":"Foo","traits":[)"
              R"({"name":"since","kind":"value","value":"1.0"},)"
              R"({"name":"sensitive","kind":"annotation","value":null}]})");
}

TEST_F(ApplyParserTest, NotAnApplyStatement) {
    EXPECT_EQ(parse_error("structure Foo {}"), "apply.sidl:1:1: error: Expected 'apply' statement");
}

TEST_F(ApplyParserTest, MissingSpaceAfterKeyword) {
    EXPECT_EQ(parse_error("apply@foo"),
              "apply.sidl:1:6: error: Expected one of space, newline but found '@'");
}

TEST_F(ApplyParserTest, MissingTraits) {
    EXPECT_EQ(parse_error("apply Foo\n"),
              "apply.sidl:2:1: error: Expected one of '@', '{' but found end of file");
}

TEST_F(ApplyParserTest, UnclosedBlock) {
    EXPECT_EQ(parse_error("apply Foo {\n    @required\n"),
              "apply.sidl:3:1: error: Expected '}' but found end of file");
}

TEST_F(ApplyParserTest, ErrorInLaterStatementFailsTheDocument) {
    auto result = parse("apply A @a\napply B @b(");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).location.line, 2u);
}
