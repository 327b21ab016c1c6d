//! # Lexer Tests
//!
//! Token classification, literal decoding, doc comments and error tokens.

#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace sidl;
using namespace sidl::lexer;

class LexerTest : public ::testing::Test {
protected:
    // Keep source alive so Token.lexeme (string_view) remains valid
    std::unique_ptr<Source> source_;
    std::vector<LexerError> errors_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code, "test.sidl"));
        Lexer lexer(*source_);
        auto tokens = lexer.tokenize();
        errors_ = lexer.errors();
        return tokens;
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_GE(tokens.size(), 1u);
        return tokens[0];
    }

    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> result;
        for (const auto& token : lex(code)) {
            result.push_back(token.kind);
        }
        return result;
    }
};

// ============================================================================
// Punctuation and Trivia
// ============================================================================

TEST_F(LexerTest, Punctuation) {
    EXPECT_EQ(kinds("@:(){}[].#$="),
              (std::vector<TokenKind>{TokenKind::At, TokenKind::Colon, TokenKind::LParen,
                                      TokenKind::RParen, TokenKind::LBrace, TokenKind::RBrace,
                                      TokenKind::LBracket, TokenKind::RBracket, TokenKind::Dot,
                                      TokenKind::Pound, TokenKind::Dollar, TokenKind::Equal,
                                      TokenKind::Eof}));
}

TEST_F(LexerTest, Walrus) {
    EXPECT_EQ(kinds(":="), (std::vector<TokenKind>{TokenKind::Walrus, TokenKind::Eof}));
}

TEST_F(LexerTest, TriviaTokens) {
    EXPECT_EQ(kinds("a ,\t\nb\r\n"),
              (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Space, TokenKind::Comma,
                                      TokenKind::Space, TokenKind::Newline, TokenKind::Identifier,
                                      TokenKind::Newline, TokenKind::Eof}));
}

TEST_F(LexerTest, InsignificantKinds) {
    EXPECT_TRUE(is_insignificant(TokenKind::Space));
    EXPECT_TRUE(is_insignificant(TokenKind::Newline));
    EXPECT_TRUE(is_insignificant(TokenKind::Comma));
    EXPECT_TRUE(is_insignificant(TokenKind::Comment));
    EXPECT_FALSE(is_insignificant(TokenKind::DocComment));
    EXPECT_FALSE(is_insignificant(TokenKind::At));
    EXPECT_FALSE(is_insignificant(TokenKind::Eof));
}

TEST_F(LexerTest, EmptyInputIsJustEof) {
    auto tokens = lex("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].is_eof());
}

// ============================================================================
// Comments
// ============================================================================

TEST_F(LexerTest, LineComment) {
    auto token = lex_one("// hello");
    EXPECT_EQ(token.kind, TokenKind::Comment);
    EXPECT_EQ(token.lexeme, "// hello");
}

TEST_F(LexerTest, DocComment) {
    auto token = lex_one("/// Hello there");
    EXPECT_EQ(token.kind, TokenKind::DocComment);
    EXPECT_EQ(token.string_value(), "Hello there");
}

TEST_F(LexerTest, DocCommentKeepsExtraIndentation) {
    auto token = lex_one("///   indented");
    EXPECT_EQ(token.string_value(), "  indented");
}

TEST_F(LexerTest, EmptyDocComment) {
    auto token = lex_one("///");
    EXPECT_EQ(token.kind, TokenKind::DocComment);
    EXPECT_EQ(token.string_value(), "");
}

TEST_F(LexerTest, FourSlashesIsPlainComment) {
    EXPECT_EQ(lex_one("//// not docs").kind, TokenKind::Comment);
}

TEST_F(LexerTest, DocCommentStopsAtLineEnd) {
    EXPECT_EQ(kinds("/// a\n/// b\n"),
              (std::vector<TokenKind>{TokenKind::DocComment, TokenKind::Newline,
                                      TokenKind::DocComment, TokenKind::Newline, TokenKind::Eof}));
}

// ============================================================================
// Identifiers
// ============================================================================

TEST_F(LexerTest, Identifiers) {
    auto token = lex_one("smithy_api2");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.lexeme, "smithy_api2");
}

TEST_F(LexerTest, ShapeIdIsSplitIntoParts) {
    EXPECT_EQ(kinds("a.b#C$d"),
              (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Dot,
                                      TokenKind::Identifier, TokenKind::Pound,
                                      TokenKind::Identifier, TokenKind::Dollar,
                                      TokenKind::Identifier, TokenKind::Eof}));
}

// ============================================================================
// Strings
// ============================================================================

TEST_F(LexerTest, SimpleString) {
    auto token = lex_one("\"hello\"");
    EXPECT_EQ(token.kind, TokenKind::String);
    EXPECT_EQ(token.string_value(), "hello");
    EXPECT_EQ(token.lexeme, "\"hello\"");
}

TEST_F(LexerTest, EmptyString) {
    auto token = lex_one("\"\"");
    EXPECT_EQ(token.kind, TokenKind::String);
    EXPECT_EQ(token.string_value(), "");
}

TEST_F(LexerTest, StringEscapes) {
    auto token = lex_one(R"("a\"b\\c\/d\n\t")");
    EXPECT_EQ(token.kind, TokenKind::String);
    EXPECT_EQ(token.string_value(), "a\"b\\c/d\n\t");
}

TEST_F(LexerTest, UnicodeEscape) {
    EXPECT_EQ(lex_one("\"\\u00e9\"").string_value(), "\xC3\xA9");
    EXPECT_EQ(lex_one("\"\\ud83d\\ude00\"").string_value(), "\xF0\x9F\x98\x80");
}

TEST_F(LexerTest, UnpairedSurrogateIsRejected) {
    for (const char* code : {"\"\\ud800\"", "\"\\ude00\"", "\"\\ud83d x\"",
                             "\"\\ud83d\\u0041\""}) {
        auto token = lex_one(code);
        EXPECT_EQ(token.kind, TokenKind::Error) << code;
        ASSERT_EQ(errors_.size(), 1u) << code;
        EXPECT_EQ(errors_[0].message, "Invalid unicode escape: unpaired surrogate");
    }
}

TEST_F(LexerTest, StringMaySpanLines) {
    auto token = lex_one("\"a\nb\"");
    EXPECT_EQ(token.kind, TokenKind::String);
    EXPECT_EQ(token.string_value(), "a\nb");
}

TEST_F(LexerTest, EscapedLineBreakIsRemoved) {
    EXPECT_EQ(lex_one("\"a\\\nb\"").string_value(), "ab");
}

TEST_F(LexerTest, UnterminatedString) {
    auto token = lex_one("\"abc");
    EXPECT_EQ(token.kind, TokenKind::Error);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "Unterminated string literal");
}

TEST_F(LexerTest, InvalidEscape) {
    auto token = lex_one(R"("\q")");
    EXPECT_EQ(token.kind, TokenKind::Error);
    EXPECT_EQ(token.string_value(), "Invalid escape sequence: \\q");
}

// ============================================================================
// Text Blocks
// ============================================================================

TEST_F(LexerTest, TextBlockStripsIncidentalIndentation) {
    auto token = lex_one("\"\"\"\n    Hello\n      World\n    \"\"\"");
    EXPECT_EQ(token.kind, TokenKind::TextBlock);
    EXPECT_EQ(token.string_value(), "Hello\n  World\n");
}

TEST_F(LexerTest, TextBlockClosingOnContentLine) {
    auto token = lex_one("\"\"\"\n  Hello\"\"\"");
    EXPECT_EQ(token.kind, TokenKind::TextBlock);
    EXPECT_EQ(token.string_value(), "Hello");
}

TEST_F(LexerTest, TextBlockStripsTrailingSpaces) {
    auto token = lex_one("\"\"\"\nabc   \n\"\"\"");
    EXPECT_EQ(token.string_value(), "abc\n");
}

TEST_F(LexerTest, TextBlockProcessesEscapes) {
    auto token = lex_one("\"\"\"\n  a\\tb \\\"\"\"\n  \"\"\"");
    EXPECT_EQ(token.kind, TokenKind::TextBlock);
    EXPECT_EQ(token.string_value(), "a\tb \"\"\"\n");
}

TEST_F(LexerTest, TextBlockRequiresLineBreak) {
    auto tokens = lex("\"\"\"abc\"\"\"");
    EXPECT_EQ(tokens[0].kind, TokenKind::Error);
    EXPECT_FALSE(errors_.empty());
}

// ============================================================================
// Numbers
// ============================================================================

TEST_F(LexerTest, Integers) {
    auto token = lex_one("42");
    EXPECT_EQ(token.kind, TokenKind::Number);
    EXPECT_EQ(token.number_value().kind, node::Number::Kind::Int64);
    EXPECT_EQ(token.number_value().i64, 42);

    auto negative = lex_one("-7");
    EXPECT_EQ(negative.kind, TokenKind::Number);
    EXPECT_EQ(negative.number_value().i64, -7);
}

TEST_F(LexerTest, LargeUnsignedInteger) {
    auto token = lex_one("18446744073709551615");
    EXPECT_EQ(token.number_value().kind, node::Number::Kind::Uint64);
    EXPECT_EQ(token.number_value().u64, 18446744073709551615ull);
}

TEST_F(LexerTest, Floats) {
    auto token = lex_one("1.5");
    EXPECT_EQ(token.number_value().kind, node::Number::Kind::Double);
    EXPECT_DOUBLE_EQ(token.number_value().f64, 1.5);

    EXPECT_DOUBLE_EQ(lex_one("2e3").number_value().f64, 2000.0);
    EXPECT_DOUBLE_EQ(lex_one("-1.25E-2").number_value().f64, -0.0125);
}

TEST_F(LexerTest, LeadingZeroIsAnError) {
    EXPECT_EQ(lex_one("012").kind, TokenKind::Error);
}

TEST_F(LexerTest, MissingFractionDigits) {
    EXPECT_EQ(lex_one("1.").kind, TokenKind::Error);
}

// ============================================================================
// Errors and Locations
// ============================================================================

TEST_F(LexerTest, UnexpectedCharacterContinues) {
    auto tokens = lex("@ ; a");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[2].kind, TokenKind::Error);
    EXPECT_EQ(tokens[2].string_value(), "Unexpected character ';'");
    EXPECT_EQ(tokens[4].kind, TokenKind::Identifier);
    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].span.start.column, 3u);
}

TEST_F(LexerTest, TokenLocations) {
    auto tokens = lex("@a\n  @b");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].span.start.line, 1u);
    EXPECT_EQ(tokens[0].span.start.column, 1u);
    EXPECT_EQ(tokens[4].kind, TokenKind::At);
    EXPECT_EQ(tokens[4].span.start.line, 2u);
    EXPECT_EQ(tokens[4].span.start.column, 3u);
    EXPECT_EQ(tokens[4].span.start.file, "test.sidl");
}

// ============================================================================
// Source
// ============================================================================

TEST(SourceTest, LinesWithoutTerminators) {
    auto source = Source::from_string("apply A @a\r\n\napply B @b", "lines.sidl");
    EXPECT_EQ(source.line(1), "apply A @a");
    EXPECT_EQ(source.line(2), "");
    EXPECT_EQ(source.line(3), "apply B @b");
    EXPECT_EQ(source.line(0), "");
    EXPECT_EQ(source.line(4), "");
}
