#include <gtest/gtest.h>
#include "weft/tokens/lexer.hpp"
#include "weft/tokens/source.hpp"

using namespace weft;
using namespace weft::tokens;

// ============================================================================
// Lexer Tests
// ============================================================================

class LexerTest : public ::testing::Test {
protected:
    TokenStream tokenize_ok(std::string_view source) {
        auto result = tokenize(source);
        EXPECT_TRUE(result.is_ok()) << (result.is_err() ? result.error().to_string().c_str() : "");
        if (result.is_err()) {
            return {};
        }
        return std::move(result).value();
    }

    LexError tokenize_err(std::string_view source) {
        auto result = tokenize(source);
        EXPECT_TRUE(result.is_err());
        if (result.is_ok()) {
            return {};
        }
        return result.error();
    }
};

TEST_F(LexerTest, EmptyInput) {
    auto tokens = tokenize_ok("");
    EXPECT_TRUE(tokens.empty());

    tokens = tokenize_ok("  // comment only\n /* block */ ");
    EXPECT_TRUE(tokens.empty());
}

TEST_F(LexerTest, Identifiers) {
    auto tokens = tokenize_ok("div _private x1");

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_TRUE(tokens[0].is_ident("div"));
    EXPECT_TRUE(tokens[1].is_ident("_private"));
    EXPECT_TRUE(tokens[2].is_ident("x1"));
}

TEST_F(LexerTest, NonAsciiIdentifier) {
    auto tokens = tokenize_ok("caf\xC3\xA9 x");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_TRUE(tokens[0].is_ident("caf\xC3\xA9"));
    EXPECT_EQ(tokens[1].span.column, 6u);
}

TEST_F(LexerTest, PunctSpacing) {
    auto tokens = tokenize_ok("</a> a::b");

    ASSERT_EQ(tokens.size(), 8u);
    EXPECT_TRUE(tokens[0].is_punct('<'));
    EXPECT_EQ(tokens[0].spacing, Spacing::Joint);
    EXPECT_TRUE(tokens[1].is_punct('/'));
    EXPECT_EQ(tokens[1].spacing, Spacing::Alone);
    EXPECT_TRUE(tokens[3].is_punct('>'));
    EXPECT_EQ(tokens[3].spacing, Spacing::Alone);
    EXPECT_TRUE(tokens[5].is_punct(':'));
    EXPECT_EQ(tokens[5].spacing, Spacing::Joint);
}

TEST_F(LexerTest, StringLiteral) {
    auto tokens = tokenize_ok(R"("hi \"there\"\n")");

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].is_string_literal());
    EXPECT_EQ(tokens[0].value, String("hi \"there\"\n"));
    EXPECT_EQ(tokens[0].text, String(R"("hi \"there\"\n")"));
}

TEST_F(LexerTest, UnicodeEscape) {
    auto tokens = tokenize_ok(R"("\u{4E2D}")");

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, String("\xE4\xB8\xAD"));
}

TEST_F(LexerTest, CharLiteral) {
    auto tokens = tokenize_ok("'a' '\\n'");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].literal_kind, LiteralKind::Char);
    EXPECT_EQ(tokens[0].value, String("a"));
    EXPECT_FALSE(tokens[0].is_string_literal());
    EXPECT_EQ(tokens[1].value, String("\n"));
}

TEST_F(LexerTest, Numbers) {
    auto tokens = tokenize_ok("42 1.5 2e10 7u8 x.0");

    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].literal_kind, LiteralKind::Integer);
    EXPECT_EQ(tokens[1].literal_kind, LiteralKind::Float);
    EXPECT_EQ(tokens[1].text, String("1.5"));
    EXPECT_EQ(tokens[2].literal_kind, LiteralKind::Float);
    EXPECT_EQ(tokens[3].literal_kind, LiteralKind::Integer);
    EXPECT_EQ(tokens[3].text, String("7u8"));
    EXPECT_TRUE(tokens[4].is_ident("x"));
    EXPECT_TRUE(tokens[5].is_punct('.'));
    EXPECT_EQ(tokens[6].text, String("0"));
}

TEST_F(LexerTest, Groups) {
    auto tokens = tokenize_ok("{ a (b) [c] }");

    ASSERT_EQ(tokens.size(), 1u);
    const auto& brace = tokens[0];
    ASSERT_TRUE(brace.is_group(Delimiter::Brace));
    ASSERT_EQ(brace.children.size(), 3u);
    EXPECT_TRUE(brace.children[1].is_group(Delimiter::Paren));
    EXPECT_TRUE(brace.children[2].is_group(Delimiter::Bracket));

    EXPECT_EQ(brace.open_span.start, 0u);
    EXPECT_EQ(brace.close_span.start, 12u);
    EXPECT_EQ(brace.span.start, 0u);
    EXPECT_EQ(brace.span.end, 13u);
}

TEST_F(LexerTest, LineAndColumn) {
    auto tokens = tokenize_ok("a\n  b");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].span.line, 1u);
    EXPECT_EQ(tokens[0].span.column, 1u);
    EXPECT_EQ(tokens[1].span.line, 2u);
    EXPECT_EQ(tokens[1].span.column, 3u);
}

TEST_F(LexerTest, CanonicalString) {
    auto tokens = tokenize_ok("a  +=\n b  { c } {} x . y");

    EXPECT_EQ(to_string(tokens), String("a += b { c } {} x . y"));
}

TEST_F(LexerTest, UnterminatedString) {
    auto error = tokenize_err("\"abc");
    EXPECT_EQ(error.message, String("unterminated string literal"));
    EXPECT_EQ(error.span.line, 1u);
    EXPECT_EQ(error.span.column, 1u);
}

TEST_F(LexerTest, UnclosedDelimiter) {
    auto error = tokenize_err("a { b");
    EXPECT_EQ(error.message, String("unclosed delimiter '{'"));
    EXPECT_EQ(error.span.column, 3u);
}

TEST_F(LexerTest, MismatchedDelimiter) {
    auto error = tokenize_err("( ]");
    EXPECT_EQ(error.message, String("mismatched closing delimiter ']', expected ')'"));
}

TEST_F(LexerTest, UnexpectedClosingDelimiter) {
    auto error = tokenize_err("a }");
    EXPECT_EQ(error.to_string(), String("1:3: unexpected closing delimiter '}'"));
}

TEST_F(LexerTest, UnterminatedComment) {
    auto error = tokenize_err("a /* b");
    EXPECT_EQ(error.message, String("unterminated block comment"));
}

// ============================================================================
// SourceMap Tests
// ============================================================================

TEST(SourceMapTest, TextOfSpan) {
    String source("<p> hello  world </p>");
    auto tokens = tokenize(source.view());
    ASSERT_TRUE(tokens.is_ok());
    SourceMap map(source);

    const auto& hello = tokens.value()[3];
    ASSERT_TRUE(hello.is_ident("hello"));
    auto text = map.text_of(hello.span);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, String("hello"));

    auto joined = map.join(tokens.value()[2].span, tokens.value()[5].span);
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(*map.text_of(*joined), String("> hello  world <"));
}

TEST(SourceMapTest, ForeignSpans) {
    SourceMap map(String("abc"), 1);

    EXPECT_FALSE(map.text_of(Span{}).has_value());
    EXPECT_FALSE(map.text_of(Span{2, 0, 1, 1, 1}).has_value());
    EXPECT_FALSE(map.text_of(Span{1, 0, 10, 1, 1}).has_value());
    EXPECT_FALSE(map.join(Span{1, 0, 1, 1, 1}, Span{2, 1, 2, 1, 2}).has_value());
}
