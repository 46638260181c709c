#include <gtest/gtest.h>
#include "weft/markup/parser.hpp"
#include "weft/markup/raw_text.hpp"
#include "weft/tokens/lexer.hpp"
#include "weft/tokens/source.hpp"

using namespace weft;
using namespace weft::markup;
using tokens::SourceMap;
using tokens::TokenStream;
using tokens::TokenTree;

// ============================================================================
// RawText Tests
// ============================================================================

class RawTextTest : public ::testing::Test {
protected:
    std::vector<Node> parse(std::string_view source) {
        m_source = String(source);
        auto lexed = tokens::tokenize(source);
        EXPECT_TRUE(lexed.is_ok());
        m_tokens = lexed.is_ok() ? std::move(lexed).value() : TokenStream{};

        auto [value, diagnostics] = parse_recoverable(m_tokens).split();
        return value ? std::move(*value) : std::vector<Node>{};
    }

    static const RawText* raw_child(const std::vector<Node>& nodes, usize index) {
        if (nodes.empty() || !nodes[0].children() || nodes[0].children()->size() <= index) {
            return nullptr;
        }
        return (*nodes[0].children())[index].as_raw_text();
    }

    String m_source;
    TokenStream m_tokens;
};

TEST_F(RawTextTest, SourceTextBetweenTags) {
    auto nodes = parse("<p> hello  world </p>");
    const RawText* raw = raw_child(nodes, 0);
    ASSERT_NE(raw, nullptr);

    SourceMap map(m_source);
    EXPECT_EQ(raw->to_string_best(&map), String(" hello  world "));
    EXPECT_EQ(raw->to_token_stream_string(), String("hello world"));

    auto without_whitespace = raw->to_source_text(map, false);
    ASSERT_TRUE(without_whitespace.has_value());
    EXPECT_EQ(*without_whitespace, String("hello  world"));
}

TEST_F(RawTextTest, TopLevelTextHasNoContext) {
    auto nodes = parse("hello  world");
    ASSERT_EQ(nodes.size(), 1u);
    const RawText* raw = nodes[0].as_raw_text();
    ASSERT_NE(raw, nullptr);

    SourceMap map(m_source);
    EXPECT_FALSE(raw->context_spans().has_value());
    EXPECT_FALSE(raw->to_source_text(map, true).has_value());
    EXPECT_EQ(raw->to_string_best(&map), String("hello  world"));
}

TEST_F(RawTextTest, TokenStringWithoutProvider) {
    auto nodes = parse("<p> hello  world </p>");
    const RawText* raw = raw_child(nodes, 0);
    ASSERT_NE(raw, nullptr);

    EXPECT_EQ(raw->to_string_best(), String("hello world"));
}

TEST_F(RawTextTest, TextAroundBlocks) {
    auto nodes = parse("<p>a  {x}  b</p>");
    ASSERT_EQ(nodes[0].children()->size(), 3u);

    SourceMap map(m_source);
    const RawText* before = raw_child(nodes, 0);
    const RawText* after = raw_child(nodes, 2);
    ASSERT_NE(before, nullptr);
    ASSERT_NE(after, nullptr);
    EXPECT_EQ(before->to_string_best(&map), String("a  "));
    EXPECT_EQ(after->to_string_best(&map), String("  b"));
}

TEST_F(RawTextTest, UnclosedElementLastChild) {
    auto nodes = parse("<p> a  b");
    const RawText* raw = raw_child(nodes, 0);
    ASSERT_NE(raw, nullptr);

    SourceMap map(m_source);
    EXPECT_FALSE(raw->context_spans().has_value());
    EXPECT_EQ(raw->to_string_best(&map), String("a  b"));
}

TEST_F(RawTextTest, SyntheticTokens) {
    RawText raw(TokenStream{TokenTree::ident("a"), TokenTree::ident("b")});
    SourceMap map(String("a b"));

    EXPECT_FALSE(raw.to_source_text(map, false).has_value());
    EXPECT_EQ(raw.to_string_best(&map), String("a b"));
    EXPECT_TRUE(raw.span().is_synthetic());
}

TEST_F(RawTextTest, ForeignSourceFallsBack) {
    auto nodes = parse("<p> hello  world </p>");
    const RawText* raw = raw_child(nodes, 0);
    ASSERT_NE(raw, nullptr);

    SourceMap other(m_source, 7);
    EXPECT_EQ(raw->to_string_best(&other), String("hello world"));
}

TEST_F(RawTextTest, EmptyRawText) {
    RawText raw;

    EXPECT_TRUE(raw.is_empty());
    EXPECT_EQ(raw.to_string_best(), String(""));
}

TEST_F(RawTextTest, VecSetContext) {
    auto nodes = parse("<p>a<br/>b</p>");
    const auto& children = *nodes[0].children();
    ASSERT_EQ(children.size(), 3u);

    const RawText* first = children[0].as_raw_text();
    ASSERT_NE(first, nullptr);
    ASSERT_TRUE(first->context_spans().has_value());
    EXPECT_EQ(first->context_spans()->second, children[1].span());

    const RawText* last = children[2].as_raw_text();
    ASSERT_NE(last, nullptr);
    ASSERT_TRUE(last->context_spans().has_value());
    EXPECT_EQ(last->context_spans()->first, children[1].span());
}
