#include <gtest/gtest.h>
#include "weft/markup/parser.hpp"
#include "weft/tokens/lexer.hpp"
#include "weft/tokens/source.hpp"

using namespace weft;
using namespace weft::markup;
using tokens::TokenStream;
using tokens::TokenTree;

// ============================================================================
// Markup Parser Tests
// ============================================================================

class MarkupParserTest : public ::testing::Test {
protected:
    ParseOutcome<std::vector<Node>> parse(std::string_view source, const ParserConfig& config = {}) {
        auto lexed = tokens::tokenize(source);
        EXPECT_TRUE(lexed.is_ok());
        m_tokens = lexed.is_ok() ? std::move(lexed).value() : TokenStream{};
        return parse_recoverable(m_tokens, config);
    }

    std::vector<Node> parse_ok(std::string_view source, const ParserConfig& config = {}) {
        auto outcome = parse(source, config);
        EXPECT_TRUE(outcome.is_ok()) << describe(outcome.diagnostics());
        auto [value, diagnostics] = std::move(outcome).split();
        return value ? std::move(*value) : std::vector<Node>{};
    }

    static std::string describe(const std::vector<Diagnostic>& diagnostics) {
        std::string out;
        for (const auto& diagnostic : diagnostics) {
            out += diagnostic.to_string().std_string();
            out += "\n";
        }
        return out;
    }

    TokenStream m_tokens;
};

TEST_F(MarkupParserTest, ElementWithAttributes) {
    auto nodes = parse_ok(R"(<foo a="x" b></foo>)");

    ASSERT_EQ(nodes.size(), 1u);
    const auto* element = nodes[0].as_element();
    ASSERT_NE(element, nullptr);
    EXPECT_EQ(element->name().to_string(), String("foo"));
    ASSERT_EQ(element->attributes().size(), 2u);

    const auto* a = std::get_if<KeyedAttribute>(&element->attributes()[0]);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->key_string(), String("a"));
    ASSERT_TRUE(a->value_string().has_value());
    EXPECT_EQ(*a->value_string(), String("x"));

    const auto* b = std::get_if<KeyedAttribute>(&element->attributes()[1]);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->key_string(), String("b"));
    EXPECT_FALSE(b->value.has_value());

    ASSERT_TRUE(element->close_tag.has_value());
    EXPECT_EQ(element->close_tag->name, element->name());
}

TEST_F(MarkupParserTest, NestedElements) {
    auto nodes = parse_ok("<div><open></open><close></close></div>");

    ASSERT_EQ(nodes.size(), 1u);
    const auto* children = nodes[0].children();
    ASSERT_NE(children, nullptr);
    ASSERT_EQ(children->size(), 2u);
    EXPECT_EQ((*children)[0].as_element()->name().to_string(), String("open"));
    EXPECT_EQ((*children)[1].as_element()->name().to_string(), String("close"));
}

TEST_F(MarkupParserTest, SelfClosingSyntax) {
    auto nodes = parse_ok(R"(<input type="text" /><br/>)");

    ASSERT_EQ(nodes.size(), 2u);
    const auto* input = nodes[0].as_element();
    ASSERT_NE(input, nullptr);
    EXPECT_TRUE(input->open_tag.self_closing);
    EXPECT_FALSE(input->close_tag.has_value());
    EXPECT_EQ(input->attributes().size(), 1u);
    EXPECT_TRUE(nodes[1].as_element()->open_tag.self_closing);
}

TEST_F(MarkupParserTest, SelfClosingByName) {
    ParserConfig config;
    config.self_closing_names = {"br", "hr"};

    auto nodes = parse_ok(R"(<div><br>"x"<hr></div>)", config);

    ASSERT_EQ(nodes.size(), 1u);
    const auto& children = *nodes[0].children();
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[0].type(), NodeType::Element);
    EXPECT_TRUE(children[0].children()->empty());
    EXPECT_EQ(children[1].type(), NodeType::Text);
    EXPECT_EQ(children[2].type(), NodeType::Element);
}

TEST_F(MarkupParserTest, RawTextElement) {
    ParserConfig config;
    config.raw_text_names = {"script"};

    String source("<script>let x = 1 < 2;</script>");
    auto nodes = parse_ok(source.view(), config);

    ASSERT_EQ(nodes.size(), 1u);
    const auto& children = *nodes[0].children();
    ASSERT_EQ(children.size(), 1u);
    const auto* raw = children[0].as_raw_text();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw->to_token_stream_string(), String("let x = 1 < 2 ;"));

    tokens::SourceMap map(source);
    EXPECT_EQ(raw->to_string_best(&map), String("let x = 1 < 2;"));
}

TEST_F(MarkupParserTest, TextNodes) {
    auto nodes = parse_ok(R"(<p>"hello" "world"</p>)");

    const auto& children = *nodes[0].children();
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0].as_text()->value, String("hello"));
    EXPECT_EQ(children[1].as_text()->value, String("world"));
}

TEST_F(MarkupParserTest, Comment) {
    auto nodes = parse_ok(R"(<!-- "a comment" -->)");

    ASSERT_EQ(nodes.size(), 1u);
    ASSERT_EQ(nodes[0].type(), NodeType::Comment);
    EXPECT_EQ(nodes[0].as_comment()->value, String("a comment"));
}

TEST_F(MarkupParserTest, Doctype) {
    String source("<!DOCTYPE html><html></html>");
    auto nodes = parse_ok(source.view());

    ASSERT_EQ(nodes.size(), 2u);
    const auto* doctype = nodes[0].as_doctype();
    ASSERT_NE(doctype, nullptr);
    EXPECT_EQ(doctype->value.to_token_stream_string(), String("html"));

    tokens::SourceMap map(source);
    EXPECT_EQ(doctype->value.to_string_best(&map), String(" html"));
}

TEST_F(MarkupParserTest, DoctypeKeywordIsCaseInsensitive) {
    auto nodes = parse_ok("<!doctype html>");

    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0].type(), NodeType::Doctype);
}

TEST_F(MarkupParserTest, Fragment) {
    auto nodes = parse_ok(R"(<>"a"<b/></>)");

    ASSERT_EQ(nodes.size(), 1u);
    const auto* fragment = nodes[0].as_fragment();
    ASSERT_NE(fragment, nullptr);
    EXPECT_TRUE(fragment->close.has_value());
    ASSERT_EQ(fragment->children.size(), 2u);
    EXPECT_EQ(fragment->children[0].type(), NodeType::Text);
    EXPECT_EQ(fragment->children[1].type(), NodeType::Element);
}

TEST_F(MarkupParserTest, BlockNode) {
    auto nodes = parse_ok("<div>{x + 1}{}</div>");

    const auto& children = *nodes[0].children();
    ASSERT_EQ(children.size(), 2u);
    const auto* block = children[0].as_block();
    ASSERT_NE(block, nullptr);
    ASSERT_TRUE(block->is_valid());
    EXPECT_EQ(block->try_expression()->to_string(), String("x + 1"));
    EXPECT_EQ(block->to_string(), String("{ x + 1 }"));
    EXPECT_EQ(children[1].as_block()->to_string(), String("{}"));
}

TEST_F(MarkupParserTest, BlockAttributes) {
    auto nodes = parse_ok("<div {attrs} value={count + 1}></div>");

    const auto& attributes = nodes[0].as_element()->attributes();
    ASSERT_EQ(attributes.size(), 2u);

    const auto* dynamic = std::get_if<DynAttribute>(&attributes[0]);
    ASSERT_NE(dynamic, nullptr);
    EXPECT_EQ(dynamic->block.to_string(), String("{ attrs }"));

    const auto* keyed = std::get_if<KeyedAttribute>(&attributes[1]);
    ASSERT_NE(keyed, nullptr);
    ASSERT_NE(keyed->value_block(), nullptr);
    EXPECT_EQ(keyed->value_block()->to_string(), String("{ count + 1 }"));
    EXPECT_EQ(keyed->value_expression(), nullptr);
}

TEST_F(MarkupParserTest, ExpressionAttributeValues) {
    auto nodes = parse_ok("<div a=x.len() b=-1 c=foo::bar></div>");

    const auto& attributes = nodes[0].as_element()->attributes();
    ASSERT_EQ(attributes.size(), 3u);
    EXPECT_EQ(std::get<KeyedAttribute>(attributes[0]).value_expression()->to_string(),
              String("x . len ()"));
    EXPECT_EQ(std::get<KeyedAttribute>(attributes[1]).value_expression()->to_string(), String("- 1"));
    EXPECT_EQ(std::get<KeyedAttribute>(attributes[2]).value_expression()->to_string(),
              String("foo :: bar"));
}

TEST_F(MarkupParserTest, PathName) {
    auto nodes = parse_ok("<foo::bar></foo::bar>");

    const auto* path = nodes[0].as_element()->name().as_path();
    ASSERT_NE(path, nullptr);
    ASSERT_EQ(path->segments.size(), 2u);
    EXPECT_EQ(path->segments[0], String("foo"));
    EXPECT_EQ(path->segments[1], String("bar"));
    EXPECT_EQ(nodes[0].as_element()->name().to_string(), String("foo::bar"));
}

TEST_F(MarkupParserTest, PunctuatedNames) {
    auto nodes = parse_ok("<my-element on:click={handler} data-a-b></my-element>");

    const auto* element = nodes[0].as_element();
    const auto* name = element->name().as_punctuated();
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->segments.size(), 2u);
    EXPECT_EQ(element->name().to_string(), String("my-element"));

    ASSERT_EQ(element->attributes().size(), 2u);
    EXPECT_EQ(std::get<KeyedAttribute>(element->attributes()[0]).key_string(), String("on:click"));
    EXPECT_EQ(std::get<KeyedAttribute>(element->attributes()[1]).key_string(), String("data-a-b"));
}

TEST_F(MarkupParserTest, MixedSeparators) {
    auto nodes = parse_ok("<a-b:c></a-b:c>");

    const auto* name = nodes[0].as_element()->name().as_punctuated();
    ASSERT_NE(name, nullptr);
    ASSERT_EQ(name->separators.size(), 2u);
    EXPECT_EQ(name->separators[0], '-');
    EXPECT_EQ(name->separators[1], ':');
}

TEST_F(MarkupParserTest, BlockName) {
    auto nodes = parse_ok("<{tag}></{tag}>");

    const auto& name = nodes[0].as_element()->name();
    EXPECT_TRUE(name.is_block());
    EXPECT_EQ(name.to_string(), String("{}"));
    ASSERT_TRUE(nodes[0].as_element()->close_tag.has_value());
}

TEST_F(MarkupParserTest, NameRoundTrips) {
    for (std::string_view name : {"div", "my-el", "ns:item", "a::b::c", "x-y:z"}) {
        std::string source = std::string("<") + std::string(name) + "></" + std::string(name) + ">";
        auto lexed = tokens::tokenize(source);
        ASSERT_TRUE(lexed.is_ok());

        auto result = parse_strict(lexed.value());
        ASSERT_TRUE(result.is_ok()) << source;
        EXPECT_EQ(result.value()[0].as_element()->name().to_string(), String(name));
    }
}

TEST_F(MarkupParserTest, FlattenTree) {
    ParserConfig config;
    config.flatten_tree = true;

    auto nodes = parse_ok(R"(<div><span>"a"</span><span>"b"</span><!-- "c" -->{x}</div>)", config);

    ASSERT_EQ(nodes.size(), 7u);
    EXPECT_EQ(nodes[0].type(), NodeType::Element);
    EXPECT_TRUE(nodes[0].children()->empty());
    EXPECT_EQ(nodes[1].type(), NodeType::Element);
    EXPECT_EQ(nodes[2].type(), NodeType::Text);
    EXPECT_EQ(nodes[3].type(), NodeType::Element);
    EXPECT_EQ(nodes[4].type(), NodeType::Text);
    EXPECT_EQ(nodes[5].type(), NodeType::Comment);
    EXPECT_EQ(nodes[6].type(), NodeType::Block);
}

TEST_F(MarkupParserTest, DebugString) {
    auto nodes = parse_ok(R"(<div a="1"><>"t"</>word<br/>{x}</div>)");

    EXPECT_EQ(debug_string(nodes),
              String("Element <div a=\"1\"> </div>\n"
                     "  Fragment\n"
                     "    Text \"t\"\n"
                     "  RawText word\n"
                     "  Element <br />\n"
                     "  Block { x }\n"));
}

TEST_F(MarkupParserTest, BlockTransform) {
    ParserConfig config;
    config.block_transform = [](tokens::Cursor& cursor) -> Result<std::optional<TokenStream>, Diagnostic> {
        if (cursor.peek_punct('%')) {
            cursor.advance();
            return std::optional<TokenStream>(TokenStream{TokenTree::string_literal("percent")});
        }
        return std::optional<TokenStream>{};
    };

    auto nodes = parse_ok("<div>{%}{x}</div>", config);

    const auto& children = *nodes[0].children();
    ASSERT_EQ(children.size(), 2u);
    const auto* replaced = children[0].as_block();
    ASSERT_TRUE(replaced->is_valid());
    ASSERT_TRUE(replaced->try_expression()->as_string_literal().has_value());
    EXPECT_EQ(*replaced->try_expression()->as_string_literal(), String("percent"));
    EXPECT_EQ(children[1].as_block()->to_string(), String("{ x }"));
}

TEST_F(MarkupParserTest, ParseStrictSucceeds) {
    auto lexed = tokens::tokenize(R"(<ul><li>"a"</li><li>{b}</li></ul>)");
    ASSERT_TRUE(lexed.is_ok());

    auto result = parse_strict(lexed.value());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 1u);
}

TEST_F(MarkupParserTest, ParserWithCustomExpressions) {
    // Accepts any single token as an expression
    class AnyToken : public ExpressionParser {
    public:
        Result<Expression, Diagnostic> parse_expression(tokens::Cursor& cursor) const override {
            Expression expression;
            if (const auto* token = cursor.advance()) {
                expression.tokens.push_back(*token);
            }
            return expression;
        }
        Result<Expression, Diagnostic> parse_block(tokens::Cursor& cursor) const override {
            Expression expression;
            while (const auto* token = cursor.advance()) {
                expression.tokens.push_back(*token);
            }
            return expression;
        }
    };

    auto lexed = tokens::tokenize("<div a=%>{%}</div>");
    ASSERT_TRUE(lexed.is_ok());

    Parser parser(ParserConfig{}, std::make_shared<AnyToken>());
    auto outcome = parser.parse_recoverable(lexed.value());
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(debug_string(*outcome.value()), String("Element <div a=%> </div>\n  Block { % }\n"));
}

TEST_F(MarkupParserTest, FlattenNestedElements) {
    ParserConfig config;
    config.flatten_tree = true;

    auto nodes = parse_ok(R"(<div><div><div>{x}</div><div>"w"</div></div></div><div/>)", config);

    ASSERT_EQ(nodes.size(), 7u);
    EXPECT_EQ(nodes[3].type(), NodeType::Block);
    EXPECT_EQ(nodes[5].type(), NodeType::Text);
    EXPECT_TRUE(nodes[6].as_element()->open_tag.self_closing);
}
