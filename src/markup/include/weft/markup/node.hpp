#pragma once

#include "weft/core/types.hpp"
#include "weft/core/string.hpp"
#include "weft/tokens/token.hpp"
#include "weft/markup/expression.hpp"
#include "weft/markup/raw_text.hpp"
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace weft::markup {

// ============================================================================
// Node type
// ============================================================================

enum class NodeType : u8 {
    Element,
    Text,
    Comment,
    Doctype,
    Block,
    Fragment,
    RawText
};

// "NodeType::Element", ...
[[nodiscard]] std::string_view node_type_name(NodeType type);

// ============================================================================
// NodeBlock - braced host code
// ============================================================================

class NodeBlock {
public:
    // Content kept as written when it is not a valid host block
    struct Invalid {
        tokens::TokenTree group;
    };

    [[nodiscard]] static NodeBlock valid(Expression expression, tokens::Span span);
    [[nodiscard]] static NodeBlock invalid(tokens::TokenTree group);

    [[nodiscard]] bool is_valid() const { return std::holds_alternative<Expression>(m_value); }
    [[nodiscard]] const Expression* try_expression() const { return std::get_if<Expression>(&m_value); }
    [[nodiscard]] const Invalid* try_invalid() const { return std::get_if<Invalid>(&m_value); }

    [[nodiscard]] tokens::Span span() const { return m_span; }

    // "{ ... }"
    [[nodiscard]] String to_string() const;

    [[nodiscard]] bool operator==(const NodeBlock& other) const { return to_string() == other.to_string(); }

private:
    NodeBlock(std::variant<Expression, Invalid> value, tokens::Span span)
        : m_value(std::move(value)), m_span(span) {}

    std::variant<Expression, Invalid> m_value;
    tokens::Span m_span;
};

// ============================================================================
// NodeName
// ============================================================================

class NodeName {
public:
    // div, foo::bar
    struct Path {
        std::vector<String> segments;
    };

    // data-foo, on:click; separators.size() is segments.size() - 1, or
    // segments.size() with a trailing separator
    struct Punctuated {
        std::vector<String> segments;
        std::vector<char> separators;
    };

    using Value = std::variant<Path, Punctuated, NodeBlock>;

    NodeName() = default;
    NodeName(Value value, tokens::Span span) : m_value(std::move(value)), m_span(span) {}

    [[nodiscard]] static NodeName from_path(std::vector<String> segments, tokens::Span span = {});
    [[nodiscard]] static NodeName from_punctuated(std::vector<String> segments,
                                                  std::vector<char> separators,
                                                  tokens::Span span = {});
    [[nodiscard]] static NodeName from_block(NodeBlock block);

    [[nodiscard]] const Path* as_path() const { return std::get_if<Path>(&m_value); }
    [[nodiscard]] const Punctuated* as_punctuated() const { return std::get_if<Punctuated>(&m_value); }
    [[nodiscard]] const NodeBlock* as_block() const { return std::get_if<NodeBlock>(&m_value); }

    [[nodiscard]] bool is_block() const { return as_block() != nullptr; }

    [[nodiscard]] tokens::Span span() const { return m_span; }

    // Segments joined by their separators; a block name prints as "{}"
    [[nodiscard]] String to_string() const;

    [[nodiscard]] bool operator==(const NodeName& other) const;
    [[nodiscard]] bool operator!=(const NodeName& other) const { return !(*this == other); }

private:
    Value m_value;
    tokens::Span m_span;
};

// ============================================================================
// Attributes
// ============================================================================

using NodeValue = std::variant<Expression, NodeBlock>;

struct KeyedAttribute {
    NodeName key;
    std::optional<NodeValue> value;
    tokens::Span span;

    [[nodiscard]] String key_string() const { return key.to_string(); }

    // Decoded value when the value is a single string literal
    [[nodiscard]] std::optional<String> value_string() const;

    [[nodiscard]] const Expression* value_expression() const;
    [[nodiscard]] const NodeBlock* value_block() const;
};

// <div {attrs} />
struct DynAttribute {
    NodeBlock block;
};

using NodeAttribute = std::variant<KeyedAttribute, DynAttribute>;

// ============================================================================
// Tags
// ============================================================================

struct OpenTag {
    NodeName name;
    std::vector<NodeAttribute> attributes;
    bool self_closing{false};
    tokens::Span span;
    tokens::Span end_span;  // ">" or "/>"
};

struct CloseTag {
    NodeName name;
    tokens::Span span;
    tokens::Span start_span;  // "</"
};

struct FragmentClose {
    tokens::Span span;
    tokens::Span start_span;  // "</"
};

// ============================================================================
// Nodes
// ============================================================================

class Node;

struct NodeElement {
    OpenTag open_tag;
    std::vector<Node> children;
    std::optional<CloseTag> close_tag;
    tokens::Span span;

    [[nodiscard]] const NodeName& name() const { return open_tag.name; }
    [[nodiscard]] const std::vector<NodeAttribute>& attributes() const { return open_tag.attributes; }
};

struct NodeFragment {
    tokens::Span open_span;  // "<>"
    std::vector<Node> children;
    std::optional<FragmentClose> close;
    tokens::Span span;
};

struct NodeText {
    String value;
    tokens::Span span;
};

struct NodeComment {
    String value;
    tokens::Span span;
};

struct NodeDoctype {
    RawText value;
    tokens::Span span;
};

/**
 * A parsed markup node. Every node owns its children exclusively; the tree
 * has no parent links.
 */
class Node {
public:
    using Value = std::variant<NodeElement, NodeFragment, NodeText, NodeComment,
                               NodeDoctype, NodeBlock, RawText>;

    Node(NodeElement element) : m_value(std::move(element)) {}
    Node(NodeFragment fragment) : m_value(std::move(fragment)) {}
    Node(NodeText text) : m_value(std::move(text)) {}
    Node(NodeComment comment) : m_value(std::move(comment)) {}
    Node(NodeDoctype doctype) : m_value(std::move(doctype)) {}
    Node(NodeBlock block) : m_value(std::move(block)) {}
    Node(RawText raw_text) : m_value(std::move(raw_text)) {}

    [[nodiscard]] NodeType type() const;
    [[nodiscard]] tokens::Span span() const;

    // Elements and fragments only
    [[nodiscard]] const std::vector<Node>* children() const;
    [[nodiscard]] std::vector<Node>* children_mut();

    // This node followed by all descendants in pre-order; children are moved
    // out of their parents, which are left with empty child lists.
    [[nodiscard]] std::vector<Node> flatten() &&;

    [[nodiscard]] const NodeElement* as_element() const { return std::get_if<NodeElement>(&m_value); }
    [[nodiscard]] const NodeFragment* as_fragment() const { return std::get_if<NodeFragment>(&m_value); }
    [[nodiscard]] const NodeText* as_text() const { return std::get_if<NodeText>(&m_value); }
    [[nodiscard]] const NodeComment* as_comment() const { return std::get_if<NodeComment>(&m_value); }
    [[nodiscard]] const NodeDoctype* as_doctype() const { return std::get_if<NodeDoctype>(&m_value); }
    [[nodiscard]] const NodeBlock* as_block() const { return std::get_if<NodeBlock>(&m_value); }
    [[nodiscard]] const RawText* as_raw_text() const { return std::get_if<RawText>(&m_value); }

    [[nodiscard]] RawText* as_raw_text_mut() { return std::get_if<RawText>(&m_value); }

    [[nodiscard]] const Value& value() const { return m_value; }

private:
    Value m_value;
};

// Indented, span-free dump of a node list; equal trees print equally.
[[nodiscard]] String debug_string(const std::vector<Node>& nodes);
[[nodiscard]] String debug_string(const Node& node);

} // namespace weft::markup
