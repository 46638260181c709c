#include "weft/markup/node.hpp"

namespace weft::markup {

std::string_view node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Element: return "NodeType::Element";
        case NodeType::Text: return "NodeType::Text";
        case NodeType::Comment: return "NodeType::Comment";
        case NodeType::Doctype: return "NodeType::Doctype";
        case NodeType::Block: return "NodeType::Block";
        case NodeType::Fragment: return "NodeType::Fragment";
        case NodeType::RawText: return "NodeType::RawText";
    }
    return "NodeType::Unknown";
}

// ============================================================================
// NodeBlock
// ============================================================================

NodeBlock NodeBlock::valid(Expression expression, tokens::Span span) {
    return NodeBlock(std::move(expression), span);
}

NodeBlock NodeBlock::invalid(tokens::TokenTree group) {
    tokens::Span span = group.span;
    return NodeBlock(Invalid{std::move(group)}, span);
}

String NodeBlock::to_string() const {
    if (const auto* invalid = try_invalid()) {
        return invalid->group.to_string();
    }
    const auto& expression = std::get<Expression>(m_value);
    if (expression.tokens.empty()) {
        return "{}";
    }
    StringBuilder builder;
    builder.append("{ ");
    builder.append(expression.to_string());
    builder.append(" }");
    return builder.build();
}

// ============================================================================
// NodeName
// ============================================================================

NodeName NodeName::from_path(std::vector<String> segments, tokens::Span span) {
    return NodeName(Path{std::move(segments)}, span);
}

NodeName NodeName::from_punctuated(std::vector<String> segments, std::vector<char> separators,
                                   tokens::Span span) {
    return NodeName(Punctuated{std::move(segments), std::move(separators)}, span);
}

NodeName NodeName::from_block(NodeBlock block) {
    tokens::Span span = block.span();
    return NodeName(std::move(block), span);
}

String NodeName::to_string() const {
    StringBuilder builder;
    if (const auto* path = as_path()) {
        for (usize i = 0; i < path->segments.size(); ++i) {
            if (i > 0) {
                builder.append("::");
            }
            builder.append(path->segments[i]);
        }
    } else if (const auto* punctuated = as_punctuated()) {
        for (usize i = 0; i < punctuated->segments.size(); ++i) {
            builder.append(punctuated->segments[i]);
            if (i < punctuated->separators.size()) {
                builder.append(punctuated->separators[i]);
            }
        }
    } else {
        builder.append("{}");
    }
    return builder.build();
}

bool NodeName::operator==(const NodeName& other) const {
    if (m_value.index() != other.m_value.index()) {
        return false;
    }
    if (const auto* path = as_path()) {
        return path->segments == other.as_path()->segments;
    }
    if (const auto* punctuated = as_punctuated()) {
        const auto* theirs = other.as_punctuated();
        return punctuated->segments == theirs->segments &&
               punctuated->separators == theirs->separators;
    }
    return *as_block() == *other.as_block();
}

// ============================================================================
// KeyedAttribute
// ============================================================================

std::optional<String> KeyedAttribute::value_string() const {
    if (const auto* expression = value_expression()) {
        return expression->as_string_literal();
    }
    return std::nullopt;
}

const Expression* KeyedAttribute::value_expression() const {
    return value ? std::get_if<Expression>(&*value) : nullptr;
}

const NodeBlock* KeyedAttribute::value_block() const {
    return value ? std::get_if<NodeBlock>(&*value) : nullptr;
}

// ============================================================================
// Node
// ============================================================================

NodeType Node::type() const {
    switch (m_value.index()) {
        case 0: return NodeType::Element;
        case 1: return NodeType::Fragment;
        case 2: return NodeType::Text;
        case 3: return NodeType::Comment;
        case 4: return NodeType::Doctype;
        case 5: return NodeType::Block;
        default: return NodeType::RawText;
    }
}

tokens::Span Node::span() const {
    if (const auto* element = as_element()) return element->span;
    if (const auto* fragment = as_fragment()) return fragment->span;
    if (const auto* text = as_text()) return text->span;
    if (const auto* comment = as_comment()) return comment->span;
    if (const auto* doctype = as_doctype()) return doctype->span;
    if (const auto* block = as_block()) return block->span();
    return std::get<RawText>(m_value).span();
}

const std::vector<Node>* Node::children() const {
    if (const auto* element = as_element()) return &element->children;
    if (const auto* fragment = as_fragment()) return &fragment->children;
    return nullptr;
}

std::vector<Node>* Node::children_mut() {
    if (auto* element = std::get_if<NodeElement>(&m_value)) return &element->children;
    if (auto* fragment = std::get_if<NodeFragment>(&m_value)) return &fragment->children;
    return nullptr;
}

std::vector<Node> Node::flatten() && {
    std::vector<Node> children;
    if (auto* own = children_mut()) {
        children = std::move(*own);
        own->clear();
    }

    std::vector<Node> result;
    result.push_back(std::move(*this));
    for (auto& child : children) {
        auto descendants = std::move(child).flatten();
        for (auto& descendant : descendants) {
            result.push_back(std::move(descendant));
        }
    }
    return result;
}

// ============================================================================
// Debug dump
// ============================================================================

namespace {

void dump_value(StringBuilder& out, const NodeValue& value) {
    if (const auto* expression = std::get_if<Expression>(&value)) {
        out.append(expression->to_string());
    } else {
        out.append(std::get<NodeBlock>(value).to_string());
    }
}

void dump_attributes(StringBuilder& out, const std::vector<NodeAttribute>& attributes) {
    for (const auto& attribute : attributes) {
        out.append(' ');
        if (const auto* keyed = std::get_if<KeyedAttribute>(&attribute)) {
            out.append(keyed->key.to_string());
            if (keyed->value) {
                out.append('=');
                dump_value(out, *keyed->value);
            }
        } else {
            out.append(std::get<DynAttribute>(attribute).block.to_string());
        }
    }
}

void dump_quoted(StringBuilder& out, const String& value) {
    out.append('"');
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out.append('\\');
        }
        if (c == '\n') {
            out.append("\\n");
            continue;
        }
        out.append(c);
    }
    out.append('"');
}

void dump_node(StringBuilder& out, const Node& node, usize depth) {
    out.append(String(depth * 2, ' '));

    switch (node.type()) {
        case NodeType::Element: {
            const auto* element = node.as_element();
            out.append("Element <");
            out.append(element->name().to_string());
            dump_attributes(out, element->attributes());
            out.append(element->open_tag.self_closing ? " />" : ">");
            if (element->close_tag) {
                out.append(" </");
                out.append(element->close_tag->name.to_string());
                out.append('>');
            }
            break;
        }
        case NodeType::Fragment:
            out.append("Fragment");
            if (!node.as_fragment()->close) {
                out.append(" (unclosed)");
            }
            break;
        case NodeType::Text:
            out.append("Text ");
            dump_quoted(out, node.as_text()->value);
            break;
        case NodeType::Comment:
            out.append("Comment ");
            dump_quoted(out, node.as_comment()->value);
            break;
        case NodeType::Doctype:
            out.append("Doctype ");
            out.append(node.as_doctype()->value.to_token_stream_string());
            break;
        case NodeType::Block: {
            const auto* block = node.as_block();
            out.append(block->is_valid() ? "Block " : "Block (invalid) ");
            out.append(block->to_string());
            break;
        }
        case NodeType::RawText:
            out.append("RawText ");
            out.append(node.as_raw_text()->to_token_stream_string());
            break;
    }
    out.append('\n');

    if (const auto* children = node.children()) {
        for (const auto& child : *children) {
            dump_node(out, child, depth + 1);
        }
    }
}

} // anonymous namespace

String debug_string(const std::vector<Node>& nodes) {
    StringBuilder out;
    for (const auto& node : nodes) {
        dump_node(out, node, 0);
    }
    return out.build();
}

String debug_string(const Node& node) {
    StringBuilder out;
    dump_node(out, node, 0);
    return out.build();
}

} // namespace weft::markup
