#pragma once

#include "weft/core/types.hpp"
#include "weft/tokens/cursor.hpp"
#include "weft/markup/context.hpp"
#include "weft/markup/node.hpp"
#include <optional>
#include <vector>

namespace weft::markup {

// ============================================================================
// Grammar - recursive-descent rules for markup nodes
// ============================================================================

/**
 * Every rule takes the cursor by reference and either commits what it
 * consumed or leaves the cursor untouched. A rule returns std::nullopt only
 * after recording a diagnostic in the Context.
 */
class Grammar {
public:
    // What the next 1-3 tokens start
    enum class NodeStart : u8 {
        Element,
        Fragment,
        CloseTag,
        Comment,
        Doctype,
        Block,
        Text,
        RawText,
        End
    };

    explicit Grammar(Context& context);

    [[nodiscard]] static NodeStart classify(const tokens::Cursor& cursor);

    // Nodes until the input is exhausted or the context stops
    [[nodiscard]] std::vector<Node> parse_nodes(tokens::Cursor& cursor);

    [[nodiscard]] std::optional<Node> parse_node(tokens::Cursor& cursor);

private:
    // Nodes (grammar_nodes.cpp)
    [[nodiscard]] std::optional<Node> parse_element(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<Node> parse_fragment(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<Node> parse_comment(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<Node> parse_doctype(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<Node> parse_text(tokens::Cursor& cursor);
    [[nodiscard]] RawText parse_raw_text(tokens::Cursor& cursor);
    [[nodiscard]] RawText parse_raw_text_body(tokens::Cursor& cursor);
    [[nodiscard]] std::vector<Node> parse_children(tokens::Cursor& cursor);

    // Parses one node into out; false when the enclosing loop must stop
    bool parse_node_guarded(tokens::Cursor& cursor, std::vector<Node>& out);
    bool recover_from_stall(tokens::Cursor& cursor);

    // Blocks (grammar_nodes.cpp)
    [[nodiscard]] std::optional<NodeBlock> parse_block(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<NodeBlock> invalid_block(tokens::Cursor& cursor, Diagnostic diagnostic);

    // Tags (grammar_tags.cpp)
    [[nodiscard]] std::optional<OpenTag> parse_open_tag(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<CloseTag> parse_close_tag(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<FragmentClose> parse_fragment_close(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<NodeName> parse_node_name(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<NodeName> parse_path_name(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<NodeName> parse_punctuated_name(tokens::Cursor& cursor);
    void skip_malformed_tag(tokens::Cursor& cursor, const tokens::Cursor& fork);

    // Attributes (grammar_attributes.cpp)
    [[nodiscard]] std::vector<NodeAttribute> parse_attributes(const tokens::TokenStream& tokens,
                                                              const tokens::Span& end_span);
    [[nodiscard]] std::optional<NodeAttribute> parse_attribute(tokens::Cursor& cursor);
    [[nodiscard]] std::optional<Expression> parse_attribute_value(tokens::Cursor& cursor);

    Context& m_context;
};

} // namespace weft::markup
