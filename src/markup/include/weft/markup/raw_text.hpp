#pragma once

#include "weft/core/types.hpp"
#include "weft/core/string.hpp"
#include "weft/tokens/token.hpp"
#include "weft/tokens/source.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace weft::markup {

class Node;

// ============================================================================
// RawText - unquoted run of tokens between two structural boundaries
// ============================================================================

/**
 * Unquoted text is kept as the tokens it was lexed into, which loses the
 * original whitespace. When the source is available the verbatim text can be
 * recovered from the spans of the neighbouring nodes: the text between the
 * end of the previous boundary and the start of the next one.
 *
 * to_string_best() tries, in order:
 *   1. source text between the context spans (whitespace preserved)
 *   2. source text covered by the tokens themselves
 *   3. canonical re-stringification of the tokens
 */
class RawText {
public:
    RawText() = default;
    explicit RawText(tokens::TokenStream tokens);

    void set_tag_spans(const tokens::Span& before, const tokens::Span& after);

    [[nodiscard]] const tokens::TokenStream& tokens() const { return m_tokens; }
    [[nodiscard]] bool is_empty() const { return m_tokens.empty(); }
    [[nodiscard]] const std::optional<std::pair<tokens::Span, tokens::Span>>& context_spans() const {
        return m_context_spans;
    }

    [[nodiscard]] tokens::Span span() const;

    [[nodiscard]] String to_token_stream_string() const;
    [[nodiscard]] std::optional<String> to_source_text(const tokens::SourceTextProvider& provider,
                                                       bool with_whitespace) const;
    [[nodiscard]] String to_string_best(const tokens::SourceTextProvider* provider = nullptr) const;

    // Gives every RawText child the spans of its neighbours. The first child
    // is preceded by open_tag_end; the last child only gets context when the
    // close tag exists.
    static void vec_set_context(const tokens::Span& open_tag_end,
                                const std::optional<tokens::Span>& close_tag_start,
                                std::vector<Node>& children);

private:
    tokens::TokenStream m_tokens;
    std::optional<std::pair<tokens::Span, tokens::Span>> m_context_spans;
};

} // namespace weft::markup
