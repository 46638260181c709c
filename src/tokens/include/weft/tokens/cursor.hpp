#pragma once

#include "weft/tokens/token.hpp"
#include <string_view>

namespace weft::tokens {

// ============================================================================
// Cursor - position inside one level of a token tree
// ============================================================================

/**
 * A Cursor is a plain value: copying it is a fork, and assigning a fork back
 * (advance_to) commits whatever the fork consumed. The underlying TokenStream
 * must outlive every cursor created over it.
 */
class Cursor {
public:
    Cursor() = default;
    explicit Cursor(const TokenStream& stream, Span end_span = {});
    Cursor(const TokenTree* begin, const TokenTree* end, Span end_span);

    // Cursor over the contents of a group token
    [[nodiscard]] static Cursor into_group(const TokenTree& group);

    // Lookahead
    [[nodiscard]] const TokenTree* peek(usize n = 0) const;
    [[nodiscard]] bool peek_punct(char c, usize n = 0) const;
    [[nodiscard]] bool peek_ident(usize n = 0) const;
    [[nodiscard]] bool peek_ident_named(std::string_view name, usize n = 0,
                                        bool case_insensitive = false) const;
    [[nodiscard]] bool peek_group(Delimiter delimiter, usize n = 0) const;
    [[nodiscard]] bool peek_string_literal(usize n = 0) const;

    // Consumes one token; nullptr when empty
    const TokenTree* advance();

    [[nodiscard]] Cursor fork() const { return *this; }
    void advance_to(const Cursor& fork) { m_pos = fork.m_pos; }

    [[nodiscard]] bool is_empty() const { return m_pos == m_end; }
    [[nodiscard]] usize remaining() const { return static_cast<usize>(m_end - m_pos); }
    [[nodiscard]] const TokenTree* position() const { return m_pos; }

    // Span of the next token, or of the end of this scope
    [[nodiscard]] Span span() const;
    [[nodiscard]] const Span& end_span() const { return m_end_span; }

    // Contents of the group at the current position; empty cursor otherwise
    [[nodiscard]] Cursor group_cursor() const;

    // Tokens between this cursor and a later fork of it
    [[nodiscard]] TokenStream tokens_until(const Cursor& other) const;

private:
    const TokenTree* m_pos{nullptr};
    const TokenTree* m_end{nullptr};
    Span m_end_span;
};

} // namespace weft::tokens
