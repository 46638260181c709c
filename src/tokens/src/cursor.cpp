#include "weft/tokens/cursor.hpp"

namespace weft::tokens {

Cursor::Cursor(const TokenStream& stream, Span end_span)
    : m_pos(stream.data())
    , m_end(stream.data() + stream.size())
    , m_end_span(end_span) {
    if (m_end_span == Span{} && !stream.empty()) {
        // Zero-width span right after the last token
        m_end_span = stream.back().span;
        m_end_span.start = m_end_span.end;
        if (stream.back().is_group()) {
            m_end_span.line = stream.back().close_span.line;
            m_end_span.column = stream.back().close_span.column + 1;
        }
    }
}

Cursor::Cursor(const TokenTree* begin, const TokenTree* end, Span end_span)
    : m_pos(begin)
    , m_end(end)
    , m_end_span(end_span) {}

Cursor Cursor::into_group(const TokenTree& group) {
    const auto& children = group.children;
    return Cursor(children.data(), children.data() + children.size(), group.close_span);
}

const TokenTree* Cursor::peek(usize n) const {
    if (remaining() <= n) {
        return nullptr;
    }
    return m_pos + n;
}

bool Cursor::peek_punct(char c, usize n) const {
    const auto* token = peek(n);
    return token && token->is_punct(c);
}

bool Cursor::peek_ident(usize n) const {
    const auto* token = peek(n);
    return token && token->is_ident();
}

bool Cursor::peek_ident_named(std::string_view name, usize n, bool case_insensitive) const {
    const auto* token = peek(n);
    if (!token || !token->is_ident()) {
        return false;
    }
    if (case_insensitive) {
        return token->text.equals_ignore_case(String(name));
    }
    return token->text.view() == name;
}

bool Cursor::peek_group(Delimiter delimiter, usize n) const {
    const auto* token = peek(n);
    return token && token->is_group(delimiter);
}

bool Cursor::peek_string_literal(usize n) const {
    const auto* token = peek(n);
    return token && token->is_string_literal();
}

const TokenTree* Cursor::advance() {
    if (is_empty()) {
        return nullptr;
    }
    return m_pos++;
}

Span Cursor::span() const {
    if (is_empty()) {
        return m_end_span;
    }
    return m_pos->is_group() ? m_pos->open_span : m_pos->span;
}

Cursor Cursor::group_cursor() const {
    if (is_empty() || !m_pos->is_group()) {
        return Cursor(m_end, m_end, m_end_span);
    }
    return into_group(*m_pos);
}

TokenStream Cursor::tokens_until(const Cursor& other) const {
    if (other.m_pos < m_pos || other.m_pos > m_end) {
        return {};
    }
    return TokenStream(m_pos, other.m_pos);
}

} // namespace weft::tokens
