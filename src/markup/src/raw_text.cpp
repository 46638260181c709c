#include "weft/markup/raw_text.hpp"
#include "weft/markup/node.hpp"

namespace weft::markup {

RawText::RawText(tokens::TokenStream tokens) : m_tokens(std::move(tokens)) {}

void RawText::set_tag_spans(const tokens::Span& before, const tokens::Span& after) {
    m_context_spans = std::make_pair(before, after);
}

tokens::Span RawText::span() const {
    if (m_tokens.empty()) {
        return {};
    }
    const auto& first = m_tokens.front().span;
    auto joined = tokens::join_spans(first, m_tokens.back().span);
    if (joined.is_synthetic()) {
        return first;
    }
    joined.line = first.line;
    joined.column = first.column;
    return joined;
}

String RawText::to_token_stream_string() const {
    return tokens::to_string(m_tokens);
}

std::optional<String> RawText::to_source_text(const tokens::SourceTextProvider& provider,
                                              bool with_whitespace) const {
    if (!with_whitespace) {
        if (m_tokens.empty()) {
            return std::nullopt;
        }
        auto joined = provider.join(m_tokens.front().span, m_tokens.back().span);
        if (!joined) {
            return std::nullopt;
        }
        return provider.text_of(*joined);
    }

    if (!m_context_spans) {
        return std::nullopt;
    }
    const auto& [before, after] = *m_context_spans;

    auto full = provider.join(before, after);
    if (!full) {
        return std::nullopt;
    }
    auto full_text = provider.text_of(*full);
    auto before_text = provider.text_of(before);
    auto after_text = provider.text_of(after);
    if (!full_text || !before_text || !after_text) {
        return std::nullopt;
    }

    // The boundaries must sit at both ends of the joined text
    if (before_text->size() + after_text->size() > full_text->size() ||
        !full_text->starts_with(*before_text) || !full_text->ends_with(*after_text)) {
        return std::nullopt;
    }
    return full_text->substring(before_text->size(),
                                full_text->size() - before_text->size() - after_text->size());
}

String RawText::to_string_best(const tokens::SourceTextProvider* provider) const {
    if (provider) {
        if (auto text = to_source_text(*provider, true)) {
            return *text;
        }
        if (auto text = to_source_text(*provider, false)) {
            return *text;
        }
    }
    return to_token_stream_string();
}

void RawText::vec_set_context(const tokens::Span& open_tag_end,
                              const std::optional<tokens::Span>& close_tag_start,
                              std::vector<Node>& children) {
    std::vector<tokens::Span> spans;
    spans.reserve(children.size() + 2);
    spans.push_back(open_tag_end);
    for (const auto& child : children) {
        spans.push_back(child.span());
    }
    if (close_tag_start) {
        spans.push_back(*close_tag_start);
    }

    // Window (previous, current, next) centered on each child
    for (usize i = 0; i + 2 < spans.size() && i < children.size(); ++i) {
        if (auto* raw = children[i].as_raw_text_mut()) {
            raw->set_tag_spans(spans[i], spans[i + 2]);
        }
    }
}

} // namespace weft::markup
