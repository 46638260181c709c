/**
 * Markup grammar - open/close tags and node names
 */

#include "weft/markup/grammar.hpp"
#include <format>

namespace weft::markup {

using tokens::Cursor;
using tokens::Delimiter;
using tokens::Span;
using tokens::TokenStream;
using tokens::TokenTree;

namespace {

Span span_through(const Span& start, const Span& end) {
    Span joined = tokens::join_spans(start, end);
    return joined.is_synthetic() ? start : joined;
}

bool at_path_separator(const Cursor& cursor, usize n) {
    const TokenTree* first = cursor.peek(n);
    return first && first->is_punct(':') && first->spacing == tokens::Spacing::Joint &&
           cursor.peek_punct(':', n + 1);
}

} // anonymous namespace

// ============================================================================
// Open tag: "<" name attributes... (">" | "/>")
// ============================================================================

std::optional<OpenTag> Grammar::parse_open_tag(Cursor& cursor) {
    Cursor fork = cursor.fork();
    Span start = fork.span();
    fork.advance();  // '<'

    auto name = parse_node_name(fork);
    if (!name) {
        return std::nullopt;
    }

    // Phase 1: everything up to the tag end belongs to the attributes, so an
    // attribute value can never swallow the terminator.
    Cursor attributes_start = fork.fork();
    while (!fork.is_empty()) {
        if (fork.peek_punct('>')) {
            break;
        }
        if (fork.peek_punct('/') && fork.peek_punct('>', 1)) {
            break;
        }
        fork.advance();
    }

    if (fork.is_empty()) {
        m_context.push_diagnostic(Diagnostic::make(
            DiagnosticKind::UnexpectedEndOfInput,
            String(std::format("open tag <{}> is missing its closing > or />",
                               name->to_string().view())),
            start));
        return std::nullopt;
    }

    TokenStream attribute_tokens = attributes_start.tokens_until(fork);

    OpenTag tag;
    if (fork.peek_punct('/')) {
        Span solidus = fork.span();
        fork.advance();
        tag.end_span = span_through(solidus, fork.span());
        tag.self_closing = true;
    } else {
        tag.end_span = fork.span();
    }
    fork.advance();  // '>'
    cursor.advance_to(fork);

    // Phase 2
    tag.attributes = parse_attributes(attribute_tokens, tag.end_span);
    tag.name = std::move(*name);
    tag.span = span_through(start, tag.end_span);
    return tag;
}

// ============================================================================
// Close tags: "</" name ">" and "</>"
// ============================================================================

std::optional<CloseTag> Grammar::parse_close_tag(Cursor& cursor) {
    Cursor fork = cursor.fork();
    Span lt = fork.span();
    fork.advance();
    Span solidus = fork.span();
    fork.advance();

    CloseTag tag;
    tag.start_span = span_through(lt, solidus);

    auto name = parse_node_name(fork);
    if (!name) {
        skip_malformed_tag(cursor, fork);
        return std::nullopt;
    }

    if (!fork.peek_punct('>')) {
        m_context.push_diagnostic(Diagnostic::make(
            DiagnosticKind::UnexpectedToken,
            String(std::format("expected > after close tag name </{}", name->to_string().view())),
            fork.span()));
        skip_malformed_tag(cursor, fork);
        return std::nullopt;
    }
    Span gt = fork.span();
    fork.advance();
    cursor.advance_to(fork);

    tag.name = std::move(*name);
    tag.span = span_through(lt, gt);
    return tag;
}

std::optional<FragmentClose> Grammar::parse_fragment_close(Cursor& cursor) {
    Cursor fork = cursor.fork();
    Span lt = fork.span();
    fork.advance();
    Span solidus = fork.span();
    fork.advance();

    FragmentClose close;
    close.start_span = span_through(lt, solidus);

    if (!fork.peek_punct('>')) {
        // "</name>" where "</>" was expected: report it, then treat it as the close
        Span found = fork.span();
        auto name = parse_node_name(fork);
        if (!name) {
            skip_malformed_tag(cursor, fork);
            return std::nullopt;
        }
        m_context.push_diagnostic(Diagnostic::make(
            DiagnosticKind::ElementCloseInFragment,
            String(std::format("expected fragment closing </>, found element closing tag </{}>",
                               name->to_string().view())),
            found));
        if (!fork.peek_punct('>')) {
            m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnexpectedToken,
                                                       "expected > to end the close tag",
                                                       fork.span()));
            skip_malformed_tag(cursor, fork);
            return std::nullopt;
        }
    }

    Span gt = fork.span();
    fork.advance();
    cursor.advance_to(fork);
    close.span = span_through(lt, gt);
    return close;
}

void Grammar::skip_malformed_tag(Cursor& cursor, const Cursor& fork) {
    // Consume through the next '>' unless another tag starts first
    Cursor skip = fork.fork();
    while (!skip.is_empty() && !skip.peek_punct('<')) {
        bool end = skip.peek_punct('>');
        skip.advance();
        if (end) {
            break;
        }
    }
    cursor.advance_to(skip);
}

// ============================================================================
// Node names
// ============================================================================

std::optional<NodeName> Grammar::parse_node_name(Cursor& cursor) {
    if (cursor.peek_group(Delimiter::Brace)) {
        auto block = parse_block(cursor);
        if (!block) {
            return std::nullopt;
        }
        return NodeName::from_block(std::move(*block));
    }

    if (!cursor.peek_ident()) {
        const TokenTree* found = cursor.peek();
        String message = found
            ? String(std::format("invalid tag name or attribute key `{}`", found->to_string().view()))
            : String("expected a tag name or attribute key, found end of input");
        m_context.push_diagnostic(
            Diagnostic::make(DiagnosticKind::InvalidNodeName, std::move(message), cursor.span()));
        return std::nullopt;
    }

    if (at_path_separator(cursor, 1)) {
        return parse_path_name(cursor);
    }

    const TokenTree* next = cursor.peek(1);
    if (next && next->is_punct() && m_context.config().is_name_separator(next->punct_char())) {
        return parse_punctuated_name(cursor);
    }

    const TokenTree* ident = cursor.advance();
    return NodeName::from_path({ident->text}, ident->span);
}

std::optional<NodeName> Grammar::parse_path_name(Cursor& cursor) {
    Cursor fork = cursor.fork();
    Span start = fork.span();
    Span end = start;
    std::vector<String> segments;
    bool dangling = false;

    while (fork.peek_ident()) {
        const TokenTree* ident = fork.advance();
        segments.push_back(ident->text);
        end = ident->span;
        dangling = at_path_separator(fork, 0);
        if (!dangling) {
            break;
        }
        fork.advance();
        fork.advance();
    }

    // "a::" with nothing after the separator
    if (dangling) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::InvalidNodeName,
                                                   "expected identifier after :: in name",
                                                   fork.span()));
        return std::nullopt;
    }

    cursor.advance_to(fork);
    return NodeName::from_path(std::move(segments), span_through(start, end));
}

std::optional<NodeName> Grammar::parse_punctuated_name(Cursor& cursor) {
    Cursor fork = cursor.fork();
    Span start = fork.span();
    Span end = start;
    std::vector<String> segments;
    std::vector<char> separators;

    while (fork.peek_ident()) {
        const TokenTree* ident = fork.advance();
        segments.push_back(ident->text);
        end = ident->span;

        const TokenTree* next = fork.peek();
        if (!next || !next->is_punct() || !m_context.config().is_name_separator(next->punct_char())) {
            break;
        }
        separators.push_back(next->punct_char());
        end = next->span;
        fork.advance();
    }

    if (segments.size() < 2) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::InvalidNodeName,
                                                   "expected punctuated name", fork.span()));
        return std::nullopt;
    }

    cursor.advance_to(fork);
    return NodeName::from_punctuated(std::move(segments), std::move(separators),
                                     span_through(start, end));
}

} // namespace weft::markup
