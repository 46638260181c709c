/**
 * Markup grammar - attributes
 *
 * The open tag rule collects everything between the name and ">" first;
 * attributes are parsed from that run afterwards.
 */

#include "weft/markup/grammar.hpp"
#include "weft/core/logger.hpp"
#include <format>

namespace weft::markup {

using tokens::Cursor;
using tokens::Delimiter;
using tokens::Span;
using tokens::TokenStream;

namespace {

Logger& logger() {
    static Logger& instance = logging::get("markup");
    return instance;
}

Span span_through(const Span& start, const Span& end) {
    Span joined = tokens::join_spans(start, end);
    return joined.is_synthetic() ? start : joined;
}

} // anonymous namespace

std::vector<NodeAttribute> Grammar::parse_attributes(const TokenStream& tokens, const Span& end_span) {
    std::vector<NodeAttribute> attributes;
    Cursor cursor(tokens, end_span);

    while (!cursor.is_empty() && !m_context.should_stop()) {
        auto attribute = parse_attribute(cursor);
        if (!attribute) {
            // The rest of the run cannot be split reliably
            logger().debug_fmt("dropping {} attribute tokens after an error", cursor.remaining());
            break;
        }
        attributes.push_back(std::move(*attribute));
    }
    return attributes;
}

std::optional<NodeAttribute> Grammar::parse_attribute(Cursor& cursor) {
    if (cursor.peek_group(Delimiter::Brace)) {
        auto block = parse_block(cursor);
        if (!block) {
            return std::nullopt;
        }
        return NodeAttribute(DynAttribute{std::move(*block)});
    }

    auto key = parse_node_name(cursor);
    if (!key) {
        return std::nullopt;
    }

    KeyedAttribute attribute;
    attribute.span = key->span();
    attribute.key = std::move(*key);

    if (!cursor.peek_punct('=')) {
        return NodeAttribute(std::move(attribute));
    }
    Span eq = cursor.span();
    cursor.advance();

    if (cursor.is_empty()) {
        m_context.push_diagnostic(Diagnostic::make(
            DiagnosticKind::MissingAttributeValue,
            String(std::format("missing value after `=` for attribute `{}`",
                               attribute.key_string().view())),
            eq));
        attribute.span = span_through(attribute.span, eq);
        return NodeAttribute(std::move(attribute));
    }

    if (cursor.peek_group(Delimiter::Brace)) {
        auto block = parse_block(cursor);
        if (!block) {
            return std::nullopt;
        }
        attribute.span = span_through(attribute.span, block->span());
        attribute.value = NodeValue(std::move(*block));
        return NodeAttribute(std::move(attribute));
    }

    auto value = parse_attribute_value(cursor);
    if (!value) {
        return std::nullopt;
    }
    attribute.span = span_through(attribute.span, value->span);
    attribute.value = NodeValue(std::move(*value));
    return NodeAttribute(std::move(attribute));
}

std::optional<Expression> Grammar::parse_attribute_value(Cursor& cursor) {
    Cursor fork = cursor.fork();
    auto parsed = m_context.expressions().parse_expression(fork);
    if (parsed.is_err()) {
        Diagnostic diagnostic = std::move(parsed.error());
        diagnostic.kind = DiagnosticKind::InvalidEmbeddedExpression;
        m_context.push_diagnostic(std::move(diagnostic));
        return std::nullopt;
    }
    cursor.advance_to(fork);
    return std::move(parsed.value());
}

} // namespace weft::markup
