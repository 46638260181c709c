/**
 * Reference host expression grammar
 */

#include "weft/markup/expression.hpp"
#include <format>

namespace weft::markup {

using tokens::Cursor;
using tokens::Delimiter;
using tokens::TokenStream;
using tokens::TokenTree;

namespace {

tokens::Span span_of(const TokenStream& stream, const tokens::Span& fallback) {
    if (stream.empty()) {
        return fallback;
    }
    auto span = tokens::join_spans(stream.front().span, stream.back().span);
    if (span.is_synthetic()) {
        return stream.front().span;
    }
    span.line = stream.front().span.line;
    span.column = stream.front().span.column;
    return span;
}

bool is_unary_operator(const TokenTree* token) {
    return token && (token->is_punct('-') || token->is_punct('!') ||
                     token->is_punct('&') || token->is_punct('*'));
}

constexpr std::string_view TWO_CHAR_OPERATORS[] = {
    "==", "!=", "<=", ">=", "&&", "||", "..", "<<", ">>",
    "+=", "-=", "*=", "/=", "%=", "^=", "&=", "|=",
};

constexpr std::string_view ONE_CHAR_OPERATORS = "+-*/%^&|<>=";

} // anonymous namespace

std::optional<String> Expression::as_string_literal() const {
    if (tokens.size() != 1 || !tokens.front().is_string_literal()) {
        return std::nullopt;
    }
    return tokens.front().value;
}

// ============================================================================
// Entry points
// ============================================================================

Result<Expression, Diagnostic> BasicExpressionParser::parse_expression(Cursor& cursor) const {
    Cursor start = cursor.fork();
    auto result = expression(cursor);
    if (result.is_err()) {
        return make_error(std::move(result.error()));
    }
    Expression parsed;
    parsed.tokens = start.tokens_until(cursor);
    parsed.span = span_of(parsed.tokens, start.span());
    return parsed;
}

Result<Expression, Diagnostic> BasicExpressionParser::parse_block(Cursor& cursor) const {
    Cursor start = cursor.fork();

    while (!cursor.is_empty()) {
        if (cursor.peek_punct(';')) {
            cursor.advance();
            continue;
        }

        auto result = statement(cursor);
        if (result.is_err()) {
            return make_error(std::move(result.error()));
        }
        if (cursor.is_empty()) {
            break;
        }
        if (cursor.peek_punct(';')) {
            cursor.advance();
            continue;
        }

        // Block-like statements ("if c { .. }", "{ .. }") need no separator
        const TokenTree* last = cursor.position() - 1;
        if (!last->is_group(Delimiter::Brace)) {
            return make_error(syntax_error(cursor, "`;`"));
        }
    }

    Expression parsed;
    parsed.tokens = start.tokens_until(cursor);
    parsed.span = span_of(parsed.tokens, start.span());
    return parsed;
}

// ============================================================================
// Grammar
// ============================================================================

Result<void, Diagnostic> BasicExpressionParser::expression(Cursor& cursor) const {
    auto operand = unary(cursor);
    if (operand.is_err()) {
        return operand;
    }

    while (usize length = binary_operator_length(cursor)) {
        for (usize i = 0; i < length; ++i) {
            cursor.advance();
        }
        operand = unary(cursor);
        if (operand.is_err()) {
            return operand;
        }
    }
    return {};
}

Result<void, Diagnostic> BasicExpressionParser::unary(Cursor& cursor) const {
    while (is_unary_operator(cursor.peek())) {
        cursor.advance();
        if (cursor.peek_ident_named("mut")) {
            cursor.advance();
        }
    }

    auto result = primary(cursor);
    if (result.is_err()) {
        return result;
    }
    return postfix(cursor);
}

Result<void, Diagnostic> BasicExpressionParser::primary(Cursor& cursor) const {
    const TokenTree* token = cursor.peek();
    if (!token) {
        return make_error(syntax_error(cursor, "expression"));
    }

    if (token->is_literal()) {
        cursor.advance();
        return {};
    }

    if (token->is_group()) {
        auto contents = group_contents(*token);
        if (contents.is_err()) {
            return contents;
        }
        cursor.advance();
        return {};
    }

    // Closure: |args| body
    if (token->is_punct('|')) {
        cursor.advance();
        while (!cursor.is_empty() && !cursor.peek_punct('|')) {
            cursor.advance();
        }
        if (!cursor.peek_punct('|')) {
            return make_error(syntax_error(cursor, "`|`"));
        }
        cursor.advance();
        return expression(cursor);
    }

    if (token->is_ident("if") || token->is_ident("while")) {
        cursor.advance();
        if (cursor.peek_ident_named("let")) {
            cursor.advance();
            auto bound = pattern(cursor);
            if (bound.is_err()) {
                return bound;
            }
            if (!cursor.peek_punct('=')) {
                return make_error(syntax_error(cursor, "`=`"));
            }
            cursor.advance();
        }
        auto condition = expression(cursor);
        if (condition.is_err()) {
            return condition;
        }
        if (!cursor.peek_group(Delimiter::Brace)) {
            return make_error(syntax_error(cursor, "block"));
        }
        auto body = group_contents(*cursor.advance());
        if (body.is_err()) {
            return body;
        }
        if (token->is_ident("if") && cursor.peek_ident_named("else")) {
            cursor.advance();
            if (cursor.peek_ident_named("if")) {
                return primary(cursor);
            }
            if (!cursor.peek_group(Delimiter::Brace)) {
                return make_error(syntax_error(cursor, "block"));
            }
            return group_contents(*cursor.advance());
        }
        return {};
    }

    if (token->is_ident("for")) {
        cursor.advance();
        auto bound = pattern(cursor);
        if (bound.is_err()) {
            return bound;
        }
        if (!cursor.peek_ident_named("in")) {
            return make_error(syntax_error(cursor, "`in`"));
        }
        cursor.advance();
        auto iterable = expression(cursor);
        if (iterable.is_err()) {
            return iterable;
        }
        if (!cursor.peek_group(Delimiter::Brace)) {
            return make_error(syntax_error(cursor, "block"));
        }
        return group_contents(*cursor.advance());
    }

    if (token->is_ident("match")) {
        cursor.advance();
        auto scrutinee = expression(cursor);
        if (scrutinee.is_err()) {
            return scrutinee;
        }
        // Arms are not checked
        if (!cursor.peek_group(Delimiter::Brace)) {
            return make_error(syntax_error(cursor, "match arms"));
        }
        cursor.advance();
        return {};
    }

    if (token->is_ident() || (cursor.peek_punct(':') && cursor.peek_punct(':', 1))) {
        return path(cursor);
    }

    return make_error(syntax_error(cursor, "expression"));
}

Result<void, Diagnostic> BasicExpressionParser::path(Cursor& cursor) const {
    if (cursor.peek_punct(':') && cursor.peek_punct(':', 1)) {
        cursor.advance();
        cursor.advance();
    }
    if (!cursor.peek_ident()) {
        return make_error(syntax_error(cursor, "identifier"));
    }
    cursor.advance();

    while (cursor.peek_punct(':') && cursor.peek_punct(':', 1)) {
        cursor.advance();
        cursor.advance();
        if (!cursor.peek_ident()) {
            return make_error(syntax_error(cursor, "identifier after `::`"));
        }
        cursor.advance();
    }

    // Macro invocation: contents are opaque
    if (cursor.peek_punct('!')) {
        const TokenTree* next = cursor.peek(1);
        if (next && next->is_group()) {
            cursor.advance();
            cursor.advance();
        }
    }
    return {};
}

Result<void, Diagnostic> BasicExpressionParser::postfix(Cursor& cursor) const {
    while (true) {
        if (cursor.peek_punct('.') && !cursor.peek_punct('.', 1)) {
            cursor.advance();
            const TokenTree* field = cursor.peek();
            if (field && (field->is_ident() ||
                          (field->is_literal() && field->literal_kind == tokens::LiteralKind::Integer))) {
                cursor.advance();
                continue;
            }
            return make_error(syntax_error(cursor, "field name after `.`"));
        }
        if (cursor.peek_punct('?')) {
            cursor.advance();
            continue;
        }
        if (cursor.peek_group(Delimiter::Paren) || cursor.peek_group(Delimiter::Bracket)) {
            auto arguments = group_contents(*cursor.peek());
            if (arguments.is_err()) {
                return arguments;
            }
            cursor.advance();
            continue;
        }
        return {};
    }
}

Result<void, Diagnostic> BasicExpressionParser::statement(Cursor& cursor) const {
    if (cursor.peek_ident_named("let")) {
        cursor.advance();
        auto bound = pattern(cursor);
        if (bound.is_err()) {
            return bound;
        }
        if (cursor.peek_punct(':')) {
            // Type annotation: skip to the initializer
            while (!cursor.is_empty() && !cursor.peek_punct('=') && !cursor.peek_punct(';')) {
                cursor.advance();
            }
        }
        if (cursor.peek_punct('=')) {
            cursor.advance();
            return expression(cursor);
        }
        return {};
    }
    return expression(cursor);
}

Result<void, Diagnostic> BasicExpressionParser::pattern(Cursor& cursor) const {
    if (cursor.peek_ident_named("mut")) {
        cursor.advance();
    }
    const TokenTree* token = cursor.peek();
    if (token && (token->is_ident() || token->is_group(Delimiter::Paren) ||
                  token->is_group(Delimiter::Bracket))) {
        cursor.advance();
        // Tuple struct: Some(x)
        if (token->is_ident() && cursor.peek_group(Delimiter::Paren)) {
            cursor.advance();
        }
        return {};
    }
    return make_error(syntax_error(cursor, "pattern"));
}

Result<void, Diagnostic> BasicExpressionParser::group_contents(const TokenTree& group) const {
    Cursor inner = Cursor::into_group(group);

    if (group.delimiter == Delimiter::Brace) {
        auto block = parse_block(inner);
        if (block.is_err()) {
            return make_error(std::move(block.error()));
        }
        return {};
    }

    while (!inner.is_empty()) {
        auto element = expression(inner);
        if (element.is_err()) {
            return element;
        }
        if (inner.is_empty()) {
            break;
        }
        // [value; count]
        bool separator = inner.peek_punct(',') ||
                         (group.delimiter == Delimiter::Bracket && inner.peek_punct(';'));
        if (!separator) {
            return make_error(syntax_error(inner, "`,`"));
        }
        inner.advance();
    }
    return {};
}

usize BasicExpressionParser::binary_operator_length(const Cursor& cursor) {
    const TokenTree* first = cursor.peek();
    if (!first || !first->is_punct()) {
        return 0;
    }

    const TokenTree* second = cursor.peek(1);
    if (first->spacing == tokens::Spacing::Joint && second && second->is_punct()) {
        char pair[2] = {first->punct_char(), second->punct_char()};
        std::string_view candidate(pair, 2);
        for (auto op : TWO_CHAR_OPERATORS) {
            if (op == candidate) {
                return 2;
            }
        }
    }

    if (first->is_punct('.')) {
        return 0;
    }
    return ONE_CHAR_OPERATORS.find(first->punct_char()) != std::string_view::npos ? 1 : 0;
}

Diagnostic BasicExpressionParser::syntax_error(const Cursor& cursor, std::string_view expected) {
    const TokenTree* found = cursor.peek();
    String message = found
        ? String(std::format("expected {}, found `{}`", expected, found->to_string().view()))
        : String(std::format("expected {}, found end of input", expected));
    return Diagnostic::make(DiagnosticKind::InvalidEmbeddedExpression, std::move(message), cursor.span());
}

const ExpressionParser& default_expression_parser() {
    static const BasicExpressionParser parser{};
    return parser;
}

} // namespace weft::markup
