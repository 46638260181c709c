#pragma once

#include "weft/core/types.hpp"
#include "weft/core/string.hpp"
#include "weft/tokens/cursor.hpp"
#include "weft/markup/diagnostic.hpp"
#include <optional>

namespace weft::markup {

// ============================================================================
// Expression - handle to an embedded host-language fragment
// ============================================================================

struct Expression {
    tokens::TokenStream tokens;
    tokens::Span span;

    // Decoded value when the expression is a single string literal
    [[nodiscard]] std::optional<String> as_string_literal() const;

    [[nodiscard]] String to_string() const { return tokens::to_string(tokens); }

    [[nodiscard]] bool operator==(const Expression& other) const {
        return to_string() == other.to_string();
    }
};

// ============================================================================
// ExpressionParser - host language collaborator
// ============================================================================

/**
 * The markup grammar only decides where an embedded fragment starts and
 * ends; everything inside is delegated to an ExpressionParser.
 *
 * parse_expression consumes exactly one expression and leaves the cursor
 * after it. parse_block consumes statements until the cursor is exhausted.
 */
class ExpressionParser {
public:
    virtual ~ExpressionParser() = default;

    [[nodiscard]] virtual Result<Expression, Diagnostic> parse_expression(tokens::Cursor& cursor) const = 0;
    [[nodiscard]] virtual Result<Expression, Diagnostic> parse_block(tokens::Cursor& cursor) const = 0;
};

// ============================================================================
// BasicExpressionParser - small Rust-like expression grammar
// ============================================================================

class BasicExpressionParser : public ExpressionParser {
public:
    [[nodiscard]] Result<Expression, Diagnostic> parse_expression(tokens::Cursor& cursor) const override;
    [[nodiscard]] Result<Expression, Diagnostic> parse_block(tokens::Cursor& cursor) const override;

private:
    // Each returns a diagnostic on failure and leaves the cursor unspecified
    [[nodiscard]] Result<void, Diagnostic> expression(tokens::Cursor& cursor) const;
    [[nodiscard]] Result<void, Diagnostic> unary(tokens::Cursor& cursor) const;
    [[nodiscard]] Result<void, Diagnostic> primary(tokens::Cursor& cursor) const;
    [[nodiscard]] Result<void, Diagnostic> path(tokens::Cursor& cursor) const;
    [[nodiscard]] Result<void, Diagnostic> postfix(tokens::Cursor& cursor) const;
    [[nodiscard]] Result<void, Diagnostic> statement(tokens::Cursor& cursor) const;
    [[nodiscard]] Result<void, Diagnostic> pattern(tokens::Cursor& cursor) const;
    [[nodiscard]] Result<void, Diagnostic> group_contents(const tokens::TokenTree& group) const;

    // Length in tokens of a binary operator at the cursor, 0 if none
    [[nodiscard]] static usize binary_operator_length(const tokens::Cursor& cursor);

    [[nodiscard]] static Diagnostic syntax_error(const tokens::Cursor& cursor, std::string_view expected);
};

[[nodiscard]] const ExpressionParser& default_expression_parser();

} // namespace weft::markup
