#pragma once

#include "weft/core/types.hpp"
#include "weft/core/string.hpp"
#include "weft/tokens/token.hpp"
#include <string_view>
#include <vector>

namespace weft::markup {

// ============================================================================
// Diagnostic kinds
// ============================================================================

enum class DiagnosticKind : u8 {
    UnterminatedOpenTag,
    MismatchedCloseTag,
    UnexpectedCloseTag,
    InvalidNodeName,
    MissingAttributeValue,
    InvalidEmbeddedExpression,
    UnterminatedFragment,
    TopLevelCardinalityViolation,
    TopLevelKindViolation,
    UnexpectedEndOfInput,
    UnexpectedToken,
    ElementCloseInFragment,
    NestingTooDeep,
    InvalidTransform,
};

[[nodiscard]] std::string_view diagnostic_kind_name(DiagnosticKind kind);

// ============================================================================
// Diagnostic
// ============================================================================

struct SecondarySpan {
    tokens::Span span;
    String label;
};

struct Diagnostic {
    DiagnosticKind kind{DiagnosticKind::UnexpectedToken};
    String message;
    tokens::Span primary_span;
    std::vector<SecondarySpan> secondary_spans;

    [[nodiscard]] static Diagnostic make(DiagnosticKind kind, String message, tokens::Span span);

    Diagnostic& with_label(tokens::Span span, String label);

    // "line:column: message"
    [[nodiscard]] String to_string() const;
};

} // namespace weft::markup
