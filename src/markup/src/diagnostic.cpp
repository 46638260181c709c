#include "weft/markup/diagnostic.hpp"
#include <format>

namespace weft::markup {

std::string_view diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UnterminatedOpenTag: return "UnterminatedOpenTag";
        case DiagnosticKind::MismatchedCloseTag: return "MismatchedCloseTag";
        case DiagnosticKind::UnexpectedCloseTag: return "UnexpectedCloseTag";
        case DiagnosticKind::InvalidNodeName: return "InvalidNodeName";
        case DiagnosticKind::MissingAttributeValue: return "MissingAttributeValue";
        case DiagnosticKind::InvalidEmbeddedExpression: return "InvalidEmbeddedExpression";
        case DiagnosticKind::UnterminatedFragment: return "UnterminatedFragment";
        case DiagnosticKind::TopLevelCardinalityViolation: return "TopLevelCardinalityViolation";
        case DiagnosticKind::TopLevelKindViolation: return "TopLevelKindViolation";
        case DiagnosticKind::UnexpectedEndOfInput: return "UnexpectedEndOfInput";
        case DiagnosticKind::UnexpectedToken: return "UnexpectedToken";
        case DiagnosticKind::ElementCloseInFragment: return "ElementCloseInFragment";
        case DiagnosticKind::NestingTooDeep: return "NestingTooDeep";
        case DiagnosticKind::InvalidTransform: return "InvalidTransform";
    }
    return "Unknown";
}

Diagnostic Diagnostic::make(DiagnosticKind kind, String message, tokens::Span span) {
    Diagnostic diagnostic;
    diagnostic.kind = kind;
    diagnostic.message = std::move(message);
    diagnostic.primary_span = span;
    return diagnostic;
}

Diagnostic& Diagnostic::with_label(tokens::Span span, String label) {
    secondary_spans.push_back(SecondarySpan{span, std::move(label)});
    return *this;
}

String Diagnostic::to_string() const {
    return String(std::format("{}:{}: {}", primary_span.line, primary_span.column, message.view()));
}

} // namespace weft::markup
