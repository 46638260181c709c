#include "weft/tokens/token.hpp"
#include <algorithm>

namespace weft::tokens {

Span join_spans(const Span& a, const Span& b) {
    if (a.source_id != b.source_id || a.is_synthetic()) {
        return Span{};
    }
    const Span& first = a.start <= b.start ? a : b;
    Span result = first;
    result.start = std::min(a.start, b.start);
    result.end = std::max(a.end, b.end);
    return result;
}

char open_char(Delimiter delimiter) {
    switch (delimiter) {
        case Delimiter::Brace: return '{';
        case Delimiter::Paren: return '(';
        case Delimiter::Bracket: return '[';
    }
    return '{';
}

char close_char(Delimiter delimiter) {
    switch (delimiter) {
        case Delimiter::Brace: return '}';
        case Delimiter::Paren: return ')';
        case Delimiter::Bracket: return ']';
    }
    return '}';
}

// ============================================================================
// TokenTree factories
// ============================================================================

TokenTree TokenTree::ident(String name, Span span) {
    TokenTree token;
    token.kind = TokenKind::Ident;
    token.text = std::move(name);
    token.span = span;
    return token;
}

TokenTree TokenTree::punct(char c, Spacing spacing, Span span) {
    TokenTree token;
    token.kind = TokenKind::Punct;
    token.text = String(1, c);
    token.spacing = spacing;
    token.span = span;
    return token;
}

TokenTree TokenTree::string_literal(String value, Span span) {
    StringBuilder repr;
    repr.append('"');
    for (char c : value) {
        switch (c) {
            case '"': repr.append("\\\""); break;
            case '\\': repr.append("\\\\"); break;
            case '\n': repr.append("\\n"); break;
            case '\t': repr.append("\\t"); break;
            case '\r': repr.append("\\r"); break;
            default: repr.append(c); break;
        }
    }
    repr.append('"');
    return literal(LiteralKind::String, repr.build(), std::move(value), span);
}

TokenTree TokenTree::literal(LiteralKind kind, String repr, String value, Span span) {
    TokenTree token;
    token.kind = TokenKind::Literal;
    token.literal_kind = kind;
    token.text = std::move(repr);
    token.value = std::move(value);
    token.span = span;
    return token;
}

TokenTree TokenTree::group(Delimiter delimiter, TokenStream children, Span span) {
    TokenTree token;
    token.kind = TokenKind::Group;
    token.delimiter = delimiter;
    token.children = std::move(children);
    token.span = span;
    token.open_span = span;
    token.close_span = span;
    return token;
}

// ============================================================================
// Canonical printing
// ============================================================================

namespace {

void print_stream(StringBuilder& out, const TokenStream& stream);

void print_token(StringBuilder& out, const TokenTree& token) {
    if (token.kind != TokenKind::Group) {
        out.append(token.text);
        return;
    }
    out.append(open_char(token.delimiter));
    if (!token.children.empty()) {
        out.append(' ');
        print_stream(out, token.children);
        out.append(' ');
    }
    out.append(close_char(token.delimiter));
}

void print_stream(StringBuilder& out, const TokenStream& stream) {
    for (usize i = 0; i < stream.size(); ++i) {
        const auto& token = stream[i];
        print_token(out, token);
        if (i + 1 == stream.size()) {
            break;
        }
        bool glued = token.is_punct() && token.spacing == Spacing::Joint &&
                     stream[i + 1].is_punct();
        if (!glued) {
            out.append(' ');
        }
    }
}

} // anonymous namespace

String TokenTree::to_string() const {
    StringBuilder out;
    print_token(out, *this);
    return out.build();
}

String to_string(const TokenStream& stream) {
    StringBuilder out;
    print_stream(out, stream);
    return out.build();
}

String token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::Ident: return "identifier";
        case TokenKind::Punct: return "punctuation";
        case TokenKind::Literal: return "literal";
        case TokenKind::Group: return "group";
    }
    return "token";
}

} // namespace weft::tokens
