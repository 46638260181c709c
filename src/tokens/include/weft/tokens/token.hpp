#pragma once

#include "weft/core/types.hpp"
#include "weft/core/string.hpp"
#include <vector>
#include <optional>

namespace weft::tokens {

// ============================================================================
// Span - byte range plus 1-based line/column of the start
// ============================================================================

struct Span {
    u32 source_id{0};  // 0: synthetic, no source text behind it
    usize start{0};
    usize end{0};
    usize line{0};
    usize column{0};

    [[nodiscard]] bool is_synthetic() const { return source_id == 0; }

    [[nodiscard]] bool operator==(const Span& other) const {
        return source_id == other.source_id && start == other.start && end == other.end;
    }
    [[nodiscard]] bool operator!=(const Span& other) const { return !(*this == other); }
};

// Covers both spans; synthetic when they come from different sources
[[nodiscard]] Span join_spans(const Span& a, const Span& b);

// ============================================================================
// Token tree
// ============================================================================

enum class TokenKind : u8 {
    Ident,
    Punct,
    Literal,
    Group
};

enum class Spacing : u8 {
    Alone,
    Joint  // immediately followed by another punct
};

enum class LiteralKind : u8 {
    String,
    Char,
    Integer,
    Float
};

enum class Delimiter : u8 {
    Brace,
    Paren,
    Bracket
};

[[nodiscard]] char open_char(Delimiter delimiter);
[[nodiscard]] char close_char(Delimiter delimiter);

struct TokenTree;
using TokenStream = std::vector<TokenTree>;

struct TokenTree {
    TokenKind kind{TokenKind::Punct};

    // Ident name, punct character, or literal source representation
    String text;
    Spacing spacing{Spacing::Alone};

    // Literals
    LiteralKind literal_kind{LiteralKind::String};
    String value;  // decoded value of string/char literals

    // Groups
    Delimiter delimiter{Delimiter::Brace};
    TokenStream children;
    Span open_span;
    Span close_span;

    Span span;

    [[nodiscard]] static TokenTree ident(String name, Span span = {});
    [[nodiscard]] static TokenTree punct(char c, Spacing spacing = Spacing::Alone, Span span = {});
    [[nodiscard]] static TokenTree string_literal(String value, Span span = {});
    [[nodiscard]] static TokenTree literal(LiteralKind kind, String repr, String value, Span span = {});
    [[nodiscard]] static TokenTree group(Delimiter delimiter, TokenStream children, Span span = {});

    [[nodiscard]] bool is_ident() const { return kind == TokenKind::Ident; }
    [[nodiscard]] bool is_ident(std::string_view name) const {
        return kind == TokenKind::Ident && text.view() == name;
    }
    [[nodiscard]] bool is_punct() const { return kind == TokenKind::Punct; }
    [[nodiscard]] bool is_punct(char c) const {
        return kind == TokenKind::Punct && text.size() == 1 && text[0] == c;
    }
    [[nodiscard]] bool is_literal() const { return kind == TokenKind::Literal; }
    [[nodiscard]] bool is_string_literal() const {
        return kind == TokenKind::Literal && literal_kind == LiteralKind::String;
    }
    [[nodiscard]] bool is_group() const { return kind == TokenKind::Group; }
    [[nodiscard]] bool is_group(Delimiter d) const {
        return kind == TokenKind::Group && delimiter == d;
    }

    [[nodiscard]] char punct_char() const { return text.empty() ? '\0' : text[0]; }

    [[nodiscard]] String to_string() const;
};

// Whitespace-normalized re-stringification; the same tokens always print the same.
[[nodiscard]] String to_string(const TokenStream& stream);

[[nodiscard]] String token_kind_name(TokenKind kind);

} // namespace weft::tokens
