#pragma once

#include "weft/core/types.hpp"
#include "weft/core/string.hpp"
#include "weft/tokens/token.hpp"
#include <string_view>
#include <vector>

namespace weft::tokens {

// ============================================================================
// LexError
// ============================================================================

struct LexError {
    String message;
    Span span;

    // "line:column: message"
    [[nodiscard]] String to_string() const;
};

// ============================================================================
// Lexer - turns source text into a token tree
// ============================================================================

/**
 * Reference tokenizer producing the token tree consumed by the markup
 * parser: identifiers, single-character puncts with spacing, literals and
 * delimited groups. Whitespace and comments are dropped; spans keep enough
 * position information to recover the original text later.
 */
class Lexer {
public:
    explicit Lexer(std::string_view source, u32 source_id = 1);

    [[nodiscard]] Result<TokenStream, LexError> tokenize();

private:
    struct OpenGroup {
        Delimiter delimiter;
        Span open_span;
        TokenStream children;
    };

    // Character access
    [[nodiscard]] bool at_end() const { return m_position >= m_source.size(); }
    [[nodiscard]] char peek(usize offset = 0) const;
    char bump();

    // Scanning; each returns false after recording m_error
    bool skip_whitespace_and_comments();
    bool scan_identifier(TokenTree& out);
    bool scan_number(TokenTree& out);
    bool scan_string(TokenTree& out);
    bool scan_char(TokenTree& out);
    bool scan_escape(StringBuilder& value);
    void scan_punct(TokenTree& out);

    [[nodiscard]] Span span_from(usize start, usize line, usize column) const;
    bool error(String message, Span span);

    [[nodiscard]] static bool is_identifier_start(char c);
    [[nodiscard]] static bool is_identifier_part(char c);
    [[nodiscard]] static bool is_punct_char(char c);

    std::string_view m_source;
    u32 m_source_id;
    usize m_position{0};
    usize m_line{1};
    usize m_column{1};

    // Token start
    usize m_start{0};
    usize m_start_line{1};
    usize m_start_column{1};

    std::optional<LexError> m_error;
};

// Convenience wrapper around Lexer
[[nodiscard]] Result<TokenStream, LexError> tokenize(std::string_view source, u32 source_id = 1);

} // namespace weft::tokens
