/**
 * Token tree lexer implementation
 */

#include "weft/tokens/lexer.hpp"
#include "weft/core/logger.hpp"
#include <format>

namespace weft::tokens {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("tokens");
    return instance;
}

std::optional<Delimiter> opening_delimiter(char c) {
    switch (c) {
        case '{': return Delimiter::Brace;
        case '(': return Delimiter::Paren;
        case '[': return Delimiter::Bracket;
        default: return std::nullopt;
    }
}

std::optional<Delimiter> closing_delimiter(char c) {
    switch (c) {
        case '}': return Delimiter::Brace;
        case ')': return Delimiter::Paren;
        case ']': return Delimiter::Bracket;
        default: return std::nullopt;
    }
}

} // anonymous namespace

String LexError::to_string() const {
    return String(std::format("{}:{}: {}", span.line, span.column, message.view()));
}

// ============================================================================
// Lexer
// ============================================================================

Lexer::Lexer(std::string_view source, u32 source_id)
    : m_source(source)
    , m_source_id(source_id) {}

char Lexer::peek(usize offset) const {
    if (m_position + offset >= m_source.size()) {
        return '\0';
    }
    return m_source[m_position + offset];
}

char Lexer::bump() {
    if (at_end()) {
        return '\0';
    }
    char c = m_source[m_position++];
    if (c == '\n') {
        ++m_line;
        m_column = 1;
    } else if ((static_cast<u8>(c) & 0xC0) != 0x80) {
        // Columns count code points, not continuation bytes
        ++m_column;
    }
    return c;
}

Span Lexer::span_from(usize start, usize line, usize column) const {
    return Span{m_source_id, start, m_position, line, column};
}

bool Lexer::error(String message, Span span) {
    if (!m_error) {
        m_error = LexError{std::move(message), span};
    }
    return false;
}

bool Lexer::is_identifier_start(char c) {
    auto byte = static_cast<u8>(c);
    return unicode::is_ascii_alpha(byte) || c == '_' || byte >= 0x80;
}

bool Lexer::is_identifier_part(char c) {
    return is_identifier_start(c) || unicode::is_ascii_digit(static_cast<u8>(c));
}

bool Lexer::is_punct_char(char c) {
    switch (c) {
        case '=': case '<': case '>': case '!': case '~': case '+': case '-':
        case '*': case '/': case '%': case '^': case '&': case '|': case '@':
        case '.': case ',': case ';': case ':': case '#': case '$': case '?':
        case '\\': case '`':
            return true;
        default:
            return false;
    }
}

Result<TokenStream, LexError> Lexer::tokenize() {
    TokenStream top;
    std::vector<OpenGroup> stack;

    auto current = [&]() -> TokenStream& {
        return stack.empty() ? top : stack.back().children;
    };

    while (true) {
        if (!skip_whitespace_and_comments()) {
            break;
        }
        if (at_end()) {
            break;
        }

        m_start = m_position;
        m_start_line = m_line;
        m_start_column = m_column;
        char c = peek();

        if (auto open = opening_delimiter(c)) {
            bump();
            stack.push_back(OpenGroup{*open, span_from(m_start, m_start_line, m_start_column), {}});
            continue;
        }

        if (auto close = closing_delimiter(c)) {
            bump();
            Span close_span = span_from(m_start, m_start_line, m_start_column);
            if (stack.empty()) {
                error(String(std::format("unexpected closing delimiter '{}'", c)), close_span);
                break;
            }
            if (stack.back().delimiter != *close) {
                error(String(std::format("mismatched closing delimiter '{}', expected '{}'",
                                         c, close_char(stack.back().delimiter))),
                      close_span);
                break;
            }
            OpenGroup group = std::move(stack.back());
            stack.pop_back();

            TokenTree token = TokenTree::group(group.delimiter, std::move(group.children));
            token.open_span = group.open_span;
            token.close_span = close_span;
            token.span = join_spans(group.open_span, close_span);
            token.span.line = group.open_span.line;
            token.span.column = group.open_span.column;
            current().push_back(std::move(token));
            continue;
        }

        TokenTree token;
        bool ok = true;
        if (c == '"') {
            ok = scan_string(token);
        } else if (c == '\'') {
            ok = scan_char(token);
        } else if (unicode::is_ascii_digit(static_cast<u8>(c))) {
            ok = scan_number(token);
        } else if (is_identifier_start(c)) {
            ok = scan_identifier(token);
        } else if (is_punct_char(c)) {
            scan_punct(token);
        } else {
            bump();
            ok = error(String(std::format("unexpected character (0x{:02x})", static_cast<u8>(c))),
                       span_from(m_start, m_start_line, m_start_column));
        }

        if (!ok) {
            break;
        }
        current().push_back(std::move(token));
    }

    if (!m_error && !stack.empty()) {
        error(String(std::format("unclosed delimiter '{}'", open_char(stack.back().delimiter))),
              stack.back().open_span);
    }

    if (m_error) {
        logger().debug_fmt("lex error at {}:{}: {}", m_error->span.line, m_error->span.column,
                           m_error->message.view());
        return make_error(std::move(*m_error));
    }

    logger().trace_fmt("tokenized {} bytes into {} top-level tokens", m_source.size(), top.size());
    return top;
}

bool Lexer::skip_whitespace_and_comments() {
    while (!at_end()) {
        char c = peek();
        if (unicode::is_ascii_whitespace(static_cast<u8>(c))) {
            bump();
            continue;
        }
        if (c == '/' && peek(1) == '/') {
            while (!at_end() && peek() != '\n') {
                bump();
            }
            continue;
        }
        if (c == '/' && peek(1) == '*') {
            usize start = m_position;
            usize line = m_line;
            usize column = m_column;
            bump();
            bump();
            while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
                bump();
            }
            if (at_end()) {
                return error("unterminated block comment", span_from(start, line, column));
            }
            bump();
            bump();
            continue;
        }
        break;
    }
    return true;
}

bool Lexer::scan_identifier(TokenTree& out) {
    while (!at_end() && is_identifier_part(peek())) {
        if (static_cast<u8>(peek()) >= 0x80) {
            auto decoded = unicode::utf8_decode(m_source.data() + m_position,
                                                m_source.size() - m_position);
            if (decoded.code_point == unicode::REPLACEMENT_CHARACTER ||
                decoded.code_point == unicode::INVALID_CODE_POINT) {
                return error("invalid UTF-8 in identifier",
                             span_from(m_start, m_start_line, m_start_column));
            }
            for (usize i = 0; i < decoded.bytes_consumed; ++i) {
                bump();
            }
            continue;
        }
        bump();
    }
    Span span = span_from(m_start, m_start_line, m_start_column);
    out = TokenTree::ident(String(m_source.substr(m_start, m_position - m_start)), span);
    return true;
}

bool Lexer::scan_number(TokenTree& out) {
    bool is_float = false;

    while (unicode::is_ascii_digit(static_cast<u8>(peek())) || peek() == '_') {
        bump();
    }

    // "1.5" is a float, but "x.0.1" field chains and "1..2" ranges are not
    if (peek() == '.' && unicode::is_ascii_digit(static_cast<u8>(peek(1)))) {
        is_float = true;
        bump();
        while (unicode::is_ascii_digit(static_cast<u8>(peek())) || peek() == '_') {
            bump();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        usize sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
        if (unicode::is_ascii_digit(static_cast<u8>(peek(1 + sign)))) {
            is_float = true;
            bump();
            if (sign) {
                bump();
            }
            while (unicode::is_ascii_digit(static_cast<u8>(peek()))) {
                bump();
            }
        }
    }

    // Type suffix or radix tail ("42u8", "0xff")
    while (!at_end() && is_identifier_part(peek()) && static_cast<u8>(peek()) < 0x80) {
        bump();
    }

    String repr(m_source.substr(m_start, m_position - m_start));
    out = TokenTree::literal(is_float ? LiteralKind::Float : LiteralKind::Integer,
                             repr, repr, span_from(m_start, m_start_line, m_start_column));
    return true;
}

bool Lexer::scan_escape(StringBuilder& value) {
    usize start = m_position;
    usize line = m_line;
    usize column = m_column;
    bump();  // backslash

    char c = bump();
    switch (c) {
        case 'n': value.append('\n'); return true;
        case 't': value.append('\t'); return true;
        case 'r': value.append('\r'); return true;
        case '0': value.append('\0'); return true;
        case '\\': value.append('\\'); return true;
        case '"': value.append('"'); return true;
        case '\'': value.append('\''); return true;
        case 'u': {
            if (bump() != '{') {
                return error("expected '{' in unicode escape", span_from(start, line, column));
            }
            unicode::CodePoint cp = 0;
            usize digits = 0;
            while (!at_end() && peek() != '}') {
                char h = bump();
                u32 digit;
                if (h >= '0' && h <= '9') digit = static_cast<u32>(h - '0');
                else if (h >= 'a' && h <= 'f') digit = static_cast<u32>(h - 'a' + 10);
                else if (h >= 'A' && h <= 'F') digit = static_cast<u32>(h - 'A' + 10);
                else return error("invalid hex digit in unicode escape", span_from(start, line, column));
                cp = (cp << 4) | digit;
                ++digits;
            }
            if (at_end() || digits == 0 || digits > 6 || !unicode::is_valid(cp)) {
                return error("invalid unicode escape", span_from(start, line, column));
            }
            bump();  // '}'
            value.append(cp);
            return true;
        }
        default:
            return error("unknown escape sequence", span_from(start, line, column));
    }
}

bool Lexer::scan_string(TokenTree& out) {
    bump();  // opening quote
    StringBuilder value;

    while (true) {
        if (at_end()) {
            return error("unterminated string literal",
                         span_from(m_start, m_start_line, m_start_column));
        }
        char c = peek();
        if (c == '"') {
            bump();
            break;
        }
        if (c == '\\') {
            if (!scan_escape(value)) {
                return false;
            }
            continue;
        }
        value.append(bump());
    }

    Span span = span_from(m_start, m_start_line, m_start_column);
    out = TokenTree::literal(LiteralKind::String,
                             String(m_source.substr(m_start, m_position - m_start)),
                             value.build(), span);
    return true;
}

bool Lexer::scan_char(TokenTree& out) {
    bump();  // opening quote
    StringBuilder value;

    if (peek() == '\\') {
        if (!scan_escape(value)) {
            return false;
        }
    } else if (!at_end() && peek() != '\'' && peek() != '\n') {
        auto decoded = unicode::utf8_decode(m_source.data() + m_position,
                                            m_source.size() - m_position);
        for (usize i = 0; i < decoded.bytes_consumed; ++i) {
            value.append(bump());
        }
    }

    if (value.empty() || peek() != '\'') {
        return error("unterminated character literal",
                     span_from(m_start, m_start_line, m_start_column));
    }
    bump();

    Span span = span_from(m_start, m_start_line, m_start_column);
    out = TokenTree::literal(LiteralKind::Char,
                             String(m_source.substr(m_start, m_position - m_start)),
                             value.build(), span);
    return true;
}

void Lexer::scan_punct(TokenTree& out) {
    char c = bump();
    Spacing spacing = is_punct_char(peek()) ? Spacing::Joint : Spacing::Alone;
    out = TokenTree::punct(c, spacing, span_from(m_start, m_start_line, m_start_column));
}

Result<TokenStream, LexError> tokenize(std::string_view source, u32 source_id) {
    Lexer lexer(source, source_id);
    return lexer.tokenize();
}

} // namespace weft::tokens
