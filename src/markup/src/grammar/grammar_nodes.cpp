/**
 * Markup grammar - node dispatch, elements, fragments and leaf nodes
 */

#include "weft/markup/grammar.hpp"
#include "weft/core/logger.hpp"
#include <format>

namespace weft::markup {

using tokens::Cursor;
using tokens::Delimiter;
using tokens::Span;
using tokens::TokenStream;
using tokens::TokenTree;

namespace {

Logger& logger() {
    static Logger& instance = logging::get("markup");
    return instance;
}

std::string_view start_name(Grammar::NodeStart start) {
    switch (start) {
        case Grammar::NodeStart::Element: return "element";
        case Grammar::NodeStart::Fragment: return "fragment";
        case Grammar::NodeStart::CloseTag: return "close tag";
        case Grammar::NodeStart::Comment: return "comment";
        case Grammar::NodeStart::Doctype: return "doctype";
        case Grammar::NodeStart::Block: return "block";
        case Grammar::NodeStart::Text: return "text";
        case Grammar::NodeStart::RawText: return "raw text";
        case Grammar::NodeStart::End: return "end";
    }
    return "unknown";
}

// Leaves the nesting level on scope exit
class NestingScope {
public:
    NestingScope(Context& context, const Span& span)
        : m_context(context)
        , m_entered(context.enter_nested(span)) {}

    ~NestingScope() {
        if (m_entered) {
            m_context.leave_nested();
        }
    }

    NestingScope(const NestingScope&) = delete;
    NestingScope& operator=(const NestingScope&) = delete;

    [[nodiscard]] bool entered() const { return m_entered; }

private:
    Context& m_context;
    bool m_entered;
};

Span span_through(const Span& start, const Span& end) {
    Span joined = tokens::join_spans(start, end);
    return joined.is_synthetic() ? start : joined;
}

bool at_close_tag_start(const Cursor& cursor) {
    return cursor.peek_punct('<') && cursor.peek_punct('/', 1);
}

} // anonymous namespace

Grammar::Grammar(Context& context) : m_context(context) {}

// ============================================================================
// Dispatch
// ============================================================================

Grammar::NodeStart Grammar::classify(const Cursor& cursor) {
    if (cursor.is_empty()) {
        return NodeStart::End;
    }
    if (cursor.peek_group(Delimiter::Brace)) {
        return NodeStart::Block;
    }
    if (cursor.peek_string_literal()) {
        return NodeStart::Text;
    }
    if (!cursor.peek_punct('<')) {
        return NodeStart::RawText;
    }

    if (cursor.peek_punct('!', 1)) {
        // "<!doctype" vs "<!--"
        return cursor.peek_ident(2) ? NodeStart::Doctype : NodeStart::Comment;
    }
    if (cursor.peek_punct('>', 1)) {
        return NodeStart::Fragment;
    }
    if (cursor.peek_punct('/', 1)) {
        return NodeStart::CloseTag;
    }
    return NodeStart::Element;
}

std::vector<Node> Grammar::parse_nodes(Cursor& cursor) {
    std::vector<Node> nodes;
    while (!cursor.is_empty() && !m_context.should_stop()) {
        if (!parse_node_guarded(cursor, nodes)) {
            break;
        }
    }
    return nodes;
}

std::optional<Node> Grammar::parse_node(Cursor& cursor) {
    NodeStart start = classify(cursor);
    logger().trace_fmt("{} at {}:{}", start_name(start), cursor.span().line, cursor.span().column);

    switch (start) {
        case NodeStart::Element:
            return parse_element(cursor);
        case NodeStart::Fragment:
            return parse_fragment(cursor);
        case NodeStart::Comment:
            return parse_comment(cursor);
        case NodeStart::Doctype:
            return parse_doctype(cursor);
        case NodeStart::Text:
            return parse_text(cursor);
        case NodeStart::RawText:
            return Node(parse_raw_text(cursor));
        case NodeStart::Block: {
            auto block = parse_block(cursor);
            if (!block) {
                return std::nullopt;
            }
            return Node(std::move(*block));
        }
        case NodeStart::CloseTag: {
            // Nothing is open at this level; drop the tag
            Span span = cursor.span();
            if (cursor.peek_punct('>', 2)) {
                if (parse_fragment_close(cursor)) {
                    m_context.push_diagnostic(Diagnostic::make(
                        DiagnosticKind::UnexpectedCloseTag,
                        "close tag </> has no corresponding open tag", span));
                }
                return std::nullopt;
            }
            auto close = parse_close_tag(cursor);
            if (close) {
                m_context.push_diagnostic(Diagnostic::make(
                    DiagnosticKind::UnexpectedCloseTag,
                    String(std::format("close tag </{}> has no corresponding open tag",
                                       close->name.to_string().view())),
                    span));
            }
            return std::nullopt;
        }
        case NodeStart::End:
            break;
    }

    m_context.halt(Diagnostic::make(DiagnosticKind::UnexpectedEndOfInput,
                                    "unexpected end of input, expected a node", cursor.span()));
    return std::nullopt;
}

bool Grammar::parse_node_guarded(Cursor& cursor, std::vector<Node>& out) {
    const TokenTree* before = cursor.position();

    if (auto node = parse_node(cursor)) {
        out.push_back(std::move(*node));
    }
    if (m_context.should_stop()) {
        return false;
    }
    if (cursor.position() == before) {
        return recover_from_stall(cursor);
    }
    return true;
}

bool Grammar::recover_from_stall(Cursor& cursor) {
    // Raw text takes every token that cannot start a node, so a stall always
    // sits on a '<' whose rule already reported the failure
    if (!m_context.config().skip_malformed_markup) {
        m_context.halt(Diagnostic::make(DiagnosticKind::UnexpectedEndOfInput,
                                        "unable to continue parsing after the previous error",
                                        cursor.span()));
        return false;
    }

    Span start = cursor.span();
    Cursor fork = cursor.fork();
    fork.advance();
    skip_malformed_tag(cursor, fork);
    logger().debug_fmt("skipped malformed markup at {}:{}", start.line, start.column);
    return true;
}

std::vector<Node> Grammar::parse_children(Cursor& cursor) {
    std::vector<Node> children;
    while (!cursor.is_empty() && !m_context.should_stop()) {
        if (at_close_tag_start(cursor)) {
            break;
        }
        if (!parse_node_guarded(cursor, children)) {
            break;
        }
    }
    return children;
}

// ============================================================================
// Element
// ============================================================================

std::optional<Node> Grammar::parse_element(Cursor& cursor) {
    NestingScope nesting(m_context, cursor.span());
    if (!nesting.entered()) {
        return std::nullopt;
    }

    auto open_tag = parse_open_tag(cursor);
    if (!open_tag) {
        return std::nullopt;
    }

    NodeElement element;
    element.open_tag = std::move(*open_tag);
    element.span = element.open_tag.span;

    const OpenTag& open = element.open_tag;
    String name = open.name.to_string();

    if (open.self_closing || m_context.config().is_self_closing(name)) {
        logger().trace_fmt("<{}> closes itself", name.view());
        return Node(std::move(element));
    }

    if (m_context.config().is_raw_text(name)) {
        RawText body = parse_raw_text_body(cursor);
        if (!body.is_empty()) {
            element.children.push_back(Node(std::move(body)));
        }
    } else {
        element.children = parse_children(cursor);
    }

    if (!element.children.empty()) {
        element.span = span_through(open.span, element.children.back().span());
    }

    // Stopped below: keep what was built
    if (m_context.should_stop()) {
        return Node(std::move(element));
    }

    if (cursor.is_empty()) {
        m_context.push_diagnostic(
            Diagnostic::make(DiagnosticKind::UnterminatedOpenTag,
                             String(std::format("open tag <{}> has no corresponding close tag",
                                                name.view())),
                             open.span));
        RawText::vec_set_context(open.end_span, std::nullopt, element.children);
        return Node(std::move(element));
    }

    auto close_tag = parse_close_tag(cursor);
    if (!close_tag) {
        RawText::vec_set_context(open.end_span, std::nullopt, element.children);
        return Node(std::move(element));
    }

    if (close_tag->name != open.name) {
        auto diagnostic = Diagnostic::make(
            DiagnosticKind::MismatchedCloseTag,
            String(std::format("wrong close tag found: expected </{}>, found </{}>",
                               name.view(), close_tag->name.to_string().view())),
            close_tag->span);
        diagnostic.with_label(open.span, "open tag that should be closed; it started here");
        m_context.push_diagnostic(std::move(diagnostic));
    }

    RawText::vec_set_context(open.end_span, close_tag->start_span, element.children);
    element.span = span_through(open.span, close_tag->span);
    element.close_tag = std::move(*close_tag);
    return Node(std::move(element));
}

// ============================================================================
// Fragment
// ============================================================================

std::optional<Node> Grammar::parse_fragment(Cursor& cursor) {
    NestingScope nesting(m_context, cursor.span());
    if (!nesting.entered()) {
        return std::nullopt;
    }

    NodeFragment fragment;
    Span lt = cursor.span();
    cursor.advance();
    Span gt = cursor.span();
    cursor.advance();
    fragment.open_span = span_through(lt, gt);
    fragment.span = fragment.open_span;

    fragment.children = parse_children(cursor);
    if (!fragment.children.empty()) {
        fragment.span = span_through(fragment.open_span, fragment.children.back().span());
    }

    if (m_context.should_stop()) {
        return Node(std::move(fragment));
    }

    if (cursor.is_empty()) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnterminatedFragment,
                                                   "fragment has no closing </>",
                                                   fragment.open_span));
        RawText::vec_set_context(fragment.open_span, std::nullopt, fragment.children);
        return Node(std::move(fragment));
    }

    auto close = parse_fragment_close(cursor);
    if (close) {
        RawText::vec_set_context(fragment.open_span, close->start_span, fragment.children);
        fragment.span = span_through(fragment.open_span, close->span);
        fragment.close = std::move(*close);
    } else {
        RawText::vec_set_context(fragment.open_span, std::nullopt, fragment.children);
    }
    return Node(std::move(fragment));
}

// ============================================================================
// Comment, doctype, text
// ============================================================================

std::optional<Node> Grammar::parse_comment(Cursor& cursor) {
    Cursor fork = cursor.fork();
    Span start = fork.span();

    bool has_start = fork.peek_punct('<') && fork.peek_punct('!', 1) &&
                     fork.peek_punct('-', 2) && fork.peek_punct('-', 3);
    if (!has_start) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnexpectedToken,
                                                   "expected comment start <!--", start));
        return std::nullopt;
    }
    for (int i = 0; i < 4; ++i) {
        fork.advance();
    }

    if (!fork.peek_string_literal()) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnexpectedToken,
                                                   "expected a string literal inside the comment",
                                                   fork.span()));
        return std::nullopt;
    }
    const TokenTree* literal = fork.advance();

    bool has_end = fork.peek_punct('-') && fork.peek_punct('-', 1) && fork.peek_punct('>', 2);
    if (!has_end) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnexpectedToken,
                                                   "expected comment end -->", fork.span()));
        return std::nullopt;
    }
    fork.advance();
    fork.advance();
    Span end = fork.span();
    fork.advance();

    cursor.advance_to(fork);
    return Node(NodeComment{literal->value, span_through(start, end)});
}

std::optional<Node> Grammar::parse_doctype(Cursor& cursor) {
    Cursor fork = cursor.fork();
    Span start = fork.span();

    if (!fork.peek_ident_named("doctype", 2, true)) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnexpectedToken,
                                                   "expected `doctype` after <!",
                                                   fork.peek(2) ? fork.peek(2)->span : start));
        return std::nullopt;
    }
    fork.advance();
    fork.advance();
    Span keyword = fork.span();
    fork.advance();

    Cursor value_start = fork.fork();
    while (!fork.is_empty() && !fork.peek_punct('>')) {
        fork.advance();
    }
    if (fork.is_empty()) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnexpectedEndOfInput,
                                                   "doctype is missing its closing >", start));
        return std::nullopt;
    }

    RawText value(value_start.tokens_until(fork));
    Span end = fork.span();
    fork.advance();
    value.set_tag_spans(keyword, end);

    cursor.advance_to(fork);
    return Node(NodeDoctype{std::move(value), span_through(start, end)});
}

std::optional<Node> Grammar::parse_text(Cursor& cursor) {
    const TokenTree* literal = cursor.advance();
    return Node(NodeText{literal->value, literal->span});
}

RawText Grammar::parse_raw_text(Cursor& cursor) {
    Cursor start = cursor.fork();
    while (!cursor.is_empty() && classify(cursor) == NodeStart::RawText) {
        cursor.advance();
    }
    return RawText(start.tokens_until(cursor));
}

RawText Grammar::parse_raw_text_body(Cursor& cursor) {
    Cursor start = cursor.fork();
    while (!cursor.is_empty() && !at_close_tag_start(cursor)) {
        cursor.advance();
    }
    return RawText(start.tokens_until(cursor));
}

// ============================================================================
// Block
// ============================================================================

std::optional<NodeBlock> Grammar::parse_block(Cursor& cursor) {
    const TokenTree* group = cursor.peek();
    if (!group || !group->is_group(Delimiter::Brace)) {
        m_context.push_diagnostic(Diagnostic::make(DiagnosticKind::UnexpectedToken,
                                                   "expected a braced block", cursor.span()));
        return std::nullopt;
    }

    Cursor content = Cursor::into_group(*group);
    std::optional<TokenStream> replacement;

    if (const auto& transform = m_context.config().block_transform) {
        Cursor hook_cursor = content.fork();
        auto transformed = transform(hook_cursor);
        if (transformed.is_err()) {
            Diagnostic diagnostic = std::move(transformed.error());
            diagnostic.kind = DiagnosticKind::InvalidTransform;
            return invalid_block(cursor, std::move(diagnostic));
        }
        if (transformed.value()) {
            if (!hook_cursor.is_empty()) {
                return invalid_block(cursor, Diagnostic::make(
                    DiagnosticKind::InvalidTransform,
                    "block transform returned tokens without consuming its whole input",
                    hook_cursor.span()));
            }
            replacement = std::move(*transformed.value());
            logger().trace_fmt("block transformed into `{}`", tokens::to_string(*replacement).view());
        }
    }

    Cursor input = replacement ? Cursor(*replacement, group->close_span) : content;
    auto parsed = m_context.expressions().parse_block(input);
    if (parsed.is_err()) {
        Diagnostic diagnostic = std::move(parsed.error());
        diagnostic.kind = DiagnosticKind::InvalidEmbeddedExpression;
        return invalid_block(cursor, std::move(diagnostic));
    }

    cursor.advance();
    return NodeBlock::valid(std::move(parsed.value()), group->span);
}

std::optional<NodeBlock> Grammar::invalid_block(Cursor& cursor, Diagnostic diagnostic) {
    if (!m_context.config().recover_invalid_blocks) {
        m_context.abort(std::move(diagnostic));
        return std::nullopt;
    }

    m_context.push_diagnostic(std::move(diagnostic));
    const TokenTree* group = cursor.advance();
    return NodeBlock::invalid(*group);
}

} // namespace weft::markup
