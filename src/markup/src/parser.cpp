#include "weft/markup/parser.hpp"
#include "weft/markup/context.hpp"
#include "weft/markup/grammar.hpp"
#include "weft/tokens/cursor.hpp"
#include "weft/core/logger.hpp"
#include <format>

namespace weft::markup {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("markup");
    return instance;
}

} // anonymous namespace

Parser::Parser(ParserConfig config)
    : m_config(std::move(config)) {}

Parser::Parser(ParserConfig config, std::shared_ptr<const ExpressionParser> expressions)
    : m_config(std::move(config))
    , m_expressions(std::move(expressions)) {}

const ExpressionParser& Parser::expressions() const {
    if (m_expressions) {
        return *m_expressions;
    }
    return default_expression_parser();
}

ParseOutcome<std::vector<Node>> Parser::parse_recoverable(const tokens::TokenStream& tokens) const {
    return run(tokens, false);
}

Result<std::vector<Node>, Diagnostic> Parser::parse_strict(const tokens::TokenStream& tokens) const {
    return run(tokens, true).into_result();
}

ParseOutcome<std::vector<Node>> Parser::run(const tokens::TokenStream& tokens, bool strict) const {
    logger().debug_fmt("parsing {} tokens{}", tokens.size(), strict || m_config.strict_mode ? " (strict)" : "");

    Context context(m_config, expressions(), strict);
    Grammar grammar(context);

    tokens::Cursor cursor(tokens);
    std::vector<Node> nodes = grammar.parse_nodes(cursor);

    if (!context.is_aborted()) {
        if (m_config.required_top_level_kind) {
            NodeType required = *m_config.required_top_level_kind;
            for (const auto& node : nodes) {
                if (node.type() != required) {
                    context.push_diagnostic(Diagnostic::make(
                        DiagnosticKind::TopLevelKindViolation,
                        String(std::format("top level nodes need to be of type {}",
                                           node_type_name(required))),
                        node.span()));
                }
            }
        }

        if (m_config.required_top_level_count && nodes.size() != *m_config.required_top_level_count) {
            context.push_diagnostic(Diagnostic::make(
                DiagnosticKind::TopLevelCardinalityViolation,
                String(std::format("saw {} top level nodes but exactly {} are required",
                                   nodes.size(), *m_config.required_top_level_count)),
                cursor.span()));
        }
    }

    if (m_config.flatten_tree) {
        std::vector<Node> flat;
        for (auto& node : nodes) {
            for (auto& entry : std::move(node).flatten()) {
                flat.push_back(std::move(entry));
            }
        }
        nodes = std::move(flat);
    }

    logger().debug_fmt("parsed {} nodes with {} diagnostics", nodes.size(), context.diagnostics().size());

    std::optional<std::vector<Node>> value;
    if (!nodes.empty()) {
        value = std::move(nodes);
    }
    return std::move(context).into_outcome(std::move(value));
}

// ============================================================================
// Free functions
// ============================================================================

ParseOutcome<std::vector<Node>> parse_recoverable(const tokens::TokenStream& tokens,
                                                  const ParserConfig& config) {
    return Parser(config).parse_recoverable(tokens);
}

Result<std::vector<Node>, Diagnostic> parse_strict(const tokens::TokenStream& tokens,
                                                   const ParserConfig& config) {
    return Parser(config).parse_strict(tokens);
}

} // namespace weft::markup
