#pragma once

#include "weft/core/types.hpp"
#include "weft/tokens/token.hpp"
#include "weft/markup/config.hpp"
#include "weft/markup/diagnostic.hpp"
#include "weft/markup/expression.hpp"
#include "weft/markup/node.hpp"
#include "weft/markup/outcome.hpp"
#include <memory>
#include <vector>

namespace weft::markup {

// ============================================================================
// Parser - markup parsing entry points
// ============================================================================

class Parser {
public:
    explicit Parser(ParserConfig config = {});
    Parser(ParserConfig config, std::shared_ptr<const ExpressionParser> expressions);

    // Best-effort tree plus every diagnostic recorded on the way
    [[nodiscard]] ParseOutcome<std::vector<Node>> parse_recoverable(const tokens::TokenStream& tokens) const;

    // Nodes, or the first diagnostic
    [[nodiscard]] Result<std::vector<Node>, Diagnostic> parse_strict(const tokens::TokenStream& tokens) const;

    [[nodiscard]] const ParserConfig& config() const { return m_config; }
    void set_config(ParserConfig config) { m_config = std::move(config); }

private:
    [[nodiscard]] ParseOutcome<std::vector<Node>> run(const tokens::TokenStream& tokens, bool strict) const;
    [[nodiscard]] const ExpressionParser& expressions() const;

    ParserConfig m_config;
    std::shared_ptr<const ExpressionParser> m_expressions;
};

// Same as Parser(config) with the built-in expression grammar
[[nodiscard]] ParseOutcome<std::vector<Node>> parse_recoverable(const tokens::TokenStream& tokens,
                                                                const ParserConfig& config = {});
[[nodiscard]] Result<std::vector<Node>, Diagnostic> parse_strict(const tokens::TokenStream& tokens,
                                                                 const ParserConfig& config = {});

} // namespace weft::markup
