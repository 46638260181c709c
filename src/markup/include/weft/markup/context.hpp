#pragma once

#include "weft/core/types.hpp"
#include "weft/markup/config.hpp"
#include "weft/markup/diagnostic.hpp"
#include "weft/markup/expression.hpp"
#include "weft/markup/outcome.hpp"
#include <optional>
#include <vector>

namespace weft::markup {

// ============================================================================
// Context - state of one parse call
// ============================================================================

/**
 * Passed by reference to every grammar rule. Holds the configuration, the
 * host expression parser and the diagnostics recorded so far.
 *
 * Three ways to report a problem:
 *   push_diagnostic  record it and keep parsing
 *   halt             record it and stop every loop; the tree built so far is kept
 *   abort            record it and fail the whole parse
 *
 * In strict mode (config.strict_mode, or requested by the caller) the first
 * diagnostic of any kind aborts.
 */
class Context {
public:
    Context(const ParserConfig& config, const ExpressionParser& expressions, bool strict = false);

    [[nodiscard]] const ParserConfig& config() const { return m_config; }
    [[nodiscard]] const ExpressionParser& expressions() const { return m_expressions; }

    void push_diagnostic(Diagnostic diagnostic);
    void halt(Diagnostic diagnostic);
    void abort(Diagnostic diagnostic);

    // Value of the result, or nullopt after recording its error
    template<typename T>
    [[nodiscard]] std::optional<T> save(Result<T, Diagnostic> result) {
        if (result.is_ok()) {
            return std::move(result).value();
        }
        push_diagnostic(std::move(result).error());
        return std::nullopt;
    }

    // Loops stop when this turns true
    [[nodiscard]] bool should_stop() const { return m_halted || m_aborted; }
    [[nodiscard]] bool is_aborted() const { return m_aborted; }
    [[nodiscard]] bool is_strict() const { return m_strict; }

    // Nesting guard; enter_nested returns false once max_nesting_depth is reached
    [[nodiscard]] bool enter_nested(const tokens::Span& span);
    void leave_nested();
    [[nodiscard]] usize depth() const { return m_depth; }

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return m_diagnostics; }

    template<typename T>
    [[nodiscard]] ParseOutcome<T> into_outcome(std::optional<T> value) && {
        if (m_aborted) {
            value.reset();
        }
        return ParseOutcome<T>::from_parts(std::move(value), std::move(m_diagnostics));
    }

private:
    void record(Diagnostic diagnostic);

    const ParserConfig& m_config;
    const ExpressionParser& m_expressions;
    std::vector<Diagnostic> m_diagnostics;
    usize m_depth{0};
    bool m_strict;
    bool m_halted{false};
    bool m_aborted{false};
};

} // namespace weft::markup
