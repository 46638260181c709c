#include "weft/markup/context.hpp"
#include "weft/core/logger.hpp"
#include <format>

namespace weft::markup {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("markup");
    return instance;
}

} // anonymous namespace

Context::Context(const ParserConfig& config, const ExpressionParser& expressions, bool strict)
    : m_config(config)
    , m_expressions(expressions)
    , m_strict(strict || config.strict_mode) {}

void Context::record(Diagnostic diagnostic) {
    logger().debug_fmt("diagnostic {} at {}:{}: {}",
                       diagnostic_kind_name(diagnostic.kind),
                       diagnostic.primary_span.line,
                       diagnostic.primary_span.column,
                       diagnostic.message.view());

    // Once a strict parse has failed nothing else is recorded
    if (m_strict && !m_diagnostics.empty()) {
        return;
    }
    m_diagnostics.push_back(std::move(diagnostic));
    if (m_strict) {
        m_aborted = true;
    }
}

void Context::push_diagnostic(Diagnostic diagnostic) {
    record(std::move(diagnostic));
}

void Context::halt(Diagnostic diagnostic) {
    record(std::move(diagnostic));
    m_halted = true;
}

void Context::abort(Diagnostic diagnostic) {
    record(std::move(diagnostic));
    m_aborted = true;
}

bool Context::enter_nested(const tokens::Span& span) {
    if (m_depth >= m_config.max_nesting_depth) {
        halt(Diagnostic::make(DiagnosticKind::NestingTooDeep,
                              String(std::format("markup nested deeper than {} levels",
                                                 m_config.max_nesting_depth)),
                              span));
        return false;
    }
    ++m_depth;
    return true;
}

void Context::leave_nested() {
    if (m_depth > 0) {
        --m_depth;
    }
}

} // namespace weft::markup
