#pragma once

#include "weft/core/types.hpp"
#include "weft/markup/diagnostic.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace weft::markup {

// ============================================================================
// ParseOutcome - value, diagnostics, or both
// ============================================================================

enum class OutcomeStatus : u8 {
    Ok,       // value without diagnostics
    Partial,  // best-effort value plus diagnostics
    Failed    // diagnostics only
};

template<typename T>
class ParseOutcome {
public:
    [[nodiscard]] static ParseOutcome from_parts(std::optional<T> value,
                                                 std::vector<Diagnostic> diagnostics) {
        ParseOutcome outcome;
        if (value) {
            outcome.m_status = diagnostics.empty() ? OutcomeStatus::Ok : OutcomeStatus::Partial;
        } else {
            outcome.m_status = OutcomeStatus::Failed;
        }
        outcome.m_value = std::move(value);
        outcome.m_diagnostics = std::move(diagnostics);
        return outcome;
    }

    [[nodiscard]] OutcomeStatus status() const { return m_status; }
    [[nodiscard]] bool is_ok() const { return m_status == OutcomeStatus::Ok; }
    [[nodiscard]] bool is_partial() const { return m_status == OutcomeStatus::Partial; }
    [[nodiscard]] bool is_failed() const { return m_status == OutcomeStatus::Failed; }

    [[nodiscard]] const std::optional<T>& value() const { return m_value; }
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return m_diagnostics; }

    // Value only when there were no diagnostics, otherwise the first one
    [[nodiscard]] Result<T, Diagnostic> into_result() && {
        if (m_status == OutcomeStatus::Ok) {
            return std::move(*m_value);
        }
        if (m_diagnostics.empty()) {
            return make_error(Diagnostic::make(DiagnosticKind::UnexpectedEndOfInput,
                                               "parsing failed, but no diagnostic was recorded", {}));
        }
        return make_error(std::move(m_diagnostics.front()));
    }

    [[nodiscard]] std::pair<std::optional<T>, std::vector<Diagnostic>> split() && {
        return {std::move(m_value), std::move(m_diagnostics)};
    }

private:
    ParseOutcome() = default;

    OutcomeStatus m_status{OutcomeStatus::Failed};
    std::optional<T> m_value;
    std::vector<Diagnostic> m_diagnostics;
};

} // namespace weft::markup
