#pragma once

#include "weft/tokens/token.hpp"
#include <optional>

namespace weft::tokens {

// ============================================================================
// SourceTextProvider - optional access to the text behind spans
// ============================================================================

class SourceTextProvider {
public:
    virtual ~SourceTextProvider() = default;

    // Verbatim text covered by the span, if this provider knows the source
    [[nodiscard]] virtual std::optional<String> text_of(const Span& span) const = 0;

    // Span from the start of a to the end of b
    [[nodiscard]] virtual std::optional<Span> join(const Span& a, const Span& b) const = 0;
};

// ============================================================================
// SourceMap - provider backed by a single source buffer
// ============================================================================

class SourceMap : public SourceTextProvider {
public:
    explicit SourceMap(String source, u32 source_id = 1);

    [[nodiscard]] std::optional<String> text_of(const Span& span) const override;
    [[nodiscard]] std::optional<Span> join(const Span& a, const Span& b) const override;

    [[nodiscard]] const String& source() const { return m_source; }
    [[nodiscard]] u32 source_id() const { return m_source_id; }

private:
    [[nodiscard]] bool owns(const Span& span) const;

    String m_source;
    u32 m_source_id;
};

} // namespace weft::tokens
