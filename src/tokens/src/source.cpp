#include "weft/tokens/source.hpp"

namespace weft::tokens {

SourceMap::SourceMap(String source, u32 source_id)
    : m_source(std::move(source))
    , m_source_id(source_id) {}

bool SourceMap::owns(const Span& span) const {
    return !span.is_synthetic() && span.source_id == m_source_id &&
           span.start <= span.end && span.end <= m_source.size();
}

std::optional<String> SourceMap::text_of(const Span& span) const {
    if (!owns(span)) {
        return std::nullopt;
    }
    return m_source.substring(span.start, span.end - span.start);
}

std::optional<Span> SourceMap::join(const Span& a, const Span& b) const {
    if (!owns(a) || !owns(b) || b.end < a.start) {
        return std::nullopt;
    }
    Span joined = a;
    joined.end = b.end;
    return joined;
}

} // namespace weft::tokens
