#pragma once

#include "weft/core/types.hpp"
#include "weft/core/string.hpp"
#include "weft/tokens/cursor.hpp"
#include "weft/markup/diagnostic.hpp"
#include "weft/markup/node.hpp"
#include <functional>
#include <optional>
#include <set>
#include <vector>

namespace weft::markup {

// ============================================================================
// Block transform hook
// ============================================================================

/**
 * Called with a cursor over the contents of every braced block before it is
 * handed to the expression parser. Returning std::nullopt parses the block
 * unchanged; returning tokens parses those instead, in which case the hook
 * must have consumed all of its input. An error is reported as an
 * InvalidTransform diagnostic.
 */
using BlockTransform =
    std::function<Result<std::optional<tokens::TokenStream>, Diagnostic>(tokens::Cursor&)>;

// ============================================================================
// ParserConfig
// ============================================================================

struct ParserConfig {
    // Return every node as a top-level entry, in pre-order
    bool flatten_tree{false};

    std::optional<usize> required_top_level_count;
    std::optional<NodeType> required_top_level_kind;

    // Elements that never have children, written with or without "/>"
    std::set<String> self_closing_names;

    // Elements whose content is taken verbatim as one RawText child
    std::set<String> raw_text_names;

    // Keep blocks that fail to parse as Invalid nodes instead of failing
    bool recover_invalid_blocks{false};

    // Stop at the first diagnostic
    bool strict_mode{false};

    BlockTransform block_transform;

    std::vector<char> punctuated_name_separators{'-', ':'};

    usize max_nesting_depth{128};

    // Skip a markup construct that fails to parse through its closing '>'
    // instead of halting the parse
    bool skip_malformed_markup{true};

    [[nodiscard]] bool is_self_closing(const String& name) const {
        return self_closing_names.count(name) > 0;
    }

    [[nodiscard]] bool is_raw_text(const String& name) const {
        return raw_text_names.count(name) > 0;
    }

    [[nodiscard]] bool is_name_separator(char c) const;
};

} // namespace weft::markup
