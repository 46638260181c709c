#include "weft/markup/config.hpp"
#include <algorithm>

namespace weft::markup {

bool ParserConfig::is_name_separator(char c) const {
    return std::find(punctuated_name_separators.begin(), punctuated_name_separators.end(), c) !=
           punctuated_name_separators.end();
}

} // namespace weft::markup
