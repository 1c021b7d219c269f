#pragma once

#include "element.hpp"
#include "tree_builder.hpp"
#include <vector>

namespace folio::markup {

struct ForestOptions {
    usize max_depth{512};
};

struct ParsedForest {
    Forest elements;
    // Repairs applied to irregular markup, in input order
    std::vector<String> recoveries;
};

// Tokenizes UTF-8 storage-format markup into a forest of generic elements.
// Fails only for input that is not text at all (malformed UTF-8, NUL
// characters) or that nests deeper than options.max_depth.
[[nodiscard]] Result<ParsedForest, MarkupError> parse_forest(
    std::string_view input, const ForestOptions& options = {});

} // namespace folio::markup
