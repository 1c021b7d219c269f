#pragma once

#include "node.hpp"

namespace folio::nodes {

// ============================================================================
// Text rendering
// ============================================================================
//
// Generic container policy: consecutive inline children form a run whose
// texts are concatenated and then trimmed; each block-level child is a piece
// of its own. Non-empty runs and pieces are joined with a blank line.
// Lists, tables, links, decision lists and macros override the policy.

[[nodiscard]] String render_text(const Node& node);

// Generic container policy over an arbitrary child list
[[nodiscard]] String render_children(const NodeList& children);

// Collapses every whitespace run containing a line break into one space and
// trims the result
[[nodiscard]] String flatten_text(std::string_view text);

} // namespace folio::nodes
