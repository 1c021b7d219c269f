#pragma once

#include "node.hpp"
#include <vector>

namespace folio::nodes {

// ============================================================================
// DocumentMetadata
// ============================================================================

struct DocumentMetadata {
    // Degradations recorded while building nodes, in order of first encounter
    std::vector<String> diagnostics;
    // Repairs the markup tokenizer applied (unclosed elements, stray end tags, ...)
    std::vector<String> recoveries;
    usize node_count{0};
};

// ============================================================================
// Document - immutable result of one parse
// ============================================================================

class Document {
public:
    Document() = default;
    Document(NodePtr root, DocumentMetadata metadata);

    // nullptr for empty input
    [[nodiscard]] const Node* root() const { return m_root.get(); }
    [[nodiscard]] bool empty() const { return !m_root; }

    [[nodiscard]] const DocumentMetadata& metadata() const { return m_metadata; }
    [[nodiscard]] const std::vector<String>& diagnostics() const { return m_metadata.diagnostics; }

    // Text of the root, computed once at construction
    [[nodiscard]] const String& text() const { return m_text; }

    [[nodiscard]] WalkRange walk() const { return WalkRange(m_root.get()); }

    [[nodiscard]] std::vector<const Node*> find_all() const;
    [[nodiscard]] std::vector<const Node*> find_all(const NodeFilter& filter) const;
    [[nodiscard]] std::vector<std::vector<const Node*>> find_all(
        std::initializer_list<NodeFilter> filters) const;

private:
    NodePtr m_root;
    DocumentMetadata m_metadata;
    String m_text;
};

} // namespace folio::nodes
