#include "folio/nodes/document.hpp"

namespace folio::nodes {

Document::Document(NodePtr root, DocumentMetadata metadata)
    : m_root(std::move(root)), m_metadata(std::move(metadata)) {
    if (m_root) {
        m_metadata.node_count = m_root->subtree_size();
        m_text = m_root->to_text();
    } else {
        m_metadata.node_count = 0;
    }
}

std::vector<const Node*> Document::find_all() const {
    return walk().to_vector();
}

std::vector<const Node*> Document::find_all(const NodeFilter& filter) const {
    return collect(m_root.get(), filter);
}

std::vector<std::vector<const Node*>> Document::find_all(std::initializer_list<NodeFilter> filters) const {
    return collect(m_root.get(), filters);
}

} // namespace folio::nodes
