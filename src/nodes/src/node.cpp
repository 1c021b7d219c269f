#include "folio/nodes/node.hpp"

namespace folio::nodes {

// ============================================================================
// NodeFilter
// ============================================================================

bool NodeFilter::matches(const Node& node) const {
    if (auto kind = std::get_if<NodeKind>(&m_value)) {
        return node.kind() == *kind;
    }
    switch (std::get<Category>(m_value)) {
        case Category::Any: return true;
        case Category::Macro: return node.is_macro();
        case Category::BlockLevel: return node.is_block_level();
        case Category::Container: return node.is_container();
    }
    return false;
}

// ============================================================================
// WalkIterator
// ============================================================================

WalkIterator::WalkIterator(const Node* root) {
    if (root) {
        m_stack.push_back(root);
    }
}

WalkIterator& WalkIterator::operator++() {
    const Node* current = m_stack.back();
    m_stack.pop_back();
    const auto& children = current->children();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        m_stack.push_back(it->get());
    }
    return *this;
}

WalkIterator WalkIterator::operator++(int) {
    WalkIterator previous = *this;
    ++(*this);
    return previous;
}

bool WalkIterator::operator==(const WalkIterator& other) const {
    if (m_stack.empty() || other.m_stack.empty()) {
        return m_stack.empty() == other.m_stack.empty();
    }
    return m_stack.size() == other.m_stack.size() && m_stack.back() == other.m_stack.back();
}

std::vector<const Node*> WalkRange::to_vector() const {
    std::vector<const Node*> nodes;
    for (const Node* node : *this) {
        nodes.push_back(node);
    }
    return nodes;
}

// ============================================================================
// Node
// ============================================================================

Node::Node(Payload payload, NodeList children)
    : m_payload(std::move(payload)), m_children(std::move(children)) {}

bool Node::is_block_level() const {
    switch (kind()) {
        case NodeKind::TextBreak:
            return std::get<TextBreak>(m_payload).kind != BreakKind::LineBreak;

        case NodeKind::Heading:
        case NodeKind::List:
        case NodeKind::ListItem:
        case NodeKind::DecisionList:
        case NodeKind::DecisionListItem:
        case NodeKind::Table:
        case NodeKind::TableRow:
        case NodeKind::TableCell:
        case NodeKind::Layout:
        case NodeKind::LayoutSection:
        case NodeKind::LayoutCell:
        case NodeKind::Fragment:
        case NodeKind::PanelMacro:
        case NodeKind::CodeMacro:
        case NodeKind::ExpandMacro:
        case NodeKind::DetailsMacro:
        case NodeKind::TocMacro:
        case NodeKind::IncludeMacro:
        case NodeKind::ExcerptIncludeMacro:
        case NodeKind::TasksReportMacro:
        case NodeKind::AttachmentsMacro:
        case NodeKind::ViewPdfMacro:
        case NodeKind::ViewFileMacro:
        case NodeKind::ProfileMacro:
        case NodeKind::ExcerptMacro:
            return true;

        default:
            return false;
    }
}

bool Node::is_container() const {
    if (auto text_break = std::get_if<TextBreak>(&m_payload)) {
        return text_break->kind == BreakKind::Paragraph;
    }
    return is_container_kind(kind());
}

std::vector<const Node*> Node::find_all() const {
    return walk().to_vector();
}

std::vector<const Node*> Node::find_all(const NodeFilter& filter) const {
    return collect(this, filter);
}

std::vector<std::vector<const Node*>> Node::find_all(std::initializer_list<NodeFilter> filters) const {
    return collect(this, filters);
}

usize Node::subtree_size() const {
    usize count = 0;
    for (auto it = walk().begin(), end = walk().end(); it != end; ++it) {
        ++count;
    }
    return count;
}

// ============================================================================
// Query helpers
// ============================================================================

std::vector<const Node*> collect(const Node* root, const NodeFilter& filter) {
    std::vector<const Node*> matches;
    for (const Node* node : WalkRange(root)) {
        if (filter.matches(*node)) {
            matches.push_back(node);
        }
    }
    return matches;
}

std::vector<std::vector<const Node*>> collect(const Node* root, std::initializer_list<NodeFilter> filters) {
    std::vector<std::vector<const Node*>> buckets(filters.size());
    for (const Node* node : WalkRange(root)) {
        usize index = 0;
        for (const auto& filter : filters) {
            if (filter.matches(*node)) {
                buckets[index].push_back(node);
            }
            ++index;
        }
    }
    return buckets;
}

} // namespace folio::nodes
