#pragma once

#include "payloads.hpp"
#include <initializer_list>
#include <iterator>
#include <variant>
#include <vector>

namespace folio::nodes {

class Node;

using NodePtr = RefPtr<const Node>;
using NodeList = std::vector<NodePtr>;

// Variant order must match NodeKind order
using Payload = std::variant<
    Text, Image, Emoticon, Time, Placeholder,
    TextEffect, TextBreak,
    Heading, List, ListItem, DecisionList, DecisionListItem,
    Table, TableRow, TableCell,
    Layout, LayoutSection, LayoutCell,
    Link, ResourceIdentifier,
    PanelMacro, CodeMacro, StatusMacro, ExpandMacro, DetailsMacro, TocMacro,
    JiraMacro, IncludeMacro, ExcerptIncludeMacro, TasksReportMacro,
    AttachmentsMacro, ViewPdfMacro, ViewFileMacro, ProfileMacro, AnchorMacro,
    ExcerptMacro,
    Fragment, Container>;

static_assert(std::variant_size_v<Payload> == static_cast<usize>(NodeKind::Container) + 1);

// ============================================================================
// NodeFilter - a concrete kind or a capability category
// ============================================================================

enum class Category : u8 {
    Any,
    Macro,
    BlockLevel,
    Container,
};

class NodeFilter {
public:
    NodeFilter(NodeKind kind) : m_value(kind) {}
    NodeFilter(Category category) : m_value(category) {}

    [[nodiscard]] bool matches(const Node& node) const;

private:
    std::variant<NodeKind, Category> m_value;
};

// ============================================================================
// WalkRange - depth-first pre-order traversal of a subtree
// ============================================================================

class WalkIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = const Node*;
    using difference_type = std::ptrdiff_t;
    using pointer = const Node* const*;
    using reference = const Node*;

    WalkIterator() = default;
    explicit WalkIterator(const Node* root);

    reference operator*() const { return m_stack.back(); }
    WalkIterator& operator++();
    WalkIterator operator++(int);

    [[nodiscard]] bool operator==(const WalkIterator& other) const;
    [[nodiscard]] bool operator!=(const WalkIterator& other) const { return !(*this == other); }

private:
    // Nodes still to visit; the current node is on top
    std::vector<const Node*> m_stack;
};

// Lazy and restartable: every begin() starts a fresh traversal
class WalkRange {
public:
    explicit WalkRange(const Node* root) : m_root(root) {}

    [[nodiscard]] WalkIterator begin() const { return WalkIterator(m_root); }
    [[nodiscard]] WalkIterator end() const { return WalkIterator(); }

    [[nodiscard]] std::vector<const Node*> to_vector() const;

private:
    const Node* m_root;
};

// ============================================================================
// Node - immutable content tree node
// ============================================================================

class Node : public RefCounted {
public:
    Node(Payload payload, NodeList children);

    template<typename T>
    [[nodiscard]] static NodePtr create(T payload, NodeList children = {}) {
        return make_ref<Node>(Payload(std::move(payload)), std::move(children));
    }

    [[nodiscard]] NodeKind kind() const { return static_cast<NodeKind>(m_payload.index()); }
    [[nodiscard]] std::string_view kind_name() const { return node_kind_name(kind()); }
    [[nodiscard]] const Payload& payload() const { return m_payload; }

    // Typed access, nullptr on kind mismatch
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_payload); }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_payload); }

    [[nodiscard]] const NodeList& children() const { return m_children; }
    [[nodiscard]] bool has_children() const { return !m_children.empty(); }

    [[nodiscard]] bool is_block_level() const;
    [[nodiscard]] bool is_macro() const { return is_macro_kind(kind()); }
    [[nodiscard]] bool is_container() const;

    // Canonical plain text of this subtree, recomputed on every call
    [[nodiscard]] String to_text() const;

    [[nodiscard]] WalkRange walk() const { return WalkRange(this); }

    // Subtree queries in document order. The list overload returns one
    // bucket per filter; a node lands in every bucket whose filter it matches.
    [[nodiscard]] std::vector<const Node*> find_all() const;
    [[nodiscard]] std::vector<const Node*> find_all(const NodeFilter& filter) const;
    [[nodiscard]] std::vector<std::vector<const Node*>> find_all(
        std::initializer_list<NodeFilter> filters) const;

    // Number of nodes in this subtree, including this one
    [[nodiscard]] usize subtree_size() const;

private:
    Payload m_payload;
    NodeList m_children;
};

// ============================================================================
// Shared query helpers (also used by Document)
// ============================================================================

[[nodiscard]] std::vector<const Node*> collect(const Node* root, const NodeFilter& filter);
[[nodiscard]] std::vector<std::vector<const Node*>> collect(
    const Node* root, std::initializer_list<NodeFilter> filters);

} // namespace folio::nodes
