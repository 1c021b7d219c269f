#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include <optional>
#include <string_view>

namespace folio::nodes {

// ============================================================================
// NodeKind - one enumerator per payload type, in variant order
// ============================================================================

enum class NodeKind : u8 {
    // Leaf content
    Text,
    Image,
    Emoticon,
    Time,
    Placeholder,

    // Text formatting
    TextEffect,
    TextBreak,

    // Structure
    Heading,
    List,
    ListItem,
    DecisionList,
    DecisionListItem,

    // Tables
    Table,
    TableRow,
    TableCell,

    // Layout
    Layout,
    LayoutSection,
    LayoutCell,

    // Links and references
    Link,
    ResourceIdentifier,

    // Macros
    PanelMacro,
    CodeMacro,
    StatusMacro,
    ExpandMacro,
    DetailsMacro,
    TocMacro,
    JiraMacro,
    IncludeMacro,
    ExcerptIncludeMacro,
    TasksReportMacro,
    AttachmentsMacro,
    ViewPdfMacro,
    ViewFileMacro,
    ProfileMacro,
    AnchorMacro,
    ExcerptMacro,

    // Utility
    Fragment,
    Container,
};

[[nodiscard]] std::string_view node_kind_name(NodeKind kind);

// Macro kinds carry parameters extracted from a structured macro element
[[nodiscard]] bool is_macro_kind(NodeKind kind);

// Kinds whose text is the generic rendering of their children. Paragraph
// breaks qualify too but share TextBreak with leaf breaks; see Node::is_container.
[[nodiscard]] bool is_container_kind(NodeKind kind);

// ============================================================================
// Field enumerations
// ============================================================================

enum class TextEffectKind : u8 {
    Strong,
    Emphasis,
    Underline,
    Strikethrough,
    Monospace,
    Subscript,
    Superscript,
    Blockquote,
    Span,
};

enum class BreakKind : u8 {
    Paragraph,
    LineBreak,
    HorizontalRule,
};

enum class ListKind : u8 {
    Unordered,
    Ordered,
    Task,
};

enum class TaskStatus : u8 {
    Complete,
    Incomplete,
};

enum class DecisionState : u8 {
    Decided,
    Pending,
};

enum class LayoutSectionType : u8 {
    Single,
    FixedWidth,
    TwoEqual,
    TwoLeftSidebar,
    TwoRightSidebar,
    ThreeEqual,
    ThreeWithSidebars,
    ThreeLeftSidebars,
    ThreeRightSidebars,
    FourEqual,
    FiveEqual,
};

enum class LinkKind : u8 {
    External,
    Mailto,
    Space,
    Page,
    BlogPost,
    User,
    Attachment,
    Anchor,
};

enum class ResourceKind : u8 {
    Page,
    BlogPost,
    Attachment,
    Url,
    Shortcut,
    User,
    Space,
    ContentEntity,
};

enum class PanelKind : u8 {
    Panel,
    Note,
    Success,
    Warning,
    Error,
    Info,
};

[[nodiscard]] std::string_view text_effect_kind_name(TextEffectKind kind);
[[nodiscard]] std::string_view break_kind_name(BreakKind kind);
[[nodiscard]] std::string_view list_kind_name(ListKind kind);
[[nodiscard]] std::string_view task_status_name(TaskStatus status);
[[nodiscard]] std::string_view decision_state_name(DecisionState state);
[[nodiscard]] std::string_view layout_section_type_name(LayoutSectionType type);
[[nodiscard]] std::string_view link_kind_name(LinkKind kind);
[[nodiscard]] std::string_view resource_kind_name(ResourceKind kind);
[[nodiscard]] std::string_view panel_kind_name(PanelKind kind);

// Parsing is ASCII case-insensitive. Layout section types accept both '-'
// and '_' as word separators ("two-equal" == "two_equal").
[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view value);
[[nodiscard]] std::optional<DecisionState> parse_decision_state(std::string_view value);
[[nodiscard]] std::optional<LayoutSectionType> parse_layout_section_type(std::string_view value);

// Keyed on the local name of an ri: element ("page", "blog-post", ...)
[[nodiscard]] std::optional<ResourceKind> parse_resource_kind(std::string_view value);

} // namespace folio::nodes
