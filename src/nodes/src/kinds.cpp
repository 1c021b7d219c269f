#include "folio/nodes/kinds.hpp"
#include <array>
#include <utility>

namespace folio::nodes {

namespace {

String normalize(std::string_view value, bool unify_separators) {
    String result = String(value).trim().to_lowercase();
    if (unify_separators) {
        for (auto& c : result) {
            if (c == '-') {
                c = '_';
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// NodeKind
// ============================================================================

std::string_view node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Text: return "Text";
        case NodeKind::Image: return "Image";
        case NodeKind::Emoticon: return "Emoticon";
        case NodeKind::Time: return "Time";
        case NodeKind::Placeholder: return "Placeholder";
        case NodeKind::TextEffect: return "TextEffect";
        case NodeKind::TextBreak: return "TextBreak";
        case NodeKind::Heading: return "Heading";
        case NodeKind::List: return "List";
        case NodeKind::ListItem: return "ListItem";
        case NodeKind::DecisionList: return "DecisionList";
        case NodeKind::DecisionListItem: return "DecisionListItem";
        case NodeKind::Table: return "Table";
        case NodeKind::TableRow: return "TableRow";
        case NodeKind::TableCell: return "TableCell";
        case NodeKind::Layout: return "Layout";
        case NodeKind::LayoutSection: return "LayoutSection";
        case NodeKind::LayoutCell: return "LayoutCell";
        case NodeKind::Link: return "Link";
        case NodeKind::ResourceIdentifier: return "ResourceIdentifier";
        case NodeKind::PanelMacro: return "PanelMacro";
        case NodeKind::CodeMacro: return "CodeMacro";
        case NodeKind::StatusMacro: return "StatusMacro";
        case NodeKind::ExpandMacro: return "ExpandMacro";
        case NodeKind::DetailsMacro: return "DetailsMacro";
        case NodeKind::TocMacro: return "TocMacro";
        case NodeKind::JiraMacro: return "JiraMacro";
        case NodeKind::IncludeMacro: return "IncludeMacro";
        case NodeKind::ExcerptIncludeMacro: return "ExcerptIncludeMacro";
        case NodeKind::TasksReportMacro: return "TasksReportMacro";
        case NodeKind::AttachmentsMacro: return "AttachmentsMacro";
        case NodeKind::ViewPdfMacro: return "ViewPdfMacro";
        case NodeKind::ViewFileMacro: return "ViewFileMacro";
        case NodeKind::ProfileMacro: return "ProfileMacro";
        case NodeKind::AnchorMacro: return "AnchorMacro";
        case NodeKind::ExcerptMacro: return "ExcerptMacro";
        case NodeKind::Fragment: return "Fragment";
        case NodeKind::Container: return "Container";
    }
    return "Unknown";
}

bool is_macro_kind(NodeKind kind) {
    return kind >= NodeKind::PanelMacro && kind <= NodeKind::ExcerptMacro;
}

bool is_container_kind(NodeKind kind) {
    switch (kind) {
        case NodeKind::TextEffect:
        case NodeKind::Heading:
        case NodeKind::ListItem:
        case NodeKind::TableCell:
        case NodeKind::Layout:
        case NodeKind::LayoutSection:
        case NodeKind::LayoutCell:
        case NodeKind::ExpandMacro:
        case NodeKind::DetailsMacro:
        case NodeKind::Fragment:
        case NodeKind::Container:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// Field enumerations
// ============================================================================

std::string_view text_effect_kind_name(TextEffectKind kind) {
    switch (kind) {
        case TextEffectKind::Strong: return "strong";
        case TextEffectKind::Emphasis: return "emphasis";
        case TextEffectKind::Underline: return "underline";
        case TextEffectKind::Strikethrough: return "strikethrough";
        case TextEffectKind::Monospace: return "monospace";
        case TextEffectKind::Subscript: return "subscript";
        case TextEffectKind::Superscript: return "superscript";
        case TextEffectKind::Blockquote: return "blockquote";
        case TextEffectKind::Span: return "span";
    }
    return "unknown";
}

std::string_view break_kind_name(BreakKind kind) {
    switch (kind) {
        case BreakKind::Paragraph: return "paragraph";
        case BreakKind::LineBreak: return "line-break";
        case BreakKind::HorizontalRule: return "horizontal-rule";
    }
    return "unknown";
}

std::string_view list_kind_name(ListKind kind) {
    switch (kind) {
        case ListKind::Unordered: return "unordered";
        case ListKind::Ordered: return "ordered";
        case ListKind::Task: return "task";
    }
    return "unknown";
}

std::string_view task_status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Complete: return "complete";
        case TaskStatus::Incomplete: return "incomplete";
    }
    return "unknown";
}

std::string_view decision_state_name(DecisionState state) {
    switch (state) {
        case DecisionState::Decided: return "decided";
        case DecisionState::Pending: return "pending";
    }
    return "unknown";
}

std::string_view layout_section_type_name(LayoutSectionType type) {
    switch (type) {
        case LayoutSectionType::Single: return "single";
        case LayoutSectionType::FixedWidth: return "fixed-width";
        case LayoutSectionType::TwoEqual: return "two_equal";
        case LayoutSectionType::TwoLeftSidebar: return "two_left_sidebar";
        case LayoutSectionType::TwoRightSidebar: return "two_right_sidebar";
        case LayoutSectionType::ThreeEqual: return "three_equal";
        case LayoutSectionType::ThreeWithSidebars: return "three_with_sidebars";
        case LayoutSectionType::ThreeLeftSidebars: return "three_left_sidebars";
        case LayoutSectionType::ThreeRightSidebars: return "three_right_sidebars";
        case LayoutSectionType::FourEqual: return "four_equal";
        case LayoutSectionType::FiveEqual: return "five_equal";
    }
    return "unknown";
}

std::string_view link_kind_name(LinkKind kind) {
    switch (kind) {
        case LinkKind::External: return "external";
        case LinkKind::Mailto: return "mailto";
        case LinkKind::Space: return "space";
        case LinkKind::Page: return "page";
        case LinkKind::BlogPost: return "blog-post";
        case LinkKind::User: return "user";
        case LinkKind::Attachment: return "attachment";
        case LinkKind::Anchor: return "anchor";
    }
    return "unknown";
}

std::string_view resource_kind_name(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Page: return "page";
        case ResourceKind::BlogPost: return "blog-post";
        case ResourceKind::Attachment: return "attachment";
        case ResourceKind::Url: return "url";
        case ResourceKind::Shortcut: return "shortcut";
        case ResourceKind::User: return "user";
        case ResourceKind::Space: return "space";
        case ResourceKind::ContentEntity: return "content-entity";
    }
    return "unknown";
}

std::string_view panel_kind_name(PanelKind kind) {
    switch (kind) {
        case PanelKind::Panel: return "panel";
        case PanelKind::Note: return "note";
        case PanelKind::Success: return "success";
        case PanelKind::Warning: return "warning";
        case PanelKind::Error: return "error";
        case PanelKind::Info: return "info";
    }
    return "unknown";
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<TaskStatus> parse_task_status(std::string_view value) {
    auto name = normalize(value, false);
    if (name == "complete"_s) {
        return TaskStatus::Complete;
    }
    if (name == "incomplete"_s) {
        return TaskStatus::Incomplete;
    }
    return std::nullopt;
}

std::optional<DecisionState> parse_decision_state(std::string_view value) {
    auto name = normalize(value, false);
    if (name == "decided"_s) {
        return DecisionState::Decided;
    }
    if (name == "pending"_s) {
        return DecisionState::Pending;
    }
    return std::nullopt;
}

std::optional<LayoutSectionType> parse_layout_section_type(std::string_view value) {
    static constexpr std::array<std::pair<std::string_view, LayoutSectionType>, 11> TYPES = {{
        {"single", LayoutSectionType::Single},
        {"fixed_width", LayoutSectionType::FixedWidth},
        {"two_equal", LayoutSectionType::TwoEqual},
        {"two_left_sidebar", LayoutSectionType::TwoLeftSidebar},
        {"two_right_sidebar", LayoutSectionType::TwoRightSidebar},
        {"three_equal", LayoutSectionType::ThreeEqual},
        {"three_with_sidebars", LayoutSectionType::ThreeWithSidebars},
        {"three_left_sidebars", LayoutSectionType::ThreeLeftSidebars},
        {"three_right_sidebars", LayoutSectionType::ThreeRightSidebars},
        {"four_equal", LayoutSectionType::FourEqual},
        {"five_equal", LayoutSectionType::FiveEqual},
    }};

    auto name = normalize(value, true);
    for (const auto& [candidate, type] : TYPES) {
        if (name.view() == candidate) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<ResourceKind> parse_resource_kind(std::string_view value) {
    static constexpr std::array<std::pair<std::string_view, ResourceKind>, 8> KINDS = {{
        {"page", ResourceKind::Page},
        {"blog-post", ResourceKind::BlogPost},
        {"attachment", ResourceKind::Attachment},
        {"url", ResourceKind::Url},
        {"shortcut", ResourceKind::Shortcut},
        {"user", ResourceKind::User},
        {"space", ResourceKind::Space},
        {"content-entity", ResourceKind::ContentEntity},
    }};

    auto name = normalize(value, false);
    for (const auto& [candidate, kind] : KINDS) {
        if (name.view() == candidate) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace folio::nodes
