#pragma once

#include "kinds.hpp"
#include <optional>

namespace folio::nodes {

// Per-kind node data. Children live on the Node, not in the payload.
// Every payload names its discriminant as `node_kind`.

// ============================================================================
// Leaf content
// ============================================================================

struct Text {
    static constexpr NodeKind node_kind = NodeKind::Text;
    String text;
};

// Children are the caption
struct Image {
    static constexpr NodeKind node_kind = NodeKind::Image;
    std::optional<String> src;
    std::optional<String> filename;
    std::optional<String> alt;
    std::optional<String> title;
    std::optional<i32> width;
    std::optional<i32> height;
    std::optional<String> alignment;
    std::optional<String> layout;
    std::optional<i32> original_width;
    std::optional<i32> original_height;
};

struct Emoticon {
    static constexpr NodeKind node_kind = NodeKind::Emoticon;
    std::optional<String> name;
    std::optional<String> emoji_shortname;
    std::optional<String> emoji_id;
    std::optional<String> emoji_fallback;
};

struct Time {
    static constexpr NodeKind node_kind = NodeKind::Time;
    std::optional<String> datetime;
};

// Children are the placeholder text
struct Placeholder {
    static constexpr NodeKind node_kind = NodeKind::Placeholder;
    std::optional<String> placeholder_type;
};

// ============================================================================
// Text formatting
// ============================================================================

struct TextEffect {
    static constexpr NodeKind node_kind = NodeKind::TextEffect;
    TextEffectKind effect{TextEffectKind::Span};
    std::optional<String> style;
};

struct TextBreak {
    static constexpr NodeKind node_kind = NodeKind::TextBreak;
    BreakKind kind{BreakKind::Paragraph};
};

// ============================================================================
// Structure
// ============================================================================

struct Heading {
    static constexpr NodeKind node_kind = NodeKind::Heading;
    u8 level{1};
};

struct List {
    static constexpr NodeKind node_kind = NodeKind::List;
    ListKind kind{ListKind::Unordered};
    std::optional<i32> start;
    std::optional<String> local_id;
};

struct ListItem {
    static constexpr NodeKind node_kind = NodeKind::ListItem;
    std::optional<String> task_id;
    std::optional<String> task_uuid;
    std::optional<String> local_id;
    std::optional<TaskStatus> status;
};

struct DecisionList {
    static constexpr NodeKind node_kind = NodeKind::DecisionList;
    std::optional<String> local_id;
};

struct DecisionListItem {
    static constexpr NodeKind node_kind = NodeKind::DecisionListItem;
    std::optional<String> local_id;
    DecisionState state{DecisionState::Pending};
};

// ============================================================================
// Tables
// ============================================================================

struct Table {
    static constexpr NodeKind node_kind = NodeKind::Table;
    std::optional<String> width;
    std::optional<String> layout;
    std::optional<String> local_id;
    std::optional<String> display_mode;
};

struct TableRow {
    static constexpr NodeKind node_kind = NodeKind::TableRow;
};

struct TableCell {
    static constexpr NodeKind node_kind = NodeKind::TableCell;
    bool is_header{false};
    std::optional<i32> rowspan;
    std::optional<i32> colspan;
};

// ============================================================================
// Layout
// ============================================================================

struct Layout {
    static constexpr NodeKind node_kind = NodeKind::Layout;
};

struct LayoutSection {
    static constexpr NodeKind node_kind = NodeKind::LayoutSection;
    LayoutSectionType type{LayoutSectionType::Single};
    std::optional<String> breakout_mode;
    std::optional<String> breakout_width;
};

struct LayoutCell {
    static constexpr NodeKind node_kind = NodeKind::LayoutCell;
};

// ============================================================================
// Links and references
// ============================================================================

// Children are an optional ResourceIdentifier followed by the link body
struct Link {
    static constexpr NodeKind node_kind = NodeKind::Link;
    LinkKind kind{LinkKind::External};
    std::optional<String> href;
    std::optional<String> anchor;
    std::optional<String> card_appearance;
};

struct ResourceIdentifier {
    static constexpr NodeKind node_kind = NodeKind::ResourceIdentifier;
    ResourceKind kind{ResourceKind::Page};
    std::optional<String> content_title;
    std::optional<String> space_key;
    std::optional<i32> version_at_save;
    std::optional<String> posting_day;
    std::optional<String> filename;
    std::optional<String> content_id;
    std::optional<String> value;
    std::optional<String> account_id;
    std::optional<String> userkey;
    std::optional<String> local_id;
    std::optional<String> shortcut_key;
    std::optional<String> shortcut_parameter;

    // Stable URI for the referenced resource:
    //   user://<account>            page://<space>/<title>[@v<n>]
    //   blog://<space>/<title>@<day> space://<key>
    //   attach://<file>[@v<n>]       contentid://<id>
    //   shortcut://<key>/<param>     <url>
    // Empty when the fields identifying the target are missing.
    [[nodiscard]] std::optional<String> canonical_uri() const;
};

// ============================================================================
// Macros
// ============================================================================

struct PanelMacro {
    static constexpr NodeKind node_kind = NodeKind::PanelMacro;
    PanelKind kind{PanelKind::Panel};
    std::optional<String> title;
    std::optional<String> bg_color;
    std::optional<String> border_style;
    std::optional<String> border_color;
    std::optional<String> title_bg_color;
    std::optional<String> title_color;
    std::optional<String> panel_icon;
    std::optional<String> panel_icon_id;
    std::optional<String> panel_icon_text;
};

struct CodeMacro {
    static constexpr NodeKind node_kind = NodeKind::CodeMacro;
    std::optional<String> language;
    std::optional<String> title;
    std::optional<String> breakout_mode;
    std::optional<String> breakout_width;
    String code;
};

struct StatusMacro {
    static constexpr NodeKind node_kind = NodeKind::StatusMacro;
    std::optional<String> title;
    std::optional<String> colour;
    bool subtle{false};
};

struct ExpandMacro {
    static constexpr NodeKind node_kind = NodeKind::ExpandMacro;
    std::optional<String> title;
    std::optional<String> breakout_width;
};

struct DetailsMacro {
    static constexpr NodeKind node_kind = NodeKind::DetailsMacro;
    std::optional<String> id;
    bool hidden{false};
};

struct TocMacro {
    static constexpr NodeKind node_kind = NodeKind::TocMacro;
    std::optional<String> style;
    std::optional<i32> min_level;
    std::optional<i32> max_level;
    std::optional<bool> outline;
    std::optional<String> type;
    std::optional<bool> printable;
};

struct JiraMacro {
    static constexpr NodeKind node_kind = NodeKind::JiraMacro;
    std::optional<String> key;
    std::optional<String> server;
    std::optional<String> server_id;
    std::optional<String> jql_query;
};

struct IncludeMacro {
    static constexpr NodeKind node_kind = NodeKind::IncludeMacro;
    std::optional<String> content_title;
    std::optional<String> space_key;
};

struct ExcerptIncludeMacro {
    static constexpr NodeKind node_kind = NodeKind::ExcerptIncludeMacro;
    std::optional<String> content_title;
    std::optional<String> space_key;
    std::optional<String> posting_day;
    std::optional<String> excerpt_name;
    bool nopanel{false};
};

struct TasksReportMacro {
    static constexpr NodeKind node_kind = NodeKind::TasksReportMacro;
    std::optional<String> spaces;
    std::optional<String> labels;
    std::optional<String> status;
    std::optional<i32> page_size;
    bool is_missing_required_parameters{false};
};

struct AttachmentsMacro {
    static constexpr NodeKind node_kind = NodeKind::AttachmentsMacro;
    std::optional<String> patterns;
    std::optional<String> sort_by;
    std::optional<bool> upload;
};

struct ViewPdfMacro {
    static constexpr NodeKind node_kind = NodeKind::ViewPdfMacro;
    std::optional<String> filename;
    std::optional<i32> version_at_save;
};

struct ViewFileMacro {
    static constexpr NodeKind node_kind = NodeKind::ViewFileMacro;
    std::optional<String> filename;
    std::optional<i32> version_at_save;
    std::optional<String> height;
};

struct ProfileMacro {
    static constexpr NodeKind node_kind = NodeKind::ProfileMacro;
    std::optional<String> account_id;
};

struct AnchorMacro {
    static constexpr NodeKind node_kind = NodeKind::AnchorMacro;
    std::optional<String> anchor_name;
};

struct ExcerptMacro {
    static constexpr NodeKind node_kind = NodeKind::ExcerptMacro;
    std::optional<String> name;
    bool hidden{false};
};

// ============================================================================
// Utility
// ============================================================================

// Several top-level siblings
struct Fragment {
    static constexpr NodeKind node_kind = NodeKind::Fragment;
};

// Pass-through wrapper for transparent and unrecognized markup
struct Container {
    static constexpr NodeKind node_kind = NodeKind::Container;
    String tag;
};

} // namespace folio::nodes
