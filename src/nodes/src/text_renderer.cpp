/**
 * Canonical plain-text rendering of content nodes
 */

#include "folio/nodes/text_renderer.hpp"
#include <vector>

namespace folio::nodes {

namespace {

bool present(const std::optional<String>& value) {
    return value.has_value() && !value->empty();
}

String join(const std::vector<String>& parts, std::string_view separator) {
    StringBuilder builder;
    for (usize i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            builder.append(separator);
        }
        builder.append(parts[i]);
    }
    return builder.build();
}

// Label followed by the text, or the bare label when the text is empty
String labelled(std::string_view label, const String& text) {
    StringBuilder builder;
    builder.append(label);
    if (!text.empty()) {
        builder.append(": ");
        builder.append(text);
    }
    return builder.build();
}

String labelled(std::string_view label, const std::optional<String>& text) {
    return labelled(label, present(text) ? *text : String());
}

// Prefixes every non-empty line after the first with `indent`
String indent_continuation(const String& text, std::string_view indent) {
    auto lines = text.split('\n');
    StringBuilder builder;
    for (usize i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            builder.append('\n');
            if (!lines[i].empty()) {
                builder.append(indent);
            }
        }
        builder.append(lines[i]);
    }
    return builder.build();
}

// Drops blank lines so block content inside a list item stays tight
String without_blank_lines(const String& text) {
    std::vector<String> lines;
    for (auto& line : text.split('\n')) {
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }
    return join(lines, "\n");
}

std::string_view panel_label(PanelKind kind) {
    switch (kind) {
        case PanelKind::Info: return "ℹ️ INFO";
        case PanelKind::Note: return "📝 NOTE";
        case PanelKind::Success: return "✅ SUCCESS";
        case PanelKind::Warning: return "⚠️ WARNING";
        case PanelKind::Error: return "❌ ERROR";
        case PanelKind::Panel: return "📋 PANEL";
    }
    return "📋 PANEL";
}

// ============================================================================
// Per-kind rendering
// ============================================================================

class TextVisitor {
public:
    explicit TextVisitor(const Node& node) : m_node(node) {}

    String operator()(const Text& text) const { return text.text; }

    String operator()(const Image& image) const {
        String label = "🖼️ Image: "_s;
        if (present(image.alt)) {
            label += *image.alt;
        } else if (present(image.filename)) {
            label += *image.filename;
        } else if (present(image.src)) {
            label += *image.src;
        } else {
            label += "Unknown"_s;
        }
        auto caption = flatten_text(body().view());
        if (!caption.empty()) {
            label += " - "_s;
            label += caption;
        }
        return label;
    }

    String operator()(const Emoticon& emoticon) const {
        if (present(emoticon.emoji_fallback)) {
            return *emoticon.emoji_fallback;
        }
        if (present(emoticon.emoji_shortname)) {
            return *emoticon.emoji_shortname;
        }
        if (present(emoticon.name)) {
            return ":"_s + *emoticon.name + ":"_s;
        }
        return String();
    }

    String operator()(const Time& time) const {
        if (present(time.datetime)) {
            return "📅 "_s + *time.datetime;
        }
        return "📅 Date"_s;
    }

    String operator()(const Placeholder&) const {
        return labelled("📝 Placeholder", flatten_text(body().view()));
    }

    String operator()(const TextEffect&) const { return body(); }

    String operator()(const TextBreak& text_break) const {
        switch (text_break.kind) {
            case BreakKind::LineBreak: return "\n"_s;
            case BreakKind::HorizontalRule: return String();
            case BreakKind::Paragraph: break;
        }
        return body();
    }

    String operator()(const Heading&) const { return body(); }

    String operator()(const List& list) const {
        std::vector<String> lines;
        i64 number = list.start.value_or(1);

        for (const auto& child : m_node.children()) {
            if (auto item = child->as<ListItem>()) {
                auto prefix = item_prefix(list, *item, number);
                auto text = without_blank_lines(child->to_text());
                if (text.empty()) {
                    lines.push_back(prefix.trim_end());
                } else {
                    lines.push_back(prefix + indent_continuation(text, "  "));
                }
                continue;
            }

            auto text = child->to_text();
            if (text.empty()) {
                continue;
            }
            if (child->is<List>()) {
                lines.push_back("  "_s + indent_continuation(text, "  "));
            } else {
                lines.push_back(text);
            }
        }
        return join(lines, "\n");
    }

    String operator()(const ListItem&) const { return body(); }

    String operator()(const DecisionList&) const {
        std::vector<String> items;
        for (const auto& child : m_node.children()) {
            auto text = child->to_text();
            if (!text.empty()) {
                items.push_back(std::move(text));
            }
        }
        if (items.empty()) {
            return "📋 Decision List"_s;
        }
        return join(items, "\n");
    }

    String operator()(const DecisionListItem& item) const {
        String marker = item.state == DecisionState::Decided ? "✅"_s : "⏳"_s;
        auto text = body();
        if (text.empty()) {
            return marker;
        }
        return marker + " "_s + text;
    }

    String operator()(const Table&) const { return joined_lines(); }

    String operator()(const TableRow&) const {
        std::vector<String> cells;
        for (const auto& child : m_node.children()) {
            cells.push_back(flatten_text(child->to_text().view()));
        }
        return join(cells, " | ");
    }

    String operator()(const TableCell&) const { return body(); }
    String operator()(const Layout&) const { return body(); }
    String operator()(const LayoutSection&) const { return body(); }
    String operator()(const LayoutCell&) const { return body(); }

    String operator()(const Link& link) const {
        std::vector<String> parts;
        NodeList content;
        for (const auto& child : m_node.children()) {
            if (child->is<ResourceIdentifier>()) {
                auto text = child->to_text();
                if (!text.empty()) {
                    parts.push_back(std::move(text));
                }
            } else {
                content.push_back(child);
            }
        }

        auto text = render_children(content);
        if (!text.is_blank()) {
            parts.push_back(std::move(text));
        }

        if (!parts.empty()) {
            return join(parts, " ");
        }
        if (present(link.href)) {
            return *link.href;
        }
        return String();
    }

    String operator()(const ResourceIdentifier& resource) const {
        switch (resource.kind) {
            case ResourceKind::Page:
                return "📄 Page"_s;
            case ResourceKind::BlogPost:
                return labelled("📝 Blog", resource.posting_day);
            case ResourceKind::Attachment:
                return labelled("📎 Attachment", resource.filename);
            case ResourceKind::Url:
                return labelled("🔗 URL", resource.value);
            case ResourceKind::User:
                return labelled("👤 User", present(resource.account_id) ? resource.account_id : resource.userkey);
            case ResourceKind::Space:
                return labelled("🏠 Space", resource.space_key);
            case ResourceKind::Shortcut:
                if (present(resource.shortcut_key) && present(resource.shortcut_parameter)) {
                    return "🔗 Shortcut: "_s + *resource.shortcut_key + "@"_s + *resource.shortcut_parameter;
                }
                return "🔗 Shortcut"_s;
            case ResourceKind::ContentEntity:
                return labelled("📄 Content", resource.content_id);
        }
        return String();
    }

    String operator()(const PanelMacro& panel) const {
        auto text = flatten_text(body().view());
        if (panel.kind == PanelKind::Panel && present(panel.panel_icon_text)) {
            if (text.empty()) {
                return *panel.panel_icon_text;
            }
            return *panel.panel_icon_text + " "_s + text;
        }
        return labelled(panel_label(panel.kind), text);
    }

    String operator()(const CodeMacro& code) const { return code.code; }

    String operator()(const StatusMacro& status) const {
        StringBuilder builder;
        builder.append("🏷️ Status: ");
        builder.append(present(status.title) ? *status.title : "Status"_s);
        if (present(status.colour)) {
            builder.append_format(" ({})", *status.colour);
        }
        return builder.build();
    }

    String operator()(const ExpandMacro&) const { return body(); }
    String operator()(const DetailsMacro&) const { return body(); }

    String operator()(const TocMacro&) const { return "📑 Table of Contents"_s; }

    String operator()(const JiraMacro& jira) const {
        if (!present(jira.key)) {
            return "🎫 JIRA Issue"_s;
        }
        StringBuilder builder;
        builder.append("🎫 ");
        builder.append(*jira.key);
        if (present(jira.server) && *jira.server != "System Jira"_s) {
            builder.append_format(" ({})", *jira.server);
        }
        return builder.build();
    }

    String operator()(const IncludeMacro& include) const {
        if (present(include.content_title)) {
            return "📄 Include: "_s + *include.content_title;
        }
        return "📄 Include Page"_s;
    }

    String operator()(const ExcerptIncludeMacro& excerpt) const {
        if (!present(excerpt.content_title)) {
            return "📝 Excerpt Include"_s;
        }
        StringBuilder builder;
        builder.append("📝 Excerpt: ");
        builder.append(*excerpt.content_title);
        if (present(excerpt.posting_day)) {
            builder.append_format(" ({})", *excerpt.posting_day);
        }
        return builder.build();
    }

    String operator()(const TasksReportMacro& report) const {
        return labelled("📊 Tasks Report", report.spaces);
    }

    String operator()(const AttachmentsMacro& attachments) const {
        return labelled("📎 Attachments", attachments.patterns);
    }

    String operator()(const ViewPdfMacro& pdf) const {
        if (present(pdf.filename)) {
            return "📄 PDF: "_s + *pdf.filename;
        }
        return "📄 PDF Viewer"_s;
    }

    String operator()(const ViewFileMacro& file) const {
        if (present(file.filename)) {
            return "📁 File: "_s + *file.filename;
        }
        return "📁 File Viewer"_s;
    }

    String operator()(const ProfileMacro& profile) const {
        if (present(profile.account_id)) {
            return "👤 Profile: "_s + *profile.account_id;
        }
        return "👤 User Profile"_s;
    }

    String operator()(const AnchorMacro& anchor) const {
        return labelled("⚓ Anchor", anchor.anchor_name);
    }

    String operator()(const ExcerptMacro&) const {
        return labelled("📄 Excerpt", flatten_text(body().view()));
    }

    String operator()(const Fragment&) const { return body(); }
    String operator()(const Container&) const { return body(); }

private:
    String body() const { return render_children(m_node.children()); }

    // One line per non-empty child
    String joined_lines() const {
        std::vector<String> lines;
        for (const auto& child : m_node.children()) {
            auto text = child->to_text();
            if (!text.empty()) {
                lines.push_back(std::move(text));
            }
        }
        return join(lines, "\n");
    }

    static String item_prefix(const List& list, const ListItem& item, i64& number) {
        switch (list.kind) {
            case ListKind::Unordered:
                return "• "_s;
            case ListKind::Ordered: {
                StringBuilder builder;
                builder.append_format("{}. ", number++);
                return builder.build();
            }
            case ListKind::Task:
                if (item.status == TaskStatus::Complete) {
                    return "✓ "_s;
                }
                if (item.status == TaskStatus::Incomplete) {
                    return "○ "_s;
                }
                return "• "_s;
        }
        return "• "_s;
    }

    const Node& m_node;
};

} // anonymous namespace

String render_text(const Node& node) {
    return std::visit(TextVisitor(node), node.payload());
}

String render_children(const NodeList& children) {
    std::vector<String> pieces;
    StringBuilder run;

    auto flush_run = [&pieces, &run]() {
        auto text = String(run.view()).trim();
        if (!text.empty()) {
            pieces.push_back(std::move(text));
        }
        run.clear();
    };

    for (const auto& child : children) {
        if (child->is_block_level()) {
            flush_run();
            auto text = child->to_text();
            if (!text.empty()) {
                pieces.push_back(std::move(text));
            }
        } else {
            run.append(child->to_text());
        }
    }
    flush_run();

    return join(pieces, "\n\n");
}

String flatten_text(std::string_view text) {
    StringBuilder builder;
    usize i = 0;
    while (i < text.size()) {
        if (!unicode::is_ascii_whitespace(static_cast<unsigned char>(text[i]))) {
            builder.append(text[i]);
            ++i;
            continue;
        }

        usize end = i;
        bool has_line_break = false;
        while (end < text.size() && unicode::is_ascii_whitespace(static_cast<unsigned char>(text[end]))) {
            if (text[end] == '\n' || text[end] == '\r') {
                has_line_break = true;
            }
            ++end;
        }

        if (has_line_break) {
            builder.append(' ');
        } else {
            builder.append(text.substr(i, end - i));
        }
        i = end;
    }
    return String(builder.view()).trim();
}

// ============================================================================
// Node::to_text
// ============================================================================

String Node::to_text() const {
    return render_text(*this);
}

} // namespace folio::nodes
