/**
 * Structured macro registry
 */

#include "folio/parser/macro_registry.hpp"
#include "folio/parser/dispatcher.hpp"
#include "folio/parser/fields.hpp"
#include "folio/nodes/payloads.hpp"
#include <algorithm>

namespace folio::parser {

using namespace nodes;

// ============================================================================
// MacroSource
// ============================================================================

MacroSource::MacroSource(const markup::Element& element) : m_element(element) {
    if (auto name = element.get_attribute("ac:name")) {
        m_source_name = name->trim();
        m_name = m_source_name.to_lowercase();
    }

    for (const auto& child : element.children()) {
        if (child.is_named("ac:parameter")) {
            m_parameters.emplace_back(child.get_attribute("ac:name").value_or(String()), &child);
        } else if (child.is_named("ac:rich-text-body") && !m_rich_text_body) {
            m_rich_text_body = &child;
        } else if (child.is_named("ac:plain-text-body") && !m_plain_text_body) {
            m_plain_text_body = &child;
        }
    }
}

const markup::Element* MacroSource::parameter_element(std::string_view name) const {
    for (const auto& [key, element] : m_parameters) {
        if (key.view() == name) {
            return element;
        }
    }
    return nullptr;
}

bool MacroSource::has_parameter(std::string_view name) const {
    return parameter_element(name) != nullptr;
}

std::optional<String> MacroSource::parameter(std::string_view name) const {
    auto element = parameter_element(name);
    if (!element) {
        return std::nullopt;
    }
    auto text = element->text_content().trim();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<String> MacroSource::plain_text_body() const {
    if (!m_plain_text_body) {
        return std::nullopt;
    }
    return m_plain_text_body->text_content();
}

namespace {

// ============================================================================
// Helpers
// ============================================================================

NodeList body(const MacroSource& source, Diagnostics& diagnostics) {
    if (!source.rich_text_body()) {
        return {};
    }
    return Dispatcher::dispatch_children(*source.rich_text_body(), diagnostics);
}

std::optional<i32> integer_parameter(const MacroSource& source, std::string_view name, Diagnostics& diagnostics) {
    return integer_field(source.parameter(name), source.name().view(), name, diagnostics);
}

std::optional<bool> boolean_parameter(const MacroSource& source, std::string_view name, Diagnostics& diagnostics) {
    return boolean_field(source.parameter(name), source.name().view(), name, diagnostics);
}

// Depth-first search for a descendant tag
const markup::Element* find_descendant(const markup::Element& element, std::string_view name) {
    for (const auto& child : element.children()) {
        if (!child.is_tag()) {
            continue;
        }
        if (child.is_named(name)) {
            return &child;
        }
        if (auto found = find_descendant(child, name)) {
            return found;
        }
    }
    return nullptr;
}

// Resource identifier referenced from inside a parameter (ri:page, ri:attachment, ...)
std::optional<ResourceIdentifier> parameter_resource(const MacroSource& source, std::string_view parameter,
                                                     std::string_view tag, Diagnostics& diagnostics) {
    auto element = source.parameter_element(parameter);
    if (!element) {
        return std::nullopt;
    }
    auto resource_element = find_descendant(*element, tag);
    if (!resource_element) {
        return std::nullopt;
    }
    auto node = Dispatcher::dispatch(*resource_element, diagnostics);
    if (auto resource = node ? node->as<ResourceIdentifier>() : nullptr) {
        return *resource;
    }
    return std::nullopt;
}

// ============================================================================
// Rules
// ============================================================================

template<PanelKind Kind>
NodePtr panel(const MacroSource& source, Diagnostics& diagnostics) {
    PanelMacro payload;
    payload.kind = Kind;
    payload.title = source.parameter("title");
    payload.bg_color = source.parameter("bgColor");
    payload.border_style = source.parameter("borderStyle");
    payload.border_color = source.parameter("borderColor");
    payload.title_bg_color = source.parameter("titleBGColor");
    payload.title_color = source.parameter("titleColor");
    payload.panel_icon = source.parameter("panelIcon");
    payload.panel_icon_id = source.parameter("panelIconId");
    payload.panel_icon_text = source.parameter("panelIconText");
    return Node::create(std::move(payload), body(source, diagnostics));
}

NodePtr code(const MacroSource& source, Diagnostics& diagnostics) {
    CodeMacro payload;
    if (source.name() != "noformat"_s) {
        payload.language = source.parameter("language");
    }
    payload.title = source.parameter("title");
    payload.breakout_mode = source.parameter("breakoutMode");
    payload.breakout_width = source.parameter("breakoutWidth");

    if (auto text = source.plain_text_body()) {
        payload.code = std::move(*text);
    } else {
        diagnostics.missing_field(source.name().view(), "plain-text-body");
    }
    return Node::create(std::move(payload));
}

NodePtr status(const MacroSource& source, Diagnostics& diagnostics) {
    StatusMacro payload;
    payload.title = source.parameter("title");
    payload.colour = source.parameter("colour");
    if (!payload.colour) {
        payload.colour = source.parameter("color");
    }
    payload.subtle = boolean_parameter(source, "subtle", diagnostics).value_or(false);
    return Node::create(std::move(payload));
}

NodePtr expand(const MacroSource& source, Diagnostics& diagnostics) {
    ExpandMacro payload;
    payload.title = source.parameter("title");
    payload.breakout_width = source.parameter("breakoutWidth");
    return Node::create(std::move(payload), body(source, diagnostics));
}

NodePtr details(const MacroSource& source, Diagnostics& diagnostics) {
    DetailsMacro payload;
    payload.id = source.parameter("id");
    payload.hidden = boolean_parameter(source, "hidden", diagnostics).value_or(false);
    return Node::create(std::move(payload), body(source, diagnostics));
}

NodePtr toc(const MacroSource& source, Diagnostics& diagnostics) {
    TocMacro payload;
    payload.style = source.parameter("style");
    payload.min_level = integer_parameter(source, "minLevel", diagnostics);
    payload.max_level = integer_parameter(source, "maxLevel", diagnostics);
    payload.outline = boolean_parameter(source, "outline", diagnostics);
    payload.type = source.parameter("type");
    payload.printable = boolean_parameter(source, "printable", diagnostics);
    return Node::create(std::move(payload));
}

NodePtr jira(const MacroSource& source, Diagnostics&) {
    JiraMacro payload;
    payload.key = source.parameter("key");
    payload.server = source.parameter("server");
    payload.server_id = source.parameter("serverId");
    payload.jql_query = source.parameter("jqlQuery");
    return Node::create(std::move(payload));
}

NodePtr include(const MacroSource& source, Diagnostics& diagnostics) {
    IncludeMacro payload;
    if (auto page = parameter_resource(source, "", "ri:page", diagnostics)) {
        payload.content_title = page->content_title;
        payload.space_key = page->space_key;
    }
    return Node::create(std::move(payload));
}

NodePtr excerpt_include(const MacroSource& source, Diagnostics& diagnostics) {
    ExcerptIncludeMacro payload;
    if (auto page = parameter_resource(source, "", "ri:page", diagnostics)) {
        payload.content_title = page->content_title;
        payload.space_key = page->space_key;
    } else if (auto post = parameter_resource(source, "", "ri:blog-post", diagnostics)) {
        payload.content_title = post->content_title;
        payload.space_key = post->space_key;
        payload.posting_day = post->posting_day;
    }
    payload.excerpt_name = source.parameter("name");
    payload.nopanel = boolean_parameter(source, "nopanel", diagnostics).value_or(false);
    return Node::create(std::move(payload));
}

NodePtr tasks_report(const MacroSource& source, Diagnostics& diagnostics) {
    TasksReportMacro payload;
    payload.spaces = source.parameter("spaces");
    payload.labels = source.parameter("labels");
    payload.status = source.parameter("status");
    payload.page_size = integer_parameter(source, "pageSize", diagnostics);
    payload.is_missing_required_parameters =
        boolean_parameter(source, "isMissingRequiredParameters", diagnostics).value_or(false);
    return Node::create(std::move(payload));
}

NodePtr attachments(const MacroSource& source, Diagnostics& diagnostics) {
    AttachmentsMacro payload;
    payload.patterns = source.parameter("patterns");
    payload.sort_by = source.parameter("sortBy");
    payload.upload = boolean_parameter(source, "upload", diagnostics);
    return Node::create(std::move(payload));
}

NodePtr view_pdf(const MacroSource& source, Diagnostics& diagnostics) {
    ViewPdfMacro payload;
    if (auto attachment = parameter_resource(source, "name", "ri:attachment", diagnostics)) {
        payload.filename = attachment->filename;
        payload.version_at_save = attachment->version_at_save;
    }
    return Node::create(std::move(payload));
}

NodePtr view_file(const MacroSource& source, Diagnostics& diagnostics) {
    ViewFileMacro payload;
    if (auto attachment = parameter_resource(source, "name", "ri:attachment", diagnostics)) {
        payload.filename = attachment->filename;
        payload.version_at_save = attachment->version_at_save;
    }
    payload.height = source.parameter("height");
    return Node::create(std::move(payload));
}

NodePtr profile(const MacroSource& source, Diagnostics& diagnostics) {
    ProfileMacro payload;
    if (auto user = parameter_resource(source, "user", "ri:user", diagnostics)) {
        payload.account_id = user->account_id ? user->account_id : user->userkey;
    }
    return Node::create(std::move(payload));
}

NodePtr anchor(const MacroSource& source, Diagnostics&) {
    AnchorMacro payload;
    payload.anchor_name = source.parameter("");
    if (!payload.anchor_name) {
        payload.anchor_name = source.parameter("anchor");
    }
    return Node::create(std::move(payload));
}

NodePtr excerpt(const MacroSource& source, Diagnostics& diagnostics) {
    ExcerptMacro payload;
    payload.name = source.parameter("name");
    payload.hidden = boolean_parameter(source, "hidden", diagnostics).value_or(false);
    return Node::create(std::move(payload), body(source, diagnostics));
}

// Body kept by a degraded macro: the dispatched rich-text body, else the raw
// plain-text body
NodeList fallback_body(const MacroSource& source, Diagnostics& diagnostics) {
    if (source.rich_text_body()) {
        return body(source, diagnostics);
    }
    NodeList children;
    if (auto text = source.plain_text_body(); text && !text->empty()) {
        children.push_back(Node::create(Text{std::move(*text)}));
    }
    return children;
}

} // anonymous namespace

// ============================================================================
// MacroRegistry
// ============================================================================

const std::unordered_map<String, MacroRule>& MacroRegistry::rules() {
    static const std::unordered_map<String, MacroRule> RULES = {
        {"info"_s, panel<PanelKind::Info>},
        {"note"_s, panel<PanelKind::Note>},
        {"warning"_s, panel<PanelKind::Warning>},
        {"tip"_s, panel<PanelKind::Success>},
        {"success"_s, panel<PanelKind::Success>},
        {"error"_s, panel<PanelKind::Error>},
        {"panel"_s, panel<PanelKind::Panel>},
        {"code"_s, code},
        {"noformat"_s, code},
        {"status"_s, status},
        {"expand"_s, expand},
        {"details"_s, details},
        {"page-properties"_s, details},
        {"toc"_s, toc},
        {"jira"_s, jira},
        {"include"_s, include},
        {"excerpt-include"_s, excerpt_include},
        {"tasks-report-macro"_s, tasks_report},
        {"attachments"_s, attachments},
        {"viewpdf"_s, view_pdf},
        {"view-file"_s, view_file},
        {"profile"_s, profile},
        {"anchor"_s, anchor},
        {"excerpt"_s, excerpt},
    };
    return RULES;
}

MacroRule MacroRegistry::find(std::string_view name) {
    const auto& table = rules();
    auto it = table.find(String(name));
    if (it == table.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<String> MacroRegistry::names() {
    std::vector<String> result;
    for (const auto& [name, rule] : rules()) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

NodePtr MacroRegistry::build(const markup::Element& element, Diagnostics& diagnostics) {
    MacroSource source(element);

    if (source.name().empty()) {
        diagnostics.missing_field(element.name().view(), "name");
        return Node::create(Container{element.source_name()}, fallback_body(source, diagnostics));
    }

    auto rule = find(source.name().view());
    if (!rule) {
        diagnostics.unknown_macro(source.source_name().view());
        return Node::create(Container{element.source_name()}, fallback_body(source, diagnostics));
    }
    return rule(source, diagnostics);
}

} // namespace folio::parser
