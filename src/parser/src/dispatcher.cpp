/**
 * Element dispatcher - storage-format elements to content nodes
 */

#include "folio/parser/dispatcher.hpp"
#include "folio/parser/fields.hpp"
#include "folio/parser/macro_registry.hpp"
#include "folio/nodes/payloads.hpp"

namespace folio::parser {

using namespace nodes;

namespace {

// ============================================================================
// Helpers
// ============================================================================

std::optional<String> non_empty_attribute(const markup::Element& element, std::string_view name) {
    auto value = element.get_attribute(name);
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

// First attribute present among the given names
std::optional<String> first_attribute(const markup::Element& element,
                                      std::initializer_list<std::string_view> names) {
    for (auto name : names) {
        if (auto value = non_empty_attribute(element, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<String> child_text(const markup::Element& element, std::string_view name) {
    auto child = element.first_child(name);
    if (!child) {
        return std::nullopt;
    }
    auto text = child->text_content().trim();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

NodeList dispatch_children_of(const markup::Element* element, Diagnostics& diagnostics) {
    if (!element) {
        return {};
    }
    return Dispatcher::dispatch_children(*element, diagnostics);
}

void append_all(NodeList& target, NodeList source) {
    for (auto& node : source) {
        target.push_back(std::move(node));
    }
}

NodePtr transparent(const markup::Element& element, Diagnostics& diagnostics) {
    return Node::create(Container{element.source_name()}, Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr dropped(const markup::Element&, Diagnostics&) {
    return nullptr;
}

// ============================================================================
// Text formatting and structure
// ============================================================================

NodePtr heading(const markup::Element& element, Diagnostics& diagnostics) {
    Heading payload;
    payload.level = static_cast<u8>(element.name()[1] - '0');
    return Node::create(payload, Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr paragraph(const markup::Element& element, Diagnostics& diagnostics) {
    return Node::create(TextBreak{BreakKind::Paragraph}, Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr line_break(const markup::Element&, Diagnostics&) {
    return Node::create(TextBreak{BreakKind::LineBreak});
}

NodePtr horizontal_rule(const markup::Element&, Diagnostics&) {
    return Node::create(TextBreak{BreakKind::HorizontalRule});
}

template<TextEffectKind Effect>
NodePtr text_effect(const markup::Element& element, Diagnostics& diagnostics) {
    TextEffect payload;
    payload.effect = Effect;
    payload.style = non_empty_attribute(element, "style");
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr time_element(const markup::Element& element, Diagnostics&) {
    return Node::create(Time{first_attribute(element, {"datetime", "ac:datetime"})});
}

NodePtr image(const markup::Element& element, Diagnostics& diagnostics) {
    const auto& owner = element.name();
    Image payload;
    payload.src = non_empty_attribute(element, "src");
    payload.alt = non_empty_attribute(element, "alt");
    payload.title = non_empty_attribute(element, "title");
    payload.width = integer_field(element.get_attribute("width"), owner.view(), "width", diagnostics);
    payload.height = integer_field(element.get_attribute("height"), owner.view(), "height", diagnostics);
    return Node::create(std::move(payload));
}

NodePtr anchor_link(const markup::Element& element, Diagnostics& diagnostics) {
    Link payload;
    payload.href = non_empty_attribute(element, "href");
    payload.card_appearance = non_empty_attribute(element, "data-card-appearance");

    if (payload.href) {
        auto href = payload.href->to_lowercase();
        if (href.starts_with("mailto:"_s)) {
            payload.kind = LinkKind::Mailto;
        } else if (href.starts_with("#"_s)) {
            payload.kind = LinkKind::Anchor;
            payload.anchor = payload.href->substring(1);
        }
    }
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

// ============================================================================
// Lists
// ============================================================================

NodePtr unordered_list(const markup::Element& element, Diagnostics& diagnostics) {
    List payload;
    payload.kind = ListKind::Unordered;
    payload.local_id = non_empty_attribute(element, "data-local-id");
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr ordered_list(const markup::Element& element, Diagnostics& diagnostics) {
    List payload;
    payload.kind = ListKind::Ordered;
    payload.start = integer_field(element.get_attribute("start"), "ol", "start", diagnostics);
    payload.local_id = non_empty_attribute(element, "data-local-id");
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr list_item(const markup::Element& element, Diagnostics& diagnostics) {
    ListItem payload;
    payload.local_id = non_empty_attribute(element, "data-local-id");
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr task_list(const markup::Element& element, Diagnostics& diagnostics) {
    List payload;
    payload.kind = ListKind::Task;
    payload.local_id = non_empty_attribute(element, "ac:local-id");
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr task(const markup::Element& element, Diagnostics& diagnostics) {
    ListItem payload;
    payload.task_id = child_text(element, "ac:task-id");
    payload.task_uuid = child_text(element, "ac:task-uuid");
    payload.local_id = first_attribute(element, {"ac:local-id", "local-id"});

    if (auto status = child_text(element, "ac:task-status")) {
        payload.status = parse_task_status(status->view());
        if (!payload.status) {
            diagnostics.invalid_field("ac:task", "status", status->view());
        }
    }

    auto children = dispatch_children_of(element.first_child("ac:task-body"), diagnostics);
    return Node::create(std::move(payload), std::move(children));
}

// ============================================================================
// Tables
// ============================================================================

NodePtr table(const markup::Element& element, Diagnostics& diagnostics) {
    Table payload;
    payload.width = first_attribute(element, {"data-table-width", "width"});
    payload.layout = non_empty_attribute(element, "data-layout");
    payload.local_id = first_attribute(element, {"data-local-id", "ac:local-id"});
    payload.display_mode = non_empty_attribute(element, "data-table-display-mode");

    NodeList rows;
    for (const auto& child : element.children()) {
        if (child.is_named("tbody") || child.is_named("thead") || child.is_named("tfoot")) {
            append_all(rows, Dispatcher::dispatch_children(child, diagnostics));
        } else if (auto node = Dispatcher::dispatch(child, diagnostics)) {
            rows.push_back(std::move(node));
        }
    }
    return Node::create(std::move(payload), std::move(rows));
}

NodePtr table_row(const markup::Element& element, Diagnostics& diagnostics) {
    return Node::create(TableRow{}, Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr table_cell(const markup::Element& element, Diagnostics& diagnostics) {
    const auto& owner = element.name();
    TableCell payload;
    payload.is_header = element.is_named("th");
    payload.rowspan = integer_field(element.get_attribute("rowspan"), owner.view(), "rowspan", diagnostics);
    payload.colspan = integer_field(element.get_attribute("colspan"), owner.view(), "colspan", diagnostics);
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

// ============================================================================
// Layout
// ============================================================================

NodePtr layout(const markup::Element& element, Diagnostics& diagnostics) {
    return Node::create(Layout{}, Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr layout_section(const markup::Element& element, Diagnostics& diagnostics) {
    LayoutSection payload;
    if (auto type = non_empty_attribute(element, "ac:type")) {
        if (auto parsed = parse_layout_section_type(type->view())) {
            payload.type = *parsed;
        } else {
            diagnostics.invalid_field("ac:layout-section", "type", type->view());
        }
    }
    payload.breakout_mode = non_empty_attribute(element, "ac:breakout-mode");
    payload.breakout_width = non_empty_attribute(element, "ac:breakout-width");
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr layout_cell(const markup::Element& element, Diagnostics& diagnostics) {
    return Node::create(LayoutCell{}, Dispatcher::dispatch_children(element, diagnostics));
}

// ============================================================================
// ADF nodes
// ============================================================================

std::optional<String> adf_attribute(const markup::Element& element, std::string_view key) {
    for (const auto* attribute : element.children_named("ac:adf-attribute")) {
        auto attribute_key = attribute->get_attribute("key");
        if (attribute_key && attribute_key->view() == key) {
            auto text = attribute->text_content().trim();
            if (!text.empty()) {
                return text;
            }
        }
    }
    return non_empty_attribute(element, key);
}

NodePtr decision_item(const markup::Element& element, Diagnostics& diagnostics) {
    DecisionListItem payload;
    payload.local_id = adf_attribute(element, "local-id");
    if (auto state = adf_attribute(element, "state")) {
        if (auto parsed = parse_decision_state(state->view())) {
            payload.state = *parsed;
        } else {
            diagnostics.invalid_field("ac:adf-node", "state", state->view());
        }
    }

    NodeList children;
    for (const auto* content : element.children_named("ac:adf-content")) {
        append_all(children, Dispatcher::dispatch_children(*content, diagnostics));
    }
    return Node::create(std::move(payload), std::move(children));
}

// Children other than attribute records; content wrappers are unwrapped
NodeList adf_children(const markup::Element& element, Diagnostics& diagnostics) {
    NodeList children;
    for (const auto& child : element.children()) {
        if (child.is_named("ac:adf-attribute")) {
            continue;
        }
        if (child.is_named("ac:adf-content")) {
            append_all(children, Dispatcher::dispatch_children(child, diagnostics));
        } else if (auto node = Dispatcher::dispatch(child, diagnostics)) {
            children.push_back(std::move(node));
        }
    }
    return children;
}

NodePtr adf_node(const markup::Element& element, Diagnostics& diagnostics) {
    auto type = element.get_attribute("type").value_or(String()).trim().to_lowercase();

    if (type == "decision-list"_s) {
        DecisionList payload;
        payload.local_id = adf_attribute(element, "local-id");
        return Node::create(std::move(payload), adf_children(element, diagnostics));
    }
    if (type == "decision-item"_s) {
        return decision_item(element, diagnostics);
    }

    StringBuilder tag;
    tag.append_format("ac:adf-node[type={}]", type);
    diagnostics.unknown_element(tag.view());
    return Node::create(Container{element.name()}, adf_children(element, diagnostics));
}

NodePtr adf_extension(const markup::Element& element, Diagnostics& diagnostics) {
    NodeList children;
    for (const auto& child : element.children()) {
        if (child.is_named("ac:adf-fallback")) {
            continue;
        }
        if (auto node = Dispatcher::dispatch(child, diagnostics)) {
            children.push_back(std::move(node));
        }
    }
    return Node::create(Container{element.name()}, std::move(children));
}

// ============================================================================
// Inline custom elements
// ============================================================================

NodePtr placeholder(const markup::Element& element, Diagnostics& diagnostics) {
    Placeholder payload;
    payload.placeholder_type = non_empty_attribute(element, "ac:type");
    return Node::create(std::move(payload), Dispatcher::dispatch_children(element, diagnostics));
}

NodePtr emoticon(const markup::Element& element, Diagnostics&) {
    Emoticon payload;
    payload.name = non_empty_attribute(element, "ac:name");
    payload.emoji_shortname = non_empty_attribute(element, "ac:emoji-shortname");
    payload.emoji_id = non_empty_attribute(element, "ac:emoji-id");
    payload.emoji_fallback = non_empty_attribute(element, "ac:emoji-fallback");
    return Node::create(std::move(payload));
}

NodePtr custom_image(const markup::Element& element, Diagnostics& diagnostics) {
    const auto& owner = element.name();
    Image payload;
    payload.src = non_empty_attribute(element, "ac:src");
    payload.alt = non_empty_attribute(element, "ac:alt");
    payload.title = non_empty_attribute(element, "ac:title");
    payload.alignment = non_empty_attribute(element, "ac:align");
    payload.layout = non_empty_attribute(element, "ac:layout");
    payload.width = integer_field(element.get_attribute("ac:width"), owner.view(), "width", diagnostics);
    payload.height = integer_field(element.get_attribute("ac:height"), owner.view(), "height", diagnostics);
    payload.original_width = integer_field(element.get_attribute("ac:original-width"),
                                           owner.view(), "original-width", diagnostics);
    payload.original_height = integer_field(element.get_attribute("ac:original-height"),
                                            owner.view(), "original-height", diagnostics);

    if (auto attachment = element.first_child("ri:attachment")) {
        payload.filename = non_empty_attribute(*attachment, "ri:filename");
    }
    if (auto url = element.first_child("ri:url")) {
        if (!payload.src) {
            payload.src = non_empty_attribute(*url, "ri:value");
        }
    }

    auto caption = dispatch_children_of(element.first_child("ac:caption"), diagnostics);
    return Node::create(std::move(payload), std::move(caption));
}

// ============================================================================
// Links and resource identifiers
// ============================================================================

NodePtr resource_identifier(const markup::Element& element, Diagnostics& diagnostics) {
    auto kind = parse_resource_kind(element.local_name());
    if (!kind) {
        diagnostics.unknown_element(element.source_name().view());
        return transparent(element, diagnostics);
    }

    const auto& owner = element.name();
    ResourceIdentifier payload;
    payload.kind = *kind;
    payload.content_title = non_empty_attribute(element, "ri:content-title");
    payload.space_key = non_empty_attribute(element, "ri:space-key");
    payload.version_at_save = integer_field(element.get_attribute("ri:version-at-save"),
                                            owner.view(), "version-at-save", diagnostics);
    payload.posting_day = non_empty_attribute(element, "ri:posting-day");
    payload.filename = non_empty_attribute(element, "ri:filename");
    payload.content_id = non_empty_attribute(element, "ri:content-id");
    payload.value = non_empty_attribute(element, "ri:value");
    payload.account_id = non_empty_attribute(element, "ri:account-id");
    payload.userkey = non_empty_attribute(element, "ri:userkey");
    payload.local_id = non_empty_attribute(element, "ri:local-id");
    payload.shortcut_key = non_empty_attribute(element, "ri:key");
    payload.shortcut_parameter = non_empty_attribute(element, "ri:parameter");
    return Node::create(std::move(payload));
}

LinkKind link_kind_for(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Page:
        case ResourceKind::ContentEntity:
            return LinkKind::Page;
        case ResourceKind::BlogPost: return LinkKind::BlogPost;
        case ResourceKind::Attachment: return LinkKind::Attachment;
        case ResourceKind::User: return LinkKind::User;
        case ResourceKind::Space: return LinkKind::Space;
        case ResourceKind::Url:
        case ResourceKind::Shortcut:
            return LinkKind::External;
    }
    return LinkKind::External;
}

NodePtr custom_link(const markup::Element& element, Diagnostics& diagnostics) {
    Link payload;
    payload.anchor = non_empty_attribute(element, "ac:anchor");
    payload.card_appearance = first_attribute(element, {"ac:card-appearance", "data-card-appearance"});
    payload.kind = payload.anchor ? LinkKind::Anchor : LinkKind::External;

    NodeList children;
    NodeList body;
    bool has_resource = false;

    for (const auto& child : element.children()) {
        if (child.is_tag() && child.prefix() == "ri" && !has_resource) {
            auto node = Dispatcher::dispatch(child, diagnostics);
            if (auto resource = node ? node->as<ResourceIdentifier>() : nullptr) {
                payload.kind = link_kind_for(resource->kind);
                if (resource->kind == ResourceKind::Url) {
                    payload.href = resource->value;
                }
                has_resource = true;
                children.push_back(std::move(node));
            } else if (node) {
                body.push_back(std::move(node));
            }
        } else if (child.is_named("ac:link-body")) {
            append_all(body, Dispatcher::dispatch_children(child, diagnostics));
        } else if (child.is_named("ac:plain-text-link-body")) {
            auto text = child.text_content();
            if (!text.empty()) {
                body.push_back(Node::create(Text{std::move(text)}));
            }
        } else if (auto node = Dispatcher::dispatch(child, diagnostics)) {
            body.push_back(std::move(node));
        }
    }

    append_all(children, std::move(body));
    return Node::create(std::move(payload), std::move(children));
}

NodePtr macro(const markup::Element& element, Diagnostics& diagnostics) {
    return MacroRegistry::build(element, diagnostics);
}

// ============================================================================
// Character data
// ============================================================================

// Whitespace-only runs that span a line break are source formatting
bool is_formatting_whitespace(const markup::Element& element) {
    if (!element.is_text() || element.is_cdata()) {
        return false;
    }
    const auto& data = element.data();
    return data.is_blank() && (data.contains("\n"_s) || data.contains("\r"_s));
}

NodePtr character_data(const markup::Element& element) {
    if (is_formatting_whitespace(element)) {
        return nullptr;
    }
    return Node::create(Text{element.data()});
}

} // anonymous namespace

// ============================================================================
// Dispatcher
// ============================================================================

const std::unordered_map<String, Dispatcher::Handler>& Dispatcher::handlers() {
    static const std::unordered_map<String, Handler> HANDLERS = {
        // Headings and paragraphs
        {"h1"_s, heading}, {"h2"_s, heading}, {"h3"_s, heading},
        {"h4"_s, heading}, {"h5"_s, heading}, {"h6"_s, heading},
        {"p"_s, paragraph},
        {"br"_s, line_break},
        {"hr"_s, horizontal_rule},

        // Text effects
        {"strong"_s, text_effect<TextEffectKind::Strong>},
        {"b"_s, text_effect<TextEffectKind::Strong>},
        {"em"_s, text_effect<TextEffectKind::Emphasis>},
        {"i"_s, text_effect<TextEffectKind::Emphasis>},
        {"u"_s, text_effect<TextEffectKind::Underline>},
        {"ins"_s, text_effect<TextEffectKind::Underline>},
        {"s"_s, text_effect<TextEffectKind::Strikethrough>},
        {"del"_s, text_effect<TextEffectKind::Strikethrough>},
        {"strike"_s, text_effect<TextEffectKind::Strikethrough>},
        {"code"_s, text_effect<TextEffectKind::Monospace>},
        {"sub"_s, text_effect<TextEffectKind::Subscript>},
        {"sup"_s, text_effect<TextEffectKind::Superscript>},
        {"blockquote"_s, text_effect<TextEffectKind::Blockquote>},
        {"span"_s, text_effect<TextEffectKind::Span>},

        // Inline content
        {"a"_s, anchor_link},
        {"img"_s, image},
        {"time"_s, time_element},

        // Lists
        {"ul"_s, unordered_list},
        {"ol"_s, ordered_list},
        {"li"_s, list_item},

        // Tables
        {"table"_s, table},
        {"tbody"_s, transparent},
        {"thead"_s, transparent},
        {"tfoot"_s, transparent},
        {"colgroup"_s, dropped},
        {"col"_s, dropped},
        {"tr"_s, table_row},
        {"td"_s, table_cell},
        {"th"_s, table_cell},

        // Transparent wrappers
        {"div"_s, transparent},
        {"pre"_s, transparent},
        {"section"_s, transparent},
        {"ac:inline-comment-marker"_s, transparent},
        {"ac:rich-text-body"_s, transparent},
        {"ac:adf-content"_s, transparent},

        // Layout
        {"ac:layout"_s, layout},
        {"ac:layout-section"_s, layout_section},
        {"ac:layout-cell"_s, layout_cell},

        // Tasks
        {"ac:task-list"_s, task_list},
        {"ac:task"_s, task},

        // ADF
        {"ac:adf-extension"_s, adf_extension},
        {"ac:adf-node"_s, adf_node},
        {"ac:adf-attribute"_s, dropped},
        {"ac:adf-fallback"_s, dropped},

        // Custom inline elements
        {"ac:placeholder"_s, placeholder},
        {"ac:emoticon"_s, emoticon},
        {"ac:image"_s, custom_image},
        {"ac:time"_s, time_element},
        {"ac:link"_s, custom_link},

        // Resource identifiers
        {"ri:page"_s, resource_identifier},
        {"ri:blog-post"_s, resource_identifier},
        {"ri:attachment"_s, resource_identifier},
        {"ri:url"_s, resource_identifier},
        {"ri:shortcut"_s, resource_identifier},
        {"ri:user"_s, resource_identifier},
        {"ri:space"_s, resource_identifier},
        {"ri:content-entity"_s, resource_identifier},

        // Macros
        {"ac:structured-macro"_s, macro},
        {"ac:macro"_s, macro},
    };
    return HANDLERS;
}

bool Dispatcher::is_known_tag(std::string_view tag) {
    return handlers().count(String(tag)) > 0;
}

NodePtr Dispatcher::dispatch(const markup::Element& element, Diagnostics& diagnostics) {
    if (element.is_text()) {
        return character_data(element);
    }

    const auto& table = handlers();
    auto it = table.find(element.name());
    if (it != table.end()) {
        return it->second(element, diagnostics);
    }

    // Unrecognized ri: elements still go through the identifier builder so
    // the diagnostic names the exact tag
    if (element.prefix() == "ri") {
        return resource_identifier(element, diagnostics);
    }

    diagnostics.unknown_element(element.source_name().view());
    return transparent(element, diagnostics);
}

NodeList Dispatcher::dispatch_children(const markup::Element& element, Diagnostics& diagnostics) {
    return dispatch_all(element.children(), diagnostics);
}

NodeList Dispatcher::dispatch_all(const markup::Forest& elements, Diagnostics& diagnostics) {
    NodeList nodes;
    nodes.reserve(elements.size());
    // Formatting whitespace between two inline siblings separates words and
    // collapses to one space; next to a block or at either end it is dropped.
    bool pending_space = false;
    for (const auto& element : elements) {
        if (is_formatting_whitespace(element)) {
            pending_space = !nodes.empty() && !nodes.back()->is_block_level();
            continue;
        }
        auto node = dispatch(element, diagnostics);
        if (!node) {
            continue;
        }
        if (pending_space && !node->is_block_level()) {
            nodes.push_back(Node::create(Text{" "_s}));
        }
        pending_space = false;
        nodes.push_back(std::move(node));
    }
    return nodes;
}

} // namespace folio::parser
