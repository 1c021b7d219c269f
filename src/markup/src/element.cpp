#include "folio/markup/element.hpp"

namespace folio::markup {

Element Element::tag(String name, std::vector<Attribute> attributes, String source_name) {
    Element element;
    element.m_type = Type::Tag;
    element.m_name = std::move(name);
    element.m_source_name = std::move(source_name);
    element.m_attributes = std::move(attributes);
    return element;
}

Element Element::text(String data, bool cdata) {
    Element element;
    element.m_type = Type::Text;
    element.m_data = std::move(data);
    element.m_cdata = cdata;
    return element;
}

std::string_view Element::prefix() const {
    auto view = m_name.view();
    auto colon = view.find(':');
    if (colon == std::string_view::npos) {
        return {};
    }
    return view.substr(0, colon);
}

std::string_view Element::local_name() const {
    auto view = m_name.view();
    auto colon = view.find(':');
    if (colon == std::string_view::npos) {
        return view;
    }
    return view.substr(colon + 1);
}

bool Element::is_named(std::string_view name) const {
    return is_tag() && m_name.view() == name;
}

std::optional<String> Element::get_attribute(std::string_view name) const {
    for (const auto& attribute : m_attributes) {
        if (attribute.name.view() == name) {
            return attribute.value;
        }
    }
    return std::nullopt;
}

bool Element::has_attribute(std::string_view name) const {
    for (const auto& attribute : m_attributes) {
        if (attribute.name.view() == name) {
            return true;
        }
    }
    return false;
}

const Element* Element::first_child(std::string_view name) const {
    for (const auto& child : m_children) {
        if (child.is_named(name)) {
            return &child;
        }
    }
    return nullptr;
}

std::vector<const Element*> Element::children_named(std::string_view name) const {
    std::vector<const Element*> result;
    for (const auto& child : m_children) {
        if (child.is_named(name)) {
            result.push_back(&child);
        }
    }
    return result;
}

const Element* Element::first_child_with_prefix(std::string_view prefix) const {
    for (const auto& child : m_children) {
        if (child.is_tag() && child.prefix() == prefix) {
            return &child;
        }
    }
    return nullptr;
}

bool Element::is_whitespace() const {
    return is_text() && m_data.is_blank();
}

String Element::text_content() const {
    if (is_text()) {
        return m_data;
    }
    StringBuilder builder;
    collect_text(builder);
    return builder.build();
}

void Element::collect_text(StringBuilder& builder) const {
    for (const auto& child : m_children) {
        if (child.is_text()) {
            builder.append(child.m_data);
        } else {
            child.collect_text(builder);
        }
    }
}

void Element::append_child(Element child) {
    m_children.push_back(std::move(child));
}

void Element::append_text(std::string_view data, bool cdata) {
    if (!m_children.empty()) {
        auto& last = m_children.back();
        if (last.is_text() && last.m_cdata == cdata && !cdata) {
            last.m_data.append(data);
            return;
        }
    }
    m_children.push_back(text(String(data), cdata));
}

} // namespace folio::markup
