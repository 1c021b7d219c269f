/**
 * Markup TreeBuilder implementation
 */

#include "folio/markup/tree_builder.hpp"
#include <array>

namespace folio::markup {

std::string_view markup_error_kind_name(MarkupErrorKind kind) {
    switch (kind) {
        case MarkupErrorKind::InvalidUtf8: return "invalid_utf8";
        case MarkupErrorKind::NullCharacter: return "null_character";
        case MarkupErrorKind::NestingTooDeep: return "nesting_too_deep";
    }
    return "unknown";
}

TreeBuilder::TreeBuilder(usize max_depth) : m_max_depth(max_depth) {}

bool TreeBuilder::is_void_element(std::string_view name) {
    static constexpr std::array<std::string_view, 14> VOID_ELEMENTS = {
        "area", "base", "br", "col", "embed", "hr", "img",
        "input", "link", "meta", "param", "source", "track", "wbr"
    };
    for (auto candidate : VOID_ELEMENTS) {
        if (candidate == name) {
            return true;
        }
    }
    return false;
}

void TreeBuilder::process_token(const Token& token) {
    if (m_finished || m_fatal_error) {
        return;
    }

    std::visit([this](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, TagToken>) {
            if (t.is_end_tag) {
                close_element(t);
            } else {
                insert_element(t);
            }
        } else if constexpr (std::is_same_v<T, TextToken>) {
            insert_text(t);
        } else if constexpr (std::is_same_v<T, CommentToken>) {
            // Comments carry no content
        } else if constexpr (std::is_same_v<T, EndOfFileToken>) {
            finish();
        }
    }, token);
}

Forest TreeBuilder::take_forest() {
    return std::move(m_forest);
}

void TreeBuilder::insert_element(const TagToken& token) {
    std::vector<Attribute> attributes;
    attributes.reserve(token.attributes.size());
    for (const auto& [name, value] : token.attributes) {
        attributes.push_back(Attribute{name, value});
    }

    auto element = Element::tag(token.name, std::move(attributes), token.source_name);

    if (token.self_closing || is_void_element(token.name.view())) {
        append_to_current(std::move(element));
        return;
    }

    if (m_open_elements.size() >= m_max_depth) {
        StringBuilder message;
        message.append_format("element <{}> nested deeper than {} levels",
                              token.name, m_max_depth);
        m_fatal_error = MarkupError{MarkupErrorKind::NestingTooDeep, message.build(), token.offset};
        return;
    }

    m_open_elements.push_back(std::move(element));
}

void TreeBuilder::close_element(const TagToken& token) {
    auto index = find_open_element(token.name);
    if (!index) {
        // </br> and friends close nothing
        if (!is_void_element(token.name.view())) {
            parse_error(String("stray_end_tag:") + token.name);
        }
        return;
    }

    while (m_open_elements.size() > *index + 1) {
        parse_error(String("unclosed_element:") + m_open_elements.back().name());
        pop_current_element();
    }
    pop_current_element();
}

void TreeBuilder::insert_text(const TextToken& token) {
    if (m_open_elements.empty()) {
        if (!m_forest.empty() && m_forest.back().is_text() && !m_forest.back().is_cdata() && !token.cdata) {
            auto merged = m_forest.back().data() + token.data;
            m_forest.back() = Element::text(std::move(merged));
            return;
        }
        m_forest.push_back(Element::text(token.data, token.cdata));
        return;
    }
    m_open_elements.back().append_text(token.data.view(), token.cdata);
}

void TreeBuilder::finish() {
    while (!m_open_elements.empty()) {
        parse_error(String("unclosed_element:") + m_open_elements.back().name());
        pop_current_element();
    }
    m_finished = true;
}

void TreeBuilder::append_to_current(Element element) {
    if (m_open_elements.empty()) {
        m_forest.push_back(std::move(element));
    } else {
        m_open_elements.back().append_child(std::move(element));
    }
}

void TreeBuilder::pop_current_element() {
    if (m_open_elements.empty()) {
        return;
    }
    Element element = std::move(m_open_elements.back());
    m_open_elements.pop_back();
    append_to_current(std::move(element));
}

std::optional<usize> TreeBuilder::find_open_element(const String& name) const {
    for (usize i = m_open_elements.size(); i > 0; --i) {
        if (m_open_elements[i - 1].name() == name) {
            return i - 1;
        }
    }
    return std::nullopt;
}

void TreeBuilder::parse_error(const String& message) {
    if (m_error_callback) {
        m_error_callback(message);
    }
}

} // namespace folio::markup
