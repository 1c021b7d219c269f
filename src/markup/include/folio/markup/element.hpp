#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include <optional>
#include <vector>

namespace folio::markup {

struct Attribute {
    String name;
    String value;
};

// ============================================================================
// Element - one node of the generic element forest
// ============================================================================

// Either a tag with attributes and children, or a run of character data.
// Tag and attribute names are lowercase and keep their namespace prefix
// ("ac:structured-macro", "ri:page"). source_name() keeps the tag name as
// written, for reporting.
class Element {
public:
    enum class Type : u8 {
        Tag,
        Text
    };

    Element() = default;

    [[nodiscard]] static Element tag(String name, std::vector<Attribute> attributes = {},
                                     String source_name = {});
    [[nodiscard]] static Element text(String data, bool cdata = false);

    [[nodiscard]] Type type() const { return m_type; }
    [[nodiscard]] bool is_tag() const { return m_type == Type::Tag; }
    [[nodiscard]] bool is_text() const { return m_type == Type::Text; }

    // Tag accessors
    [[nodiscard]] const String& name() const { return m_name; }
    [[nodiscard]] const String& source_name() const {
        return m_source_name.empty() ? m_name : m_source_name;
    }
    [[nodiscard]] std::string_view prefix() const;
    [[nodiscard]] std::string_view local_name() const;
    [[nodiscard]] bool is_named(std::string_view name) const;

    [[nodiscard]] const std::vector<Attribute>& attributes() const { return m_attributes; }
    [[nodiscard]] std::optional<String> get_attribute(std::string_view name) const;
    [[nodiscard]] bool has_attribute(std::string_view name) const;

    [[nodiscard]] const std::vector<Element>& children() const { return m_children; }
    [[nodiscard]] bool has_children() const { return !m_children.empty(); }

    [[nodiscard]] const Element* first_child(std::string_view name) const;
    [[nodiscard]] std::vector<const Element*> children_named(std::string_view name) const;
    // First direct tag child whose prefix matches, e.g. "ri"
    [[nodiscard]] const Element* first_child_with_prefix(std::string_view prefix) const;

    // Text accessors
    [[nodiscard]] const String& data() const { return m_data; }
    [[nodiscard]] bool is_cdata() const { return m_cdata; }
    [[nodiscard]] bool is_whitespace() const;

    // Concatenated character data of the whole subtree
    [[nodiscard]] String text_content() const;

    // Building
    void append_child(Element child);
    void append_text(std::string_view data, bool cdata);

private:
    void collect_text(StringBuilder& builder) const;

    Type m_type{Type::Tag};
    String m_name;
    String m_source_name;
    std::vector<Attribute> m_attributes;
    String m_data;
    bool m_cdata{false};
    std::vector<Element> m_children;
};

using Forest = std::vector<Element>;

} // namespace folio::markup
