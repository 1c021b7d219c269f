#pragma once

#include "diagnostics.hpp"
#include "folio/markup/element.hpp"
#include "folio/nodes/node.hpp"
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace folio::parser {

// ============================================================================
// MacroSource - read-only view of an ac:structured-macro / ac:macro element
// ============================================================================

class MacroSource {
public:
    explicit MacroSource(const markup::Element& element);

    [[nodiscard]] const markup::Element& element() const { return m_element; }

    // Lowercased ac:name, empty when missing
    [[nodiscard]] const String& name() const { return m_name; }
    // Trimmed ac:name as written
    [[nodiscard]] const String& source_name() const { return m_source_name; }

    // Trimmed text of the ac:parameter whose ac:name matches exactly
    [[nodiscard]] std::optional<String> parameter(std::string_view name) const;
    [[nodiscard]] const markup::Element* parameter_element(std::string_view name) const;
    [[nodiscard]] bool has_parameter(std::string_view name) const;
    [[nodiscard]] const std::vector<std::pair<String, const markup::Element*>>& parameters() const {
        return m_parameters;
    }

    [[nodiscard]] const markup::Element* rich_text_body() const { return m_rich_text_body; }

    // Raw character data of ac:plain-text-body, nullopt when the element is missing
    [[nodiscard]] std::optional<String> plain_text_body() const;

private:
    const markup::Element& m_element;
    String m_name;
    String m_source_name;
    std::vector<std::pair<String, const markup::Element*>> m_parameters;
    const markup::Element* m_rich_text_body{nullptr};
    const markup::Element* m_plain_text_body{nullptr};
};

// ============================================================================
// MacroRegistry - macro name to node constructor
// ============================================================================

using MacroRule = nodes::NodePtr (*)(const MacroSource& source, Diagnostics& diagnostics);

class MacroRegistry {
public:
    // Builds the node for a macro element. Unknown or unnamed macros degrade
    // to a Container over their body.
    [[nodiscard]] static nodes::NodePtr build(const markup::Element& element, Diagnostics& diagnostics);

    [[nodiscard]] static MacroRule find(std::string_view name);
    [[nodiscard]] static bool is_registered(std::string_view name) { return find(name) != nullptr; }

    // Registered names, sorted
    [[nodiscard]] static std::vector<String> names();

private:
    static const std::unordered_map<String, MacroRule>& rules();
};

} // namespace folio::parser
