#pragma once

#include "diagnostics.hpp"
#include "folio/markup/element.hpp"
#include "folio/nodes/node.hpp"
#include <unordered_map>

namespace folio::parser {

// ============================================================================
// Dispatcher - element forest to content nodes
// ============================================================================

// Recursive descent keyed on the qualified tag name. Children are built
// before their parent. Unrecognized tags degrade to a Container and are
// reported through the diagnostics collector.
class Dispatcher {
public:
    using Handler = nodes::NodePtr (*)(const markup::Element& element, Diagnostics& diagnostics);

    // nullptr for elements that carry no content (indentation whitespace,
    // column groups, ADF fallbacks, ...)
    [[nodiscard]] static nodes::NodePtr dispatch(const markup::Element& element, Diagnostics& diagnostics);

    [[nodiscard]] static nodes::NodeList dispatch_children(const markup::Element& element, Diagnostics& diagnostics);
    [[nodiscard]] static nodes::NodeList dispatch_all(const markup::Forest& elements, Diagnostics& diagnostics);

    [[nodiscard]] static bool is_known_tag(std::string_view tag);

private:
    static const std::unordered_map<String, Handler>& handlers();
};

} // namespace folio::parser
