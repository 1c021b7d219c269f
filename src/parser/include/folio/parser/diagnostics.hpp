#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include <vector>

namespace folio::parser {

// ============================================================================
// Diagnostics - degradations recorded during one parse call
// ============================================================================

// Append-only. Record formats:
//   unknown_element:<tag>
//   unknown_macro:<name>
//   missing_field:<owner>.<field>
//   invalid_field:<owner>.<field>:<value>
class Diagnostics {
public:
    void record(String message);

    void unknown_element(std::string_view tag);
    void unknown_macro(std::string_view name);
    void missing_field(std::string_view owner, std::string_view field);
    void invalid_field(std::string_view owner, std::string_view field, std::string_view value);

    [[nodiscard]] const std::vector<String>& entries() const { return m_entries; }
    [[nodiscard]] bool empty() const { return m_entries.empty(); }
    [[nodiscard]] usize size() const { return m_entries.size(); }

    [[nodiscard]] std::vector<String> take() { return std::move(m_entries); }

private:
    std::vector<String> m_entries;
};

} // namespace folio::parser
