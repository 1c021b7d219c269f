#include "folio/parser/diagnostics.hpp"
#include "folio/core/logger.hpp"

namespace folio::parser {

void Diagnostics::record(String message) {
    logging::get("folio.dispatch").debug_fmt("degraded: {}", message);
    m_entries.push_back(std::move(message));
}

void Diagnostics::unknown_element(std::string_view tag) {
    StringBuilder builder;
    builder.append_format("unknown_element:{}", tag);
    record(builder.build());
}

void Diagnostics::unknown_macro(std::string_view name) {
    StringBuilder builder;
    builder.append_format("unknown_macro:{}", name);
    record(builder.build());
}

void Diagnostics::missing_field(std::string_view owner, std::string_view field) {
    StringBuilder builder;
    builder.append_format("missing_field:{}.{}", owner, field);
    record(builder.build());
}

void Diagnostics::invalid_field(std::string_view owner, std::string_view field, std::string_view value) {
    StringBuilder builder;
    builder.append_format("invalid_field:{}.{}:{}", owner, field, value);
    record(builder.build());
}

} // namespace folio::parser
