#pragma once

#include "diagnostics.hpp"
#include <optional>

namespace folio::parser {

// ============================================================================
// Field conversion
// ============================================================================

// Decimal integer with optional sign, surrounding whitespace allowed
[[nodiscard]] std::optional<i32> parse_integer(std::string_view value);

// "true" / "false", ASCII case-insensitive
[[nodiscard]] std::optional<bool> parse_boolean(std::string_view value);

// Converters for optional raw fields. Absent input yields an absent value
// silently; malformed input yields an absent value plus an invalid_field
// diagnostic against owner.field.
[[nodiscard]] std::optional<i32> integer_field(const std::optional<String>& raw,
    std::string_view owner, std::string_view field, Diagnostics& diagnostics);

[[nodiscard]] std::optional<bool> boolean_field(const std::optional<String>& raw,
    std::string_view owner, std::string_view field, Diagnostics& diagnostics);

} // namespace folio::parser
