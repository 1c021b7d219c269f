#include "folio/parser/fields.hpp"
#include <limits>

namespace folio::parser {

std::optional<i32> parse_integer(std::string_view value) {
    auto text = String(value).trim();
    auto digits = text.view();
    if (digits.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (digits.front() == '+' || digits.front() == '-') {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    i64 result = 0;
    for (char c : digits) {
        if (!unicode::is_ascii_digit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        result = result * 10 + (c - '0');
        if (result > static_cast<i64>(std::numeric_limits<i32>::max()) + 1) {
            return std::nullopt;
        }
    }

    if (negative) {
        result = -result;
    }
    if (result > std::numeric_limits<i32>::max() || result < std::numeric_limits<i32>::min()) {
        return std::nullopt;
    }
    return static_cast<i32>(result);
}

std::optional<bool> parse_boolean(std::string_view value) {
    auto text = String(value).trim().to_lowercase();
    if (text == "true"_s) {
        return true;
    }
    if (text == "false"_s) {
        return false;
    }
    return std::nullopt;
}

std::optional<i32> integer_field(const std::optional<String>& raw,
    std::string_view owner, std::string_view field, Diagnostics& diagnostics) {
    if (!raw) {
        return std::nullopt;
    }
    auto value = parse_integer(raw->view());
    if (!value) {
        diagnostics.invalid_field(owner, field, raw->view());
    }
    return value;
}

std::optional<bool> boolean_field(const std::optional<String>& raw,
    std::string_view owner, std::string_view field, Diagnostics& diagnostics) {
    if (!raw) {
        return std::nullopt;
    }
    auto value = parse_boolean(raw->view());
    if (!value) {
        diagnostics.invalid_field(owner, field, raw->view());
    }
    return value;
}

} // namespace folio::parser
