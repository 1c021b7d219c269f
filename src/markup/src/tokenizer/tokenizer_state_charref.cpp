/**
 * Markup Tokenizer - character reference handling
 */

#include "folio/markup/tokenizer.hpp"
#include <algorithm>
#include <array>

namespace folio::markup {

namespace {

struct NamedEntity {
    std::string_view name;
    unicode::CodePoint code_point;
};

// Sorted by name for binary search. Storage format carries the XML five
// plus the HTML entities editors commonly leave behind.
constexpr std::array<NamedEntity, 60> NAMED_ENTITIES = {{
    {"AElig", 0x00C6},
    {"Auml", 0x00C4},
    {"Ouml", 0x00D6},
    {"Uuml", 0x00DC},
    {"aacute", 0x00E1},
    {"aelig", 0x00E6},
    {"agrave", 0x00E0},
    {"amp", 0x0026},
    {"apos", 0x0027},
    {"auml", 0x00E4},
    {"bull", 0x2022},
    {"ccedil", 0x00E7},
    {"cent", 0x00A2},
    {"copy", 0x00A9},
    {"darr", 0x2193},
    {"deg", 0x00B0},
    {"divide", 0x00F7},
    {"eacute", 0x00E9},
    {"egrave", 0x00E8},
    {"emsp", 0x2003},
    {"ensp", 0x2002},
    {"euro", 0x20AC},
    {"frac12", 0x00BD},
    {"frac14", 0x00BC},
    {"frac34", 0x00BE},
    {"gt", 0x003E},
    {"harr", 0x2194},
    {"hellip", 0x2026},
    {"iexcl", 0x00A1},
    {"iquest", 0x00BF},
    {"laquo", 0x00AB},
    {"larr", 0x2190},
    {"ldquo", 0x201C},
    {"lsquo", 0x2018},
    {"lt", 0x003C},
    {"mdash", 0x2014},
    {"micro", 0x00B5},
    {"middot", 0x00B7},
    {"nbsp", 0x00A0},
    {"ndash", 0x2013},
    {"ntilde", 0x00F1},
    {"ouml", 0x00F6},
    {"para", 0x00B6},
    {"plusmn", 0x00B1},
    {"pound", 0x00A3},
    {"quot", 0x0022},
    {"raquo", 0x00BB},
    {"rarr", 0x2192},
    {"rdquo", 0x201D},
    {"reg", 0x00AE},
    {"rsquo", 0x2019},
    {"sect", 0x00A7},
    {"shy", 0x00AD},
    {"szlig", 0x00DF},
    {"thinsp", 0x2009},
    {"times", 0x00D7},
    {"trade", 0x2122},
    {"uarr", 0x2191},
    {"uuml", 0x00FC},
    {"yen", 0x00A5},
}};

std::optional<unicode::CodePoint> lookup_named_entity(std::string_view name) {
    auto it = std::lower_bound(NAMED_ENTITIES.begin(), NAMED_ENTITIES.end(), name,
        [](const NamedEntity& entity, std::string_view key) {
            return entity.name < key;
        });
    if (it != NAMED_ENTITIES.end() && it->name == name) {
        return it->code_point;
    }
    return std::nullopt;
}

inline int digit_value(char c, bool hex) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (hex && c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (hex && c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // anonymous namespace

std::optional<String> Tokenizer::consume_character_reference() {
    usize start = m_position;

    if (consume_if_match("#")) {
        bool hex = consume_if_match("x", true);
        u32 code = 0;
        usize digits = 0;
        bool overflow = false;

        while (auto c = peek()) {
            int value = digit_value(*c, hex);
            if (value < 0) {
                break;
            }
            consume();
            ++digits;
            code = code * (hex ? 16 : 10) + static_cast<u32>(value);
            if (code > 0x10FFFF) {
                overflow = true;
                code = 0x110000;
            }
        }

        if (digits == 0) {
            parse_error("absence_of_digits_in_numeric_character_reference"_s);
            m_position = start;
            return std::nullopt;
        }

        if (!consume_if_match(";")) {
            parse_error("missing_semicolon_after_character_reference"_s);
        }

        if (overflow || code == 0 || !unicode::is_valid(code)) {
            parse_error(String("invalid_character_reference:&") +
                        String(m_input.substr(start, m_position - start)));
            return String::from_code_point(unicode::REPLACEMENT_CHARACTER);
        }
        return String::from_code_point(static_cast<unicode::CodePoint>(code));
    }

    usize end = m_position;
    while (end < m_input.size() &&
           unicode::is_ascii_alphanumeric(static_cast<unsigned char>(m_input[end]))) {
        ++end;
    }

    // A bare ampersand is plain text
    if (end == m_position || end >= m_input.size() || m_input[end] != ';') {
        return std::nullopt;
    }

    auto name = m_input.substr(m_position, end - m_position);
    if (auto code_point = lookup_named_entity(name)) {
        m_position = end + 1;
        return String::from_code_point(*code_point);
    }

    parse_error(String("unknown_character_reference:") + String(name));
    return std::nullopt;
}

} // namespace folio::markup
