#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <ostream>

namespace folio {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

[[nodiscard]] constexpr bool is_ascii(CodePoint cp) {
    return cp <= 0x7F;
}

[[nodiscard]] constexpr bool is_ascii_alpha(CodePoint cp) {
    return (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z');
}

[[nodiscard]] constexpr bool is_ascii_digit(CodePoint cp) {
    return cp >= '0' && cp <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alphanumeric(CodePoint cp) {
    return is_ascii_alpha(cp) || is_ascii_digit(cp);
}

[[nodiscard]] constexpr bool is_ascii_whitespace(CodePoint cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f';
}

[[nodiscard]] constexpr bool is_ascii_hex_digit(CodePoint cp) {
    return is_ascii_digit(cp) ||
           (cp >= 'A' && cp <= 'F') ||
           (cp >= 'a' && cp <= 'f');
}

[[nodiscard]] constexpr bool is_ascii_upper(CodePoint cp) {
    return cp >= 'A' && cp <= 'Z';
}

[[nodiscard]] constexpr bool is_ascii_lower(CodePoint cp) {
    return cp >= 'a' && cp <= 'z';
}

[[nodiscard]] constexpr CodePoint to_ascii_lower(CodePoint cp) {
    if (is_ascii_upper(cp)) {
        return cp + ('a' - 'A');
    }
    return cp;
}

// UTF-8 encoding/decoding
struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
};

// Invalid or truncated sequences decode to REPLACEMENT_CHARACTER
[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);
[[nodiscard]] usize utf8_encode(CodePoint cp, char* buffer);
[[nodiscard]] usize utf8_code_point_length(char first_byte);

// Byte offset of the first malformed sequence, if any
[[nodiscard]] std::optional<usize> utf8_find_invalid(std::string_view data);

} // namespace unicode

// ============================================================================
// String - UTF-8 encoded string with utilities
// ============================================================================

class String {
public:
    using iterator = std::string::iterator;
    using const_iterator = std::string::const_iterator;

    String() = default;
    String(const char* str);
    String(const char* str, usize length);
    String(std::string str);
    String(std::string_view sv);
    String(usize count, char c);

    static String from_code_point(unicode::CodePoint cp);

    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }

    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(m_data);
    }

    [[nodiscard]] const std::string& std_string() const noexcept {
        return m_data;
    }

    [[nodiscard]] usize code_point_count() const;

    iterator begin() { return m_data.begin(); }
    iterator end() { return m_data.end(); }
    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }

    void append(const String& other);
    void append(std::string_view sv);
    void append(unicode::CodePoint cp);
    void clear() { m_data.clear(); }

    [[nodiscard]] String substring(usize start, usize length = std::string::npos) const;

    [[nodiscard]] std::optional<usize> find(const String& needle, usize start = 0) const;
    [[nodiscard]] std::optional<usize> find(char c, usize start = 0) const;
    [[nodiscard]] bool contains(const String& needle) const;
    [[nodiscard]] bool starts_with(const String& prefix) const;
    [[nodiscard]] bool ends_with(const String& suffix) const;

    // Only ASCII letters change case
    [[nodiscard]] String to_lowercase() const;
    [[nodiscard]] String trim() const;
    [[nodiscard]] String trim_start() const;
    [[nodiscard]] String trim_end() const;

    // True when the string is empty or holds only ASCII whitespace
    [[nodiscard]] bool is_blank() const;

    [[nodiscard]] std::vector<String> split(char delimiter) const;

    [[nodiscard]] bool equals_ignore_case(const String& other) const;

    [[nodiscard]] bool operator==(const String& other) const {
        return m_data == other.m_data;
    }

    [[nodiscard]] bool operator!=(const String& other) const {
        return m_data != other.m_data;
    }

    [[nodiscard]] bool operator<(const String& other) const {
        return m_data < other.m_data;
    }

    String operator+(const String& other) const;
    String& operator+=(const String& other);
    String& operator+=(std::string_view sv);
    String& operator+=(unicode::CodePoint cp);

    char& operator[](usize index) { return m_data[index]; }
    const char& operator[](usize index) const { return m_data[index]; }

private:
    std::string m_data;
};

inline String operator""_s(const char* str, std::size_t len) {
    return String(str, len);
}

inline std::ostream& operator<<(std::ostream& out, const String& str) {
    return out << str.view();
}

// ============================================================================
// StringBuilder - Efficient string building
// ============================================================================

class StringBuilder {
public:
    StringBuilder() = default;
    explicit StringBuilder(usize initial_capacity);

    StringBuilder& append(const String& str);
    StringBuilder& append(std::string_view sv);
    StringBuilder& append(const char* str);
    StringBuilder& append(char c);
    StringBuilder& append(unicode::CodePoint cp);
    StringBuilder& append(i64 value);
    StringBuilder& append(u64 value);
    StringBuilder& append(f64 value);

    // Each "{}" in the format is replaced by the next argument. Surplus
    // placeholders are kept literally, surplus arguments are dropped.
    template<typename... Args>
    StringBuilder& append_format(std::string_view format, const Args&... args) {
        return format_step(format, args...);
    }

    void clear() { m_buffer.clear(); }
    void reserve(usize capacity) { m_buffer.reserve(capacity); }

    [[nodiscard]] String build() const { return String(m_buffer); }
    [[nodiscard]] std::string_view view() const { return m_buffer; }
    [[nodiscard]] usize size() const { return m_buffer.size(); }
    [[nodiscard]] bool empty() const { return m_buffer.empty(); }

private:
    StringBuilder& format_step(std::string_view format) {
        return append(format);
    }

    template<typename T, typename... Rest>
    StringBuilder& format_step(std::string_view format, const T& first, const Rest&... rest) {
        auto pos = format.find("{}");
        if (pos == std::string_view::npos) {
            return append(format);
        }
        append(format.substr(0, pos));
        append_value(first);
        return format_step(format.substr(pos + 2), rest...);
    }

    template<typename T>
    void append_value(const T& value) {
        using V = std::decay_t<T>;
        if constexpr (std::is_same_v<V, String>) {
            append(value);
        } else if constexpr (std::is_same_v<V, bool>) {
            append(value ? "true" : "false");
        } else if constexpr (std::is_same_v<V, char>) {
            append(value);
        } else if constexpr (std::is_same_v<V, unicode::CodePoint>) {
            append(value);
        } else if constexpr (std::is_integral_v<V> && std::is_signed_v<V>) {
            append(static_cast<i64>(value));
        } else if constexpr (std::is_integral_v<V>) {
            append(static_cast<u64>(value));
        } else if constexpr (std::is_floating_point_v<V>) {
            append(static_cast<f64>(value));
        } else {
            append(std::string_view(value));
        }
    }

    std::string m_buffer;
};

} // namespace folio

namespace std {

template<>
struct hash<folio::String> {
    size_t operator()(const folio::String& str) const noexcept {
        return hash<string_view>{}(str.view());
    }
};

} // namespace std
