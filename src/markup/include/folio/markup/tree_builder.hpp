#pragma once

#include "element.hpp"
#include "tokenizer.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace folio::markup {

// ============================================================================
// MarkupError - input that cannot be turned into an element forest
// ============================================================================

enum class MarkupErrorKind : u8 {
    InvalidUtf8,
    NullCharacter,
    NestingTooDeep,
};

[[nodiscard]] std::string_view markup_error_kind_name(MarkupErrorKind kind);

struct MarkupError {
    MarkupErrorKind kind;
    String message;
    usize offset{0};
};

// ============================================================================
// TreeBuilder - Assembles tokens into an element forest
// ============================================================================

// No content model: a start tag opens an element, an end tag closes the
// nearest open element with the same name. Unclosed elements are closed
// implicitly and stray end tags are dropped, both reported through the
// error callback.
class TreeBuilder {
public:
    using ErrorCallback = std::function<void(const String& message)>;

    explicit TreeBuilder(usize max_depth = 512);

    void process_token(const Token& token);

    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }

    [[nodiscard]] bool finished() const { return m_finished; }
    [[nodiscard]] const std::optional<MarkupError>& fatal_error() const { return m_fatal_error; }

    // Top-level elements and text runs, valid once end of file was processed
    [[nodiscard]] Forest take_forest();

    [[nodiscard]] static bool is_void_element(std::string_view name);

private:
    void insert_element(const TagToken& token);
    void close_element(const TagToken& token);
    void insert_text(const TextToken& token);
    void finish();

    void append_to_current(Element element);
    void pop_current_element();
    [[nodiscard]] std::optional<usize> find_open_element(const String& name) const;

    void parse_error(const String& message);

    std::vector<Element> m_open_elements;
    Forest m_forest;
    usize m_max_depth;
    std::optional<MarkupError> m_fatal_error;
    bool m_finished{false};
    ErrorCallback m_error_callback;
};

} // namespace folio::markup
