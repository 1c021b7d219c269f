#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace folio::markup {

// ============================================================================
// Token Types
// ============================================================================

struct TagToken {
    // Lowercased, used for matching
    String name;
    // As written in the input
    String source_name;
    std::vector<std::pair<String, String>> attributes;
    bool self_closing{false};
    bool is_end_tag{false};
    usize offset{0};

    [[nodiscard]] std::optional<String> get_attribute(const String& name) const;
};

struct CommentToken {
    String data;
};

// A run of character data with references already decoded. CDATA
// sections arrive as their own token with cdata set.
struct TextToken {
    String data;
    bool cdata{false};
};

struct EndOfFileToken {};

using Token = std::variant<
    TagToken,
    CommentToken,
    TextToken,
    EndOfFileToken
>;

[[nodiscard]] bool is_start_tag(const Token& token);
[[nodiscard]] bool is_end_tag(const Token& token);
[[nodiscard]] bool is_text(const Token& token);
[[nodiscard]] bool is_comment(const Token& token);
[[nodiscard]] bool is_eof(const Token& token);

// ============================================================================
// Tokenizer States
// ============================================================================

enum class TokenizerState {
    Data,
    TagOpen,
    EndTagOpen,
    TagName,
    BeforeAttributeName,
    AttributeName,
    AfterAttributeName,
    BeforeAttributeValue,
    AttributeValueDoubleQuoted,
    AttributeValueSingleQuoted,
    AttributeValueUnquoted,
    AfterAttributeValueQuoted,
    SelfClosingStartTag,
    MarkupDeclarationOpen,
    Comment,
    CDATASection,
    BogusComment,
};

// ============================================================================
// Tokenizer - forgiving XML-ish tokenizer for storage-format markup
// ============================================================================

// Works on bytes; multi-byte UTF-8 sequences pass through text and
// attribute values untouched. Irregular input is repaired and reported
// through the error callback, never rejected.
class Tokenizer {
public:
    using TokenCallback = std::function<void(Token)>;
    using ErrorCallback = std::function<void(const String& message)>;

    Tokenizer();

    void set_input(std::string_view input);

    void set_token_callback(TokenCallback callback) { m_token_callback = std::move(callback); }
    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }

    // Run to end of input, delivering tokens to the callback
    void run();

    // Pull interface, used when no token callback is set
    [[nodiscard]] std::optional<Token> next_token();

    [[nodiscard]] TokenizerState state() const { return m_state; }
    [[nodiscard]] usize position() const { return m_position; }

private:
    [[nodiscard]] std::optional<char> peek() const;
    char consume();
    void reconsume();
    bool consume_if_match(std::string_view str, bool case_insensitive = false);
    [[nodiscard]] bool at_end() const { return m_position >= m_input.size(); }

    void emit(Token token);
    void emit_text_char(char c);
    void flush_text();
    void emit_current_tag();
    void emit_eof();

    void parse_error(const String& message);

    void process_state();

    void handle_data_state();
    void handle_tag_open_state();
    void handle_end_tag_open_state();
    void handle_tag_name_state();
    void handle_before_attribute_name_state();
    void handle_attribute_name_state();
    void handle_after_attribute_name_state();
    void handle_before_attribute_value_state();
    void handle_attribute_value_quoted_state(char quote);
    void handle_attribute_value_unquoted_state();
    void handle_after_attribute_value_quoted_state();
    void handle_self_closing_start_tag_state();
    void handle_markup_declaration_open_state();
    void handle_comment_state();
    void handle_cdata_section_state();
    void handle_bogus_comment_state();

    // Decodes the reference following an already consumed '&'. Returns
    // nullopt, consuming nothing, when the text is not a reference.
    std::optional<String> consume_character_reference();

    void start_new_attribute();
    void finish_attribute();

    std::string_view m_input;
    usize m_position{0};
    usize m_tag_start{0};

    TokenizerState m_state{TokenizerState::Data};

    std::optional<TagToken> m_current_tag;
    StringBuilder m_text_buffer;
    String m_current_attribute_name;
    StringBuilder m_current_attribute_value;
    bool m_has_pending_attribute{false};

    TokenCallback m_token_callback;
    ErrorCallback m_error_callback;

    std::vector<Token> m_token_queue;
    usize m_queue_head{0};
    bool m_eof_emitted{false};
};

} // namespace folio::markup
