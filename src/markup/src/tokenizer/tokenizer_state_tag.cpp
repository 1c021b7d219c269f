/**
 * Markup Tokenizer - tag and attribute states
 */

#include "folio/markup/tokenizer.hpp"
#include <cctype>

namespace folio::markup {

namespace {

inline bool is_whitespace(char c) {
    return c == '\t' || c == '\n' || c == '\f' || c == '\r' || c == ' ';
}

inline bool is_name_start(char c) {
    return unicode::is_ascii_alpha(static_cast<unsigned char>(c)) || c == '_';
}

inline void append_lowercase(String& target, char c) {
    char lowered = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    target.append(std::string_view(&lowered, 1));
}

} // anonymous namespace

void Tokenizer::handle_tag_open_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof_before_tag_name"_s);
        emit_text_char('<');
        emit_eof();
        return;
    }

    consume();

    if (*c == '!') {
        m_state = TokenizerState::MarkupDeclarationOpen;
    } else if (*c == '/') {
        m_state = TokenizerState::EndTagOpen;
    } else if (is_name_start(*c)) {
        m_current_tag = TagToken{};
        m_current_tag->offset = m_tag_start;
        reconsume();
        m_state = TokenizerState::TagName;
    } else if (*c == '?') {
        m_state = TokenizerState::BogusComment;
    } else {
        parse_error("invalid_first_character_of_tag_name"_s);
        emit_text_char('<');
        reconsume();
        m_state = TokenizerState::Data;
    }
}

void Tokenizer::handle_end_tag_open_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof_before_tag_name"_s);
        emit_text_char('<');
        emit_text_char('/');
        emit_eof();
        return;
    }

    consume();

    if (is_name_start(*c)) {
        m_current_tag = TagToken{};
        m_current_tag->is_end_tag = true;
        m_current_tag->offset = m_tag_start;
        reconsume();
        m_state = TokenizerState::TagName;
    } else if (*c == '>') {
        parse_error("missing_end_tag_name"_s);
        m_state = TokenizerState::Data;
    } else {
        parse_error("invalid_first_character_of_tag_name"_s);
        reconsume();
        m_state = TokenizerState::BogusComment;
    }
}

void Tokenizer::handle_tag_name_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (is_whitespace(*c)) {
        m_state = TokenizerState::BeforeAttributeName;
    } else if (*c == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        append_lowercase(m_current_tag->name, *c);
        m_current_tag->source_name.append(std::string_view(&*c, 1));
    }
}

void Tokenizer::handle_before_attribute_name_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (is_whitespace(*c)) {
        // Ignore
    } else if (*c == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else if (*c == '=') {
        parse_error("unexpected_equals_sign_before_attribute_name"_s);
    } else {
        start_new_attribute();
        reconsume();
        m_state = TokenizerState::AttributeName;
    }
}

void Tokenizer::handle_attribute_name_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (is_whitespace(*c)) {
        m_state = TokenizerState::AfterAttributeName;
    } else if (*c == '/' || *c == '>') {
        reconsume();
        m_state = TokenizerState::AfterAttributeName;
    } else if (*c == '=') {
        m_state = TokenizerState::BeforeAttributeValue;
    } else {
        append_lowercase(m_current_attribute_name, *c);
    }
}

void Tokenizer::handle_after_attribute_name_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (is_whitespace(*c)) {
        // Ignore
    } else if (*c == '/') {
        finish_attribute();
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*c == '=') {
        m_state = TokenizerState::BeforeAttributeValue;
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        finish_attribute();
        start_new_attribute();
        reconsume();
        m_state = TokenizerState::AttributeName;
    }
}

void Tokenizer::handle_before_attribute_value_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (is_whitespace(*c)) {
        // Ignore
    } else if (*c == '"') {
        m_state = TokenizerState::AttributeValueDoubleQuoted;
    } else if (*c == '\'') {
        m_state = TokenizerState::AttributeValueSingleQuoted;
    } else if (*c == '>') {
        parse_error("missing_attribute_value"_s);
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        reconsume();
        m_state = TokenizerState::AttributeValueUnquoted;
    }
}

void Tokenizer::handle_attribute_value_quoted_state(char quote) {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (*c == quote) {
        finish_attribute();
        m_state = TokenizerState::AfterAttributeValueQuoted;
    } else if (*c == '&') {
        if (auto decoded = consume_character_reference()) {
            m_current_attribute_value.append(*decoded);
        } else {
            m_current_attribute_value.append('&');
        }
    } else {
        m_current_attribute_value.append(*c);
    }
}

void Tokenizer::handle_attribute_value_unquoted_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (is_whitespace(*c)) {
        finish_attribute();
        m_state = TokenizerState::BeforeAttributeName;
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else if (*c == '&') {
        if (auto decoded = consume_character_reference()) {
            m_current_attribute_value.append(*decoded);
        } else {
            m_current_attribute_value.append('&');
        }
    } else {
        m_current_attribute_value.append(*c);
    }
}

void Tokenizer::handle_after_attribute_value_quoted_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (is_whitespace(*c)) {
        m_state = TokenizerState::BeforeAttributeName;
    } else if (*c == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        parse_error("missing_whitespace_between_attributes"_s);
        reconsume();
        m_state = TokenizerState::BeforeAttributeName;
    }
}

void Tokenizer::handle_self_closing_start_tag_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (*c == '>') {
        m_current_tag->self_closing = true;
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        parse_error("unexpected_solidus_in_tag"_s);
        reconsume();
        m_state = TokenizerState::BeforeAttributeName;
    }
}

void Tokenizer::start_new_attribute() {
    m_current_attribute_name.clear();
    m_current_attribute_value.clear();
    m_has_pending_attribute = true;
}

void Tokenizer::finish_attribute() {
    if (!m_has_pending_attribute || !m_current_tag) {
        return;
    }
    m_has_pending_attribute = false;

    if (m_current_tag->get_attribute(m_current_attribute_name)) {
        parse_error(String("duplicate_attribute:") + m_current_attribute_name);
        return;
    }
    m_current_tag->attributes.emplace_back(m_current_attribute_name,
                                           m_current_attribute_value.build());
}

} // namespace folio::markup
