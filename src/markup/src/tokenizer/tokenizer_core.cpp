/**
 * Markup Tokenizer - core driver and shared helpers
 */

#include "folio/markup/tokenizer.hpp"
#include <cctype>

namespace folio::markup {

std::optional<String> TagToken::get_attribute(const String& name) const {
    for (const auto& [attr_name, value] : attributes) {
        if (attr_name == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool is_start_tag(const Token& token) {
    auto* tag = std::get_if<TagToken>(&token);
    return tag && !tag->is_end_tag;
}

bool is_end_tag(const Token& token) {
    auto* tag = std::get_if<TagToken>(&token);
    return tag && tag->is_end_tag;
}

bool is_text(const Token& token) {
    return std::holds_alternative<TextToken>(token);
}

bool is_comment(const Token& token) {
    return std::holds_alternative<CommentToken>(token);
}

bool is_eof(const Token& token) {
    return std::holds_alternative<EndOfFileToken>(token);
}

Tokenizer::Tokenizer() = default;

void Tokenizer::set_input(std::string_view input) {
    m_input = input;
    m_position = 0;
    m_state = TokenizerState::Data;
    m_current_tag.reset();
    m_text_buffer.clear();
    m_token_queue.clear();
    m_queue_head = 0;
    m_eof_emitted = false;
}

void Tokenizer::run() {
    while (!m_eof_emitted) {
        process_state();
    }
}

std::optional<Token> Tokenizer::next_token() {
    while (m_queue_head >= m_token_queue.size() && !m_eof_emitted) {
        process_state();
    }

    if (m_queue_head < m_token_queue.size()) {
        Token token = std::move(m_token_queue[m_queue_head++]);
        if (m_queue_head == m_token_queue.size()) {
            m_token_queue.clear();
            m_queue_head = 0;
        }
        return token;
    }

    return std::nullopt;
}

std::optional<char> Tokenizer::peek() const {
    if (at_end()) {
        return std::nullopt;
    }
    return m_input[m_position];
}

char Tokenizer::consume() {
    if (at_end()) {
        return 0;
    }
    return m_input[m_position++];
}

void Tokenizer::reconsume() {
    if (m_position > 0) {
        --m_position;
    }
}

bool Tokenizer::consume_if_match(std::string_view str, bool case_insensitive) {
    if (m_position + str.size() > m_input.size()) {
        return false;
    }

    for (usize i = 0; i < str.size(); ++i) {
        auto c = static_cast<unsigned char>(m_input[m_position + i]);
        auto s = static_cast<unsigned char>(str[i]);
        if (case_insensitive) {
            if (std::tolower(c) != std::tolower(s)) {
                return false;
            }
        } else if (c != s) {
            return false;
        }
    }

    m_position += str.size();
    return true;
}

void Tokenizer::emit(Token token) {
    if (m_token_callback) {
        m_token_callback(std::move(token));
    } else {
        m_token_queue.push_back(std::move(token));
    }
}

void Tokenizer::emit_text_char(char c) {
    m_text_buffer.append(c);
}

void Tokenizer::flush_text() {
    if (m_text_buffer.empty()) {
        return;
    }
    emit(TextToken{m_text_buffer.build(), false});
    m_text_buffer.clear();
}

void Tokenizer::emit_current_tag() {
    if (!m_current_tag) {
        return;
    }
    finish_attribute();
    flush_text();
    emit(std::move(*m_current_tag));
    m_current_tag.reset();
}

void Tokenizer::emit_eof() {
    if (m_current_tag) {
        parse_error(String("eof_in_tag:") + m_current_tag->name);
        m_current_tag.reset();
        m_has_pending_attribute = false;
    }
    flush_text();
    emit(EndOfFileToken{});
    m_eof_emitted = true;
}

void Tokenizer::parse_error(const String& message) {
    if (m_error_callback) {
        m_error_callback(message);
    }
}

void Tokenizer::process_state() {
    switch (m_state) {
        case TokenizerState::Data:
            handle_data_state();
            break;
        case TokenizerState::TagOpen:
            handle_tag_open_state();
            break;
        case TokenizerState::EndTagOpen:
            handle_end_tag_open_state();
            break;
        case TokenizerState::TagName:
            handle_tag_name_state();
            break;
        case TokenizerState::BeforeAttributeName:
            handle_before_attribute_name_state();
            break;
        case TokenizerState::AttributeName:
            handle_attribute_name_state();
            break;
        case TokenizerState::AfterAttributeName:
            handle_after_attribute_name_state();
            break;
        case TokenizerState::BeforeAttributeValue:
            handle_before_attribute_value_state();
            break;
        case TokenizerState::AttributeValueDoubleQuoted:
            handle_attribute_value_quoted_state('"');
            break;
        case TokenizerState::AttributeValueSingleQuoted:
            handle_attribute_value_quoted_state('\'');
            break;
        case TokenizerState::AttributeValueUnquoted:
            handle_attribute_value_unquoted_state();
            break;
        case TokenizerState::AfterAttributeValueQuoted:
            handle_after_attribute_value_quoted_state();
            break;
        case TokenizerState::SelfClosingStartTag:
            handle_self_closing_start_tag_state();
            break;
        case TokenizerState::MarkupDeclarationOpen:
            handle_markup_declaration_open_state();
            break;
        case TokenizerState::Comment:
            handle_comment_state();
            break;
        case TokenizerState::CDATASection:
            handle_cdata_section_state();
            break;
        case TokenizerState::BogusComment:
            handle_bogus_comment_state();
            break;
    }
}

} // namespace folio::markup
