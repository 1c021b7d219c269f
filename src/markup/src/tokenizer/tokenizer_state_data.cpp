/**
 * Markup Tokenizer - data, comment and CDATA states
 */

#include "folio/markup/tokenizer.hpp"

namespace folio::markup {

void Tokenizer::handle_data_state() {
    auto c = peek();
    if (!c) {
        emit_eof();
        return;
    }

    consume();

    if (*c == '<') {
        m_tag_start = m_position - 1;
        m_state = TokenizerState::TagOpen;
    } else if (*c == '&') {
        if (auto decoded = consume_character_reference()) {
            m_text_buffer.append(*decoded);
        } else {
            emit_text_char('&');
        }
    } else {
        emit_text_char(*c);
    }
}

void Tokenizer::handle_markup_declaration_open_state() {
    if (consume_if_match("--")) {
        m_state = TokenizerState::Comment;
    } else if (consume_if_match("[CDATA[")) {
        m_state = TokenizerState::CDATASection;
    } else if (consume_if_match("DOCTYPE", true)) {
        m_state = TokenizerState::BogusComment;
    } else {
        parse_error("incorrectly_opened_comment"_s);
        m_state = TokenizerState::BogusComment;
    }
}

void Tokenizer::handle_comment_state() {
    auto end = m_input.find("-->", m_position);
    CommentToken comment;
    if (end == std::string_view::npos) {
        parse_error("eof_in_comment"_s);
        comment.data = String(m_input.substr(m_position));
        m_position = m_input.size();
    } else {
        comment.data = String(m_input.substr(m_position, end - m_position));
        m_position = end + 3;
    }
    flush_text();
    emit(std::move(comment));
    m_state = TokenizerState::Data;
}

void Tokenizer::handle_cdata_section_state() {
    auto end = m_input.find("]]>", m_position);
    TextToken text;
    text.cdata = true;
    if (end == std::string_view::npos) {
        parse_error("eof_in_cdata"_s);
        text.data = String(m_input.substr(m_position));
        m_position = m_input.size();
    } else {
        text.data = String(m_input.substr(m_position, end - m_position));
        m_position = end + 3;
    }
    flush_text();
    emit(std::move(text));
    m_state = TokenizerState::Data;
}

// Also covers <?...?> processing instructions and <!DOCTYPE ...>
void Tokenizer::handle_bogus_comment_state() {
    auto end = m_input.find('>', m_position);
    CommentToken comment;
    if (end == std::string_view::npos) {
        comment.data = String(m_input.substr(m_position));
        m_position = m_input.size();
    } else {
        comment.data = String(m_input.substr(m_position, end - m_position));
        m_position = end + 1;
    }
    flush_text();
    emit(std::move(comment));
    m_state = TokenizerState::Data;
}

} // namespace folio::markup
