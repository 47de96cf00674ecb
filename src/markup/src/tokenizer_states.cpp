/**
 * Markup Tokenizer - state handlers
 */

#include "stencil/markup/tokenizer.hpp"

namespace stencil::markup {

using unicode::is_xml_name_char;
using unicode::is_xml_name_start;
using unicode::is_xml_whitespace;

void Tokenizer::handle_data_state() {
    auto c = peek();
    if (!c) {
        flush_text();
        emit(EndOfFileToken{position_at(m_position)});
        m_state = TokenizerState::Finished;
        return;
    }

    if (*c == '<') {
        flush_text();
        m_token_start = m_position;
        consume();
        m_state = TokenizerState::TagOpen;
        return;
    }

    if (m_text.empty()) {
        m_text_start = m_position;
    }

    consume();
    if (*c == '&') {
        consume_character_reference(m_text);
    } else {
        m_text.append(*c);
    }
}

void Tokenizer::handle_tag_open_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-before-tag-name"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (*c == '!') {
        consume();
        m_state = TokenizerState::MarkupDeclarationOpen;
    } else if (*c == '/') {
        consume();
        m_end_tag = EndTagToken{};
        m_end_tag.position = position_at(m_token_start);
        m_state = TokenizerState::EndTagOpen;
    } else if (*c == '?') {
        consume();
        m_buffer.clear();
        m_state = TokenizerState::ProcessingInstruction;
    } else if (is_xml_name_start(*c)) {
        m_start_tag = StartTagToken{};
        m_start_tag.position = position_at(m_token_start);
        m_state = TokenizerState::TagName;
    } else {
        parse_error("invalid-first-character-of-tag-name"_s);
        m_text_start = m_token_start;
        m_text.append('<');
        m_state = TokenizerState::Data;
    }
}

void Tokenizer::handle_end_tag_open_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-before-tag-name"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_xml_name_start(*c)) {
        m_state = TokenizerState::EndTagName;
    } else if (*c == '>') {
        consume();
        parse_error("missing-end-tag-name"_s);
        m_state = TokenizerState::Data;
    } else {
        parse_error("invalid-first-character-of-tag-name"_s);
        m_state = TokenizerState::BogusDeclaration;
    }
}

void Tokenizer::handle_tag_name_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    consume();

    if (is_xml_whitespace(*c)) {
        m_state = TokenizerState::BeforeAttributeName;
    } else if (*c == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_start_tag();
    } else if (is_xml_name_char(*c)) {
        m_start_tag.name.append(std::string_view(&*c, 1));
    } else {
        parse_error("invalid-character-in-tag-name"_s);
        m_start_tag.name.append(std::string_view(&*c, 1));
    }
}

void Tokenizer::handle_end_tag_name_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    consume();

    if (is_xml_whitespace(*c)) {
        m_state = TokenizerState::AfterEndTagName;
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_end_tag();
    } else {
        if (!is_xml_name_char(*c)) {
            parse_error("invalid-character-in-tag-name"_s);
        }
        m_end_tag.name.append(std::string_view(&*c, 1));
    }
}

void Tokenizer::handle_after_end_tag_name_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    consume();

    if (is_xml_whitespace(*c)) {
        // Ignore
    } else if (*c == '>') {
        m_state = TokenizerState::Data;
        emit_end_tag();
    } else {
        parse_error("unexpected-character-after-end-tag-name"_s);
    }
}

void Tokenizer::handle_before_attribute_name_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_xml_whitespace(*c)) {
        consume();
    } else if (*c == '/') {
        consume();
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*c == '>') {
        consume();
        m_state = TokenizerState::Data;
        emit_start_tag();
    } else if (is_xml_name_start(*c)) {
        begin_attribute();
        m_state = TokenizerState::AttributeName;
    } else {
        consume();
        parse_error("unexpected-character-in-tag"_s);
    }
}

void Tokenizer::handle_attribute_name_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_xml_whitespace(*c)) {
        consume();
        m_state = TokenizerState::AfterAttributeName;
    } else if (*c == '=') {
        consume();
        m_state = TokenizerState::BeforeAttributeValue;
    } else if (*c == '/' || *c == '>') {
        parse_error("attribute-without-value"_s);
        commit_attribute();
        m_state = TokenizerState::BeforeAttributeName;
    } else {
        consume();
        if (!is_xml_name_char(*c)) {
            parse_error("invalid-character-in-attribute-name"_s);
        }
        m_attribute_name.append(*c);
    }
}

void Tokenizer::handle_after_attribute_name_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_xml_whitespace(*c)) {
        consume();
    } else if (*c == '=') {
        consume();
        m_state = TokenizerState::BeforeAttributeValue;
    } else {
        parse_error("attribute-without-value"_s);
        commit_attribute();
        m_state = TokenizerState::BeforeAttributeName;
    }
}

void Tokenizer::handle_before_attribute_value_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_xml_whitespace(*c)) {
        consume();
    } else if (*c == '"') {
        consume();
        m_state = TokenizerState::AttributeValueDoubleQuoted;
    } else if (*c == '\'') {
        consume();
        m_state = TokenizerState::AttributeValueSingleQuoted;
    } else {
        parse_error("unquoted-attribute-value"_s);
        m_state = TokenizerState::AttributeValueUnquoted;
    }
}

void Tokenizer::handle_attribute_value_quoted_state(char quote) {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-attribute-value"_s);
        m_state = TokenizerState::Data;
        return;
    }

    consume();

    if (*c == quote) {
        commit_attribute();
        m_state = TokenizerState::AfterAttributeValueQuoted;
    } else if (*c == '&') {
        consume_character_reference(m_attribute_value);
    } else if (*c == '<') {
        parse_error("less-than-in-attribute-value"_s);
        m_attribute_value.append(*c);
    } else if (*c == '\t' || *c == '\n' || *c == '\r') {
        // Attribute value normalization
        m_attribute_value.append(' ');
    } else {
        m_attribute_value.append(*c);
    }
}

void Tokenizer::handle_attribute_value_unquoted_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_xml_whitespace(*c) || *c == '>' || *c == '/') {
        commit_attribute();
        m_state = TokenizerState::BeforeAttributeName;
        return;
    }

    consume();
    if (*c == '&') {
        consume_character_reference(m_attribute_value);
    } else {
        m_attribute_value.append(*c);
    }
}

void Tokenizer::handle_after_attribute_value_quoted_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_xml_whitespace(*c)) {
        consume();
        m_state = TokenizerState::BeforeAttributeName;
    } else if (*c == '/') {
        consume();
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (*c == '>') {
        consume();
        m_state = TokenizerState::Data;
        emit_start_tag();
    } else {
        parse_error("missing-whitespace-between-attributes"_s);
        m_state = TokenizerState::BeforeAttributeName;
    }
}

void Tokenizer::handle_self_closing_start_tag_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-tag"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (*c == '>') {
        consume();
        m_start_tag.self_closing = true;
        m_state = TokenizerState::Data;
        emit_start_tag();
    } else {
        parse_error("unexpected-solidus-in-tag"_s);
        m_state = TokenizerState::BeforeAttributeName;
    }
}

void Tokenizer::handle_markup_declaration_open_state() {
    m_buffer.clear();

    if (consume_if_match("--")) {
        m_state = TokenizerState::Comment;
    } else if (consume_if_match("[CDATA[")) {
        m_state = TokenizerState::CDataSection;
    } else if (consume_if_match("DOCTYPE", true)) {
        m_doctype_depth = 0;
        m_state = TokenizerState::Doctype;
    } else {
        parse_error("incorrectly-opened-comment"_s);
        m_state = TokenizerState::BogusDeclaration;
    }
}

void Tokenizer::handle_comment_state() {
    if (consume_if_match("-->")) {
        emit(CommentToken{m_buffer.build(), position_at(m_token_start)});
        m_buffer.clear();
        m_state = TokenizerState::Data;
        return;
    }

    if (!peek()) {
        parse_error("eof-in-comment"_s);
        m_state = TokenizerState::Data;
        return;
    }

    if (consume_if_match("--")) {
        parse_error("double-hyphen-in-comment"_s);
        m_buffer.append("--");
        return;
    }

    m_buffer.append(consume());
}

void Tokenizer::handle_cdata_section_state() {
    if (consume_if_match("]]>")) {
        emit(CDataToken{m_buffer.build(), position_at(m_token_start)});
        m_buffer.clear();
        m_state = TokenizerState::Data;
        return;
    }

    if (!peek()) {
        parse_error("eof-in-cdata"_s);
        m_state = TokenizerState::Data;
        return;
    }

    m_buffer.append(consume());
}

void Tokenizer::handle_doctype_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-in-doctype"_s);
        m_state = TokenizerState::Data;
        return;
    }

    consume();

    if (*c == '[') {
        ++m_doctype_depth;
    } else if (*c == ']' && m_doctype_depth > 0) {
        --m_doctype_depth;
    } else if (*c == '>' && m_doctype_depth == 0) {
        emit(DoctypeToken{m_buffer.build().trim(), position_at(m_token_start)});
        m_buffer.clear();
        m_state = TokenizerState::Data;
        return;
    }

    m_buffer.append(*c);
}

void Tokenizer::handle_bogus_declaration_state() {
    auto c = peek();
    if (!c) {
        m_state = TokenizerState::Data;
        return;
    }

    consume();
    if (*c == '>') {
        m_state = TokenizerState::Data;
    }
}

void Tokenizer::handle_processing_instruction_state() {
    if (consume_if_match("?>")) {
        auto content = m_buffer.build();
        m_buffer.clear();

        // <?target data?>: whitespace after the target separates; the data
        // itself is kept byte for byte, trailing whitespace included
        usize target_end = 0;
        while (target_end < content.length() && !is_xml_whitespace(content[target_end])) {
            ++target_end;
        }
        usize data_start = target_end;
        while (data_start < content.length() && is_xml_whitespace(content[data_start])) {
            ++data_start;
        }
        auto target = content.substring(0, target_end);
        auto data = content.substring(data_start);

        if (target.empty()) {
            parse_error("missing-processing-instruction-target"_s);
        } else {
            emit(ProcessingInstructionToken{target, data, position_at(m_token_start)});
        }
        m_state = TokenizerState::Data;
        return;
    }

    if (!peek()) {
        parse_error("eof-in-processing-instruction"_s);
        m_state = TokenizerState::Data;
        return;
    }

    m_buffer.append(consume());
}

} // namespace stencil::markup
