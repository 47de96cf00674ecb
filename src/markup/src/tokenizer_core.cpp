/**
 * Markup Tokenizer - core driver and shared helpers
 */

#include "stencil/markup/tokenizer.hpp"
#include <algorithm>
#include <cctype>

namespace stencil::markup {

// ============================================================================
// Token helpers
// ============================================================================

std::optional<String> StartTagToken::get_attribute(const String& name) const {
    for (const auto& [attr_name, attr_value] : attributes) {
        if (attr_name == name) {
            return attr_value;
        }
    }
    return std::nullopt;
}

dom::SourcePosition token_position(const Token& token) {
    return std::visit([](const auto& t) { return t.position; }, token);
}

bool is_eof(const Token& token) {
    return std::holds_alternative<EndOfFileToken>(token);
}

// ============================================================================
// Tokenizer
// ============================================================================

Tokenizer::Tokenizer() = default;

void Tokenizer::set_input(const String& input) {
    m_input = input;
    m_position = 0;
    m_state = TokenizerState::Data;
    m_token_queue.clear();
    m_text.clear();

    m_line_starts.clear();
    m_line_starts.push_back(0);
    for (usize i = 0; i < m_input.length(); ++i) {
        if (m_input[i] == '\n') {
            m_line_starts.push_back(i + 1);
        }
    }
}

void Tokenizer::set_input(std::string_view input) {
    set_input(String(input));
}

std::optional<Token> Tokenizer::next_token() {
    while (m_token_queue.empty() && m_state != TokenizerState::Finished) {
        process_state();
    }

    if (!m_token_queue.empty()) {
        Token token = std::move(m_token_queue.front());
        m_token_queue.pop_front();
        return token;
    }

    return std::nullopt;
}

dom::SourcePosition Tokenizer::position_at(usize offset) const {
    if (m_line_starts.empty()) {
        return {1, offset + 1};
    }
    auto it = std::upper_bound(m_line_starts.begin(), m_line_starts.end(), offset);
    auto line_index = static_cast<usize>(std::distance(m_line_starts.begin(), it)) - 1;
    return {line_index + 1, offset - m_line_starts[line_index] + 1};
}

std::optional<char> Tokenizer::peek() const {
    if (m_position >= m_input.length()) {
        return std::nullopt;
    }
    return m_input[m_position];
}

char Tokenizer::consume() {
    if (m_position >= m_input.length()) {
        return 0;
    }
    return m_input[m_position++];
}

void Tokenizer::reconsume() {
    if (m_position > 0) {
        --m_position;
    }
}

bool Tokenizer::consume_if(char expected) {
    auto c = peek();
    if (c && *c == expected) {
        consume();
        return true;
    }
    return false;
}

bool Tokenizer::consume_if_match(std::string_view str, bool case_insensitive) {
    if (m_position + str.size() > m_input.length()) {
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
    m_token_queue.push_back(std::move(token));
}

void Tokenizer::flush_text() {
    if (m_text.empty()) {
        return;
    }
    emit(TextToken{m_text.build(), position_at(m_text_start)});
    m_text.clear();
}

void Tokenizer::emit_start_tag() {
    emit(std::move(m_start_tag));
    m_start_tag = StartTagToken{};
}

void Tokenizer::emit_end_tag() {
    emit(std::move(m_end_tag));
    m_end_tag = EndTagToken{};
}

void Tokenizer::begin_attribute() {
    m_attribute_name.clear();
    m_attribute_value.clear();
}

void Tokenizer::commit_attribute() {
    m_start_tag.attributes.emplace_back(m_attribute_name.build(), m_attribute_value.build());
    m_attribute_name.clear();
    m_attribute_value.clear();
}

void Tokenizer::parse_error(const String& message) {
    if (m_error_callback) {
        m_error_callback(message, position_at(m_position));
    }
}

void Tokenizer::consume_character_reference(StringBuilder& out) {
    usize start = m_position;

    if (consume_if('#')) {
        bool hex = consume_if('x') || consume_if('X');
        u32 value = 0;
        usize digits = 0;

        while (auto c = peek()) {
            auto uc = static_cast<unsigned char>(*c);
            if (hex ? std::isxdigit(uc) : std::isdigit(uc)) {
                consume();
                u32 digit = std::isdigit(uc) ? uc - '0' : (std::tolower(uc) - 'a' + 10);
                value = value * (hex ? 16 : 10) + digit;
                ++digits;
                if (value > 0x10FFFF) {
                    value = 0x110000;
                }
            } else {
                break;
            }
        }

        if (digits == 0 || !consume_if(';') || !unicode::is_xml_char(value)) {
            parse_error("invalid-character-reference"_s);
            out.append('&');
            out.append(std::string_view(m_input.data() + start, m_position - start));
            return;
        }

        out.append(static_cast<unicode::CodePoint>(value));
        return;
    }

    StringBuilder name;
    while (auto c = peek()) {
        if (!std::isalnum(static_cast<unsigned char>(*c)) || name.size() >= 8) {
            break;
        }
        name.append(consume());
    }

    if (!consume_if(';')) {
        parse_error("unterminated-entity-reference"_s);
        out.append('&');
        out.append(name.view());
        return;
    }

    auto entity = name.view();
    if (entity == "amp") {
        out.append('&');
    } else if (entity == "lt") {
        out.append('<');
    } else if (entity == "gt") {
        out.append('>');
    } else if (entity == "quot") {
        out.append('"');
    } else if (entity == "apos") {
        out.append('\'');
    } else {
        parse_error("unknown-entity"_s);
        out.append('&');
        out.append(entity);
        out.append(';');
    }
}

void Tokenizer::process_state() {
    switch (m_state) {
        case TokenizerState::Data: handle_data_state(); break;
        case TokenizerState::TagOpen: handle_tag_open_state(); break;
        case TokenizerState::EndTagOpen: handle_end_tag_open_state(); break;
        case TokenizerState::TagName: handle_tag_name_state(); break;
        case TokenizerState::EndTagName: handle_end_tag_name_state(); break;
        case TokenizerState::AfterEndTagName: handle_after_end_tag_name_state(); break;
        case TokenizerState::BeforeAttributeName: handle_before_attribute_name_state(); break;
        case TokenizerState::AttributeName: handle_attribute_name_state(); break;
        case TokenizerState::AfterAttributeName: handle_after_attribute_name_state(); break;
        case TokenizerState::BeforeAttributeValue: handle_before_attribute_value_state(); break;
        case TokenizerState::AttributeValueDoubleQuoted: handle_attribute_value_quoted_state('"'); break;
        case TokenizerState::AttributeValueSingleQuoted: handle_attribute_value_quoted_state('\''); break;
        case TokenizerState::AttributeValueUnquoted: handle_attribute_value_unquoted_state(); break;
        case TokenizerState::AfterAttributeValueQuoted: handle_after_attribute_value_quoted_state(); break;
        case TokenizerState::SelfClosingStartTag: handle_self_closing_start_tag_state(); break;
        case TokenizerState::MarkupDeclarationOpen: handle_markup_declaration_open_state(); break;
        case TokenizerState::Comment: handle_comment_state(); break;
        case TokenizerState::CDataSection: handle_cdata_section_state(); break;
        case TokenizerState::Doctype: handle_doctype_state(); break;
        case TokenizerState::BogusDeclaration: handle_bogus_declaration_state(); break;
        case TokenizerState::ProcessingInstruction: handle_processing_instruction_state(); break;
        case TokenizerState::Finished: break;
    }
}

} // namespace stencil::markup
