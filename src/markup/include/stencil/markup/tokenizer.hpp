#pragma once

#include "stencil/core/types.hpp"
#include "stencil/core/string.hpp"
#include "stencil/dom/node.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace stencil::markup {

// ============================================================================
// Markup Token Types
// ============================================================================

struct StartTagToken {
    String name;
    std::vector<std::pair<String, String>> attributes;
    bool self_closing{false};
    dom::SourcePosition position;

    [[nodiscard]] std::optional<String> get_attribute(const String& name) const;
};

struct EndTagToken {
    String name;
    dom::SourcePosition position;
};

struct TextToken {
    String data;
    dom::SourcePosition position;
};

struct CDataToken {
    String data;
    dom::SourcePosition position;
};

struct CommentToken {
    String data;
    dom::SourcePosition position;
};

struct ProcessingInstructionToken {
    String target;
    String data;
    dom::SourcePosition position;
};

struct DoctypeToken {
    String data;
    dom::SourcePosition position;
};

struct EndOfFileToken {
    dom::SourcePosition position;
};

using Token = std::variant<
    StartTagToken,
    EndTagToken,
    TextToken,
    CDataToken,
    CommentToken,
    ProcessingInstructionToken,
    DoctypeToken,
    EndOfFileToken
>;

[[nodiscard]] dom::SourcePosition token_position(const Token& token);
[[nodiscard]] bool is_eof(const Token& token);

// ============================================================================
// Tokenizer States
// ============================================================================

enum class TokenizerState {
    Data,
    TagOpen,
    EndTagOpen,
    TagName,
    EndTagName,
    AfterEndTagName,
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
    CDataSection,
    Doctype,
    BogusDeclaration,
    ProcessingInstruction,
    Finished,
};

// ============================================================================
// Tokenizer - XML-style markup tokenizer
// ============================================================================

class Tokenizer {
public:
    using ErrorCallback = std::function<void(const String& message, dom::SourcePosition position)>;

    Tokenizer();

    // Set input
    void set_input(const String& input);
    void set_input(std::string_view input);

    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }

    // Get next token; returns nullopt once the end-of-file token was handed out
    [[nodiscard]] std::optional<Token> next_token();

    [[nodiscard]] TokenizerState state() const { return m_state; }

    // Line/column for a byte offset into the input
    [[nodiscard]] dom::SourcePosition position_at(usize offset) const;

private:
    // Character consumption
    [[nodiscard]] std::optional<char> peek() const;
    char consume();
    void reconsume();
    bool consume_if(char expected);
    bool consume_if_match(std::string_view str, bool case_insensitive = false);

    // Token emission
    void emit(Token token);
    void flush_text();
    void emit_start_tag();
    void emit_end_tag();
    void begin_attribute();
    void commit_attribute();

    // Error reporting
    void parse_error(const String& message);

    // Character references (&amp; &#60; &#x3C;), called after '&'
    void consume_character_reference(StringBuilder& out);

    // State machine
    void process_state();

    void handle_data_state();
    void handle_tag_open_state();
    void handle_end_tag_open_state();
    void handle_tag_name_state();
    void handle_end_tag_name_state();
    void handle_after_end_tag_name_state();
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
    void handle_doctype_state();
    void handle_bogus_declaration_state();
    void handle_processing_instruction_state();

    String m_input;
    usize m_position{0};
    std::vector<usize> m_line_starts;
    TokenizerState m_state{TokenizerState::Data};
    std::deque<Token> m_token_queue;
    ErrorCallback m_error_callback;

    // Construct being assembled
    usize m_token_start{0};
    StringBuilder m_text;
    usize m_text_start{0};
    StartTagToken m_start_tag;
    EndTagToken m_end_tag;
    StringBuilder m_attribute_name;
    StringBuilder m_attribute_value;
    StringBuilder m_buffer;
    usize m_doctype_depth{0};
};

} // namespace stencil::markup
