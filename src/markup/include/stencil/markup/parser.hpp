#pragma once

#include "tokenizer.hpp"
#include "stencil/dom/document.hpp"
#include <vector>

namespace stencil::markup {

// ============================================================================
// Parse errors and options
// ============================================================================

struct ParseError {
    String message;
    dom::SourcePosition position;
};

struct ParserOptions {
    // Name reported in diagnostics and stored on the document
    String source_name{"<input>"};
    // Keep <?target ...?> nodes other than the XML declaration
    bool keep_processing_instructions{false};
};

// ============================================================================
// Parser - Builds a well-formed markup tree from text
// ============================================================================

class Parser {
public:
    Parser();
    explicit Parser(ParserOptions options);

    // Parse a complete document; the first well-formedness error is returned
    [[nodiscard]] Result<RefPtr<dom::Document>, ParseError> parse(const String& markup);
    [[nodiscard]] Result<RefPtr<dom::Document>, ParseError> parse(std::string_view markup);

    [[nodiscard]] const std::vector<ParseError>& errors() const { return m_errors; }
    [[nodiscard]] const ParserOptions& options() const { return m_options; }

private:
    void on_parse_error(const String& message, dom::SourcePosition position);

    void process_start_tag(StartTagToken& token);
    void process_end_tag(const EndTagToken& token);
    void process_text(const TextToken& token);
    void process_cdata(const CDataToken& token);
    void process_comment(const CommentToken& token);
    void process_processing_instruction(const ProcessingInstructionToken& token);
    void process_end_of_file(const EndOfFileToken& token);

    [[nodiscard]] dom::Node& current_node();

    ParserOptions m_options;
    std::vector<ParseError> m_errors;
    RefPtr<dom::Document> m_document;
    std::vector<dom::Element*> m_open_elements;
};

// ============================================================================
// Convenience functions
// ============================================================================

[[nodiscard]] Result<RefPtr<dom::Document>, ParseError> parse_markup(
    std::string_view markup, const ParserOptions& options = {});

[[nodiscard]] String format_parse_error(const ParseError& error, const String& source_name);

} // namespace stencil::markup
