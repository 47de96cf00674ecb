/**
 * Markup Parser - builds a dom::Document from tokenizer output
 */

#include "stencil/markup/parser.hpp"
#include "stencil/core/logger.hpp"

namespace stencil::markup {

Parser::Parser() = default;

Parser::Parser(ParserOptions options)
    : m_options(std::move(options))
{
}

Result<RefPtr<dom::Document>, ParseError> Parser::parse(std::string_view markup) {
    return parse(String(markup));
}

Result<RefPtr<dom::Document>, ParseError> Parser::parse(const String& markup) {
    m_errors.clear();
    m_open_elements.clear();
    m_document = make_ref<dom::Document>();
    m_document->set_source_name(m_options.source_name);

    Tokenizer tokenizer;
    tokenizer.set_error_callback([this](const String& message, dom::SourcePosition position) {
        on_parse_error(message, position);
    });
    tokenizer.set_input(markup);

    while (m_errors.empty()) {
        auto token = tokenizer.next_token();
        if (!token) {
            break;
        }

        if (auto* start = std::get_if<StartTagToken>(&*token)) {
            process_start_tag(*start);
        } else if (auto* end = std::get_if<EndTagToken>(&*token)) {
            process_end_tag(*end);
        } else if (auto* text = std::get_if<TextToken>(&*token)) {
            process_text(*text);
        } else if (auto* cdata = std::get_if<CDataToken>(&*token)) {
            process_cdata(*cdata);
        } else if (auto* comment = std::get_if<CommentToken>(&*token)) {
            process_comment(*comment);
        } else if (auto* pi = std::get_if<ProcessingInstructionToken>(&*token)) {
            process_processing_instruction(*pi);
        } else if (auto* eof = std::get_if<EndOfFileToken>(&*token)) {
            process_end_of_file(*eof);
        }
        // Doctype declarations carry nothing the compiler uses
    }

    m_open_elements.clear();
    auto document = std::move(m_document);

    if (!m_errors.empty()) {
        logging::get("stencil.markup").debug_fmt("{}: parse failed with {} error(s)",
            m_options.source_name.std_string(), m_errors.size());
        return make_error(m_errors.front());
    }

    logging::get("stencil.markup").debug_fmt("{}: parsed {} top-level node(s)",
        m_options.source_name.std_string(), document->child_nodes().size());
    return document;
}

void Parser::on_parse_error(const String& message, dom::SourcePosition position) {
    m_errors.push_back(ParseError{message, position});
}

dom::Node& Parser::current_node() {
    if (m_open_elements.empty()) {
        return *m_document;
    }
    return *m_open_elements.back();
}

void Parser::process_start_tag(StartTagToken& token) {
    if (m_open_elements.empty() && m_document->document_element()) {
        on_parse_error("multiple-root-elements"_s, token.position);
        return;
    }

    auto element = m_document->create_element(token.name);
    element->set_position(token.position);

    for (auto& [name, value] : token.attributes) {
        if (element->has_attribute(name)) {
            on_parse_error("duplicate-attribute: "_s + name, token.position);
            return;
        }
        element->set_attribute(name, value);
    }

    current_node().append_child(element);

    if (!token.self_closing) {
        m_open_elements.push_back(element.get());
    }
}

void Parser::process_end_tag(const EndTagToken& token) {
    if (m_open_elements.empty()) {
        on_parse_error("unexpected-end-tag: </"_s + token.name + ">"_s, token.position);
        return;
    }

    auto* open = m_open_elements.back();
    if (open->qualified_name() != token.name) {
        on_parse_error("mismatched-end-tag: expected </"_s + open->qualified_name() +
                       ">, found </"_s + token.name + ">"_s, token.position);
        return;
    }

    m_open_elements.pop_back();
}

void Parser::process_text(const TextToken& token) {
    if (m_open_elements.empty()) {
        if (!token.data.is_whitespace()) {
            on_parse_error("text-outside-root-element"_s, token.position);
        }
        return;
    }

    auto text = m_document->create_text_node(token.data);
    text->set_position(token.position);
    current_node().append_child(text);
}

void Parser::process_cdata(const CDataToken& token) {
    if (m_open_elements.empty()) {
        on_parse_error("cdata-outside-root-element"_s, token.position);
        return;
    }

    auto section = m_document->create_cdata_section(token.data);
    section->set_position(token.position);
    current_node().append_child(section);
}

void Parser::process_comment(const CommentToken& token) {
    auto comment = m_document->create_comment(token.data);
    comment->set_position(token.position);
    current_node().append_child(comment);
}

void Parser::process_processing_instruction(const ProcessingInstructionToken& token) {
    if (token.target.equals_ignoring_ascii_case("xml")) {
        return;
    }
    if (!m_options.keep_processing_instructions) {
        return;
    }

    auto pi = m_document->create_processing_instruction(token.target, token.data);
    pi->set_position(token.position);
    current_node().append_child(pi);
}

void Parser::process_end_of_file(const EndOfFileToken& token) {
    if (!m_open_elements.empty()) {
        auto* open = m_open_elements.back();
        on_parse_error("unclosed-element: <"_s + open->qualified_name() + ">"_s, open->position());
        return;
    }

    if (!m_document->document_element()) {
        on_parse_error("missing-root-element"_s, token.position);
    }
}

// ============================================================================
// Convenience functions
// ============================================================================

Result<RefPtr<dom::Document>, ParseError> parse_markup(
    std::string_view markup, const ParserOptions& options) {
    Parser parser(options);
    return parser.parse(markup);
}

String format_parse_error(const ParseError& error, const String& source_name) {
    StringBuilder builder;
    builder.append(source_name);
    if (error.position.is_known()) {
        builder.append(':');
        builder.append(static_cast<u64>(error.position.line));
        builder.append(':');
        builder.append(static_cast<u64>(error.position.column));
    }
    builder.append(": ");
    builder.append(error.message);
    return builder.build();
}

} // namespace stencil::markup
