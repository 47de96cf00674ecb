/**
 * Compiler driver: walks the markup tree, dispatching vocabulary elements
 * to their tag handlers and re-emitting everything else
 */

#include "stencil/compiler/compiler.hpp"
#include "stencil/core/logger.hpp"
#include "stencil/markup/parser.hpp"

namespace stencil::compiler {

namespace {

Logger& logger() {
    return logging::get("stencil.compiler");
}

} // namespace

Compiler::Compiler()
    : Compiler(CompilerOptions{})
{
}

Compiler::Compiler(CompilerOptions options)
    : m_options(std::move(options))
{
}

Compiler::~Compiler() = default;

void Compiler::register_vocabulary(const String& namespace_uri, HandlerFactory factory) {
    auto key = namespace_uri.std_string();
    if (m_vocabularies.contains(key)) {
        logger().warn_fmt("replacing tag library registered for {}", key);
    }
    m_vocabularies[key] = std::move(factory);

    auto cached = m_handlers.find(key);
    if (cached != m_handlers.end()) {
        // The old handler may be on the call stack; it lives until the pass ends
        m_retired_handlers.push_back(std::move(cached->second));
        m_handlers.erase(cached);
    }
}

bool Compiler::has_vocabulary(const String& namespace_uri) const {
    return m_vocabularies.contains(namespace_uri.std_string());
}

Result<String, CompileError> Compiler::compile(const dom::Document& document) {
    // A handler may compile a sub-document mid-pass. The nested pass gets its
    // own output buffer and shares the handler cache with the enclosing one.
    bool outermost = m_depth == 0;
    String enclosing_output = std::move(m_output);
    m_output.clear();

    ++m_depth;
    auto result = process_children(document);
    --m_depth;

    String output = std::move(m_output);
    m_output = std::move(enclosing_output);
    if (outermost) {
        m_handlers.clear();
        m_retired_handlers.clear();
    }

    if (!result) {
        auto error = std::move(result).error();
        if (error.source_name.empty()) {
            error.source_name = m_options.source_name;
        }
        logger().debug_fmt("{}: compilation failed: {}", m_options.source_name.view(), error.message.view());
        return make_error(std::move(error));
    }
    return output;
}

Result<String, CompileError> Compiler::compile(std::string_view markup) {
    markup::ParserOptions parser_options;
    parser_options.source_name = m_options.source_name;
    parser_options.keep_processing_instructions = true;

    auto document = markup::parse_markup(markup, parser_options);
    if (!document) {
        const auto& error = document.error();
        logger().debug_fmt("{}: markup rejected", m_options.source_name.view());
        return make_error(CompileError::malformed_markup(
            error.message, m_options.source_name, error.position));
    }
    return compile(*document.value());
}

Result<void, CompileError> Compiler::process(const dom::Node& node) {
    switch (node.node_type()) {
        case dom::NodeType::Element:
            return process_element(*node.as_element());

        case dom::NodeType::Text:
            emit_text(node.as_character_data()->data());
            return {};

        case dom::NodeType::CDataSection:
            write(node.as_character_data()->data());
            return {};

        case dom::NodeType::Comment:
            if (m_options.keep_comments) {
                write("<!--"_s + node.as_character_data()->data() + "-->"_s);
            }
            return {};

        case dom::NodeType::ProcessingInstruction: {
            const auto& data = node.as_character_data()->data();
            StringBuilder builder;
            builder.append("<?").append(node.node_name());
            if (!data.empty()) {
                builder.append(' ').append(data);
            }
            builder.append("?>");
            write(builder.build());
            return {};
        }

        case dom::NodeType::Document:
            return process_children(node);
    }
    return {};
}

void Compiler::write(const String& code) {
    m_output.append(code);
}

void Compiler::write(std::string_view code) {
    m_output.append(code);
}

Result<void, CompileError> Compiler::process_element(const dom::Element& element) {
    auto namespace_uri = element.namespace_uri();
    if (!namespace_uri || !is_vocabulary_uri(*namespace_uri)) {
        return emit_element(element);
    }

    auto* handler = handler_for(*namespace_uri);
    if (!handler) {
        return make_error(CompileError::unknown_namespace(element, *namespace_uri));
    }

    logger().trace_fmt("dispatching {} to {}", element.qualified_name().view(), handler->library_name().view());

    auto fragment = handler->dispatch(element);
    if (!fragment) {
        return make_error(std::move(fragment).error());
    }
    write(fragment.value());
    return {};
}

Result<void, CompileError> Compiler::process_children(const dom::Node& node) {
    for (const auto& child : node.child_nodes()) {
        auto result = process(*child);
        if (!result) {
            return result;
        }
    }
    return {};
}

Result<void, CompileError> Compiler::emit_element(const dom::Element& element) {
    StringBuilder builder;
    builder.append('<');
    builder.append(element.qualified_name());

    for (const auto& attribute : element.attributes()) {
        if (m_options.strip_vocabulary_declarations &&
            attribute.is_namespace_declaration() &&
            has_vocabulary(attribute.value)) {
            continue;
        }
        builder.append(' ');
        builder.append(attribute.name);
        builder.append("=\"");
        builder.append_escaped(attribute.value.view(), StringBuilder::Escape::Attribute);
        builder.append('"');
    }

    if (!element.has_children()) {
        builder.append("/>");
        write(builder.build());
        return {};
    }

    builder.append('>');
    write(builder.build());

    auto result = process_children(element);
    if (!result) {
        return result;
    }

    write("</"_s + element.qualified_name() + ">"_s);
    return {};
}

void Compiler::emit_text(const String& text) {
    if (!m_options.escape_text) {
        write(text);
        return;
    }
    StringBuilder builder;
    builder.append_escaped(text.view(), StringBuilder::Escape::Text);
    write(builder.build());
}

bool Compiler::is_vocabulary_uri(const String& namespace_uri) const {
    if (has_vocabulary(namespace_uri)) {
        return true;
    }
    return !m_options.vocabulary_uri_scheme.empty() &&
           namespace_uri.starts_with(m_options.vocabulary_uri_scheme);
}

TagHandler* Compiler::handler_for(const String& namespace_uri) {
    auto key = namespace_uri.std_string();

    auto cached = m_handlers.find(key);
    if (cached != m_handlers.end()) {
        return cached->second.get();
    }

    auto registered = m_vocabularies.find(key);
    if (registered == m_vocabularies.end()) {
        return nullptr;
    }

    // Copied: the factory may itself register vocabularies
    auto factory = registered->second;
    auto handler = factory(*this);
    if (!handler) {
        return nullptr;
    }

    logger().debug_fmt("created tag library {} for {}", handler->library_name().view(), key);
    auto* raw = handler.get();
    m_handlers.emplace(std::move(key), std::move(handler));
    return raw;
}

} // namespace stencil::compiler
