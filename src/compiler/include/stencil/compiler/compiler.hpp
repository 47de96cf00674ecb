#pragma once

#include "error.hpp"
#include "options.hpp"
#include "tag_handler.hpp"
#include "stencil/dom/document.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stencil::compiler {

// ============================================================================
// Compiler - Walks a markup tree and collects generated code
// ============================================================================

class Compiler {
public:
    using HandlerFactory = std::function<std::unique_ptr<TagHandler>(Compiler&)>;

    Compiler();
    explicit Compiler(CompilerOptions options);
    ~Compiler();

    Compiler(const Compiler&) = delete;
    Compiler& operator=(const Compiler&) = delete;

    // Vocabularies are keyed by namespace URI; registering a URI again replaces it.
    // Safe from inside a handler: the replaced handler is kept until the pass ends.
    void register_vocabulary(const String& namespace_uri, HandlerFactory factory);

    template<typename Handler>
    void register_vocabulary(const String& namespace_uri) {
        register_vocabulary(namespace_uri, [](Compiler& compiler) -> std::unique_ptr<TagHandler> {
            return std::make_unique<Handler>(compiler);
        });
    }

    [[nodiscard]] bool has_vocabulary(const String& namespace_uri) const;

    // Compile a whole document. On error the partial output is discarded.
    // Called from a handler, compiles into a separate buffer and leaves the
    // enclosing output untouched.
    [[nodiscard]] Result<String, CompileError> compile(const dom::Document& document);
    [[nodiscard]] Result<String, CompileError> compile(std::string_view markup);

    // Re-entry point for tag handlers: compile one node and its subtree
    [[nodiscard]] Result<void, CompileError> process(const dom::Node& node);

    // Output buffer
    void write(const String& code);
    void write(std::string_view code);
    void write(const char* code) { write(std::string_view(code)); }
    [[nodiscard]] const String& output() const { return m_output; }

    [[nodiscard]] const CompilerOptions& options() const { return m_options; }

private:
    [[nodiscard]] Result<void, CompileError> process_element(const dom::Element& element);
    [[nodiscard]] Result<void, CompileError> process_children(const dom::Node& node);
    [[nodiscard]] Result<void, CompileError> emit_element(const dom::Element& element);
    void emit_text(const String& text);

    [[nodiscard]] bool is_vocabulary_uri(const String& namespace_uri) const;
    [[nodiscard]] TagHandler* handler_for(const String& namespace_uri);

    CompilerOptions m_options;
    String m_output;
    std::unordered_map<std::string, HandlerFactory> m_vocabularies;
    // Instances live for one outermost compile() call
    std::unordered_map<std::string, std::unique_ptr<TagHandler>> m_handlers;
    std::vector<std::unique_ptr<TagHandler>> m_retired_handlers;
    usize m_depth{0};
};

} // namespace stencil::compiler
