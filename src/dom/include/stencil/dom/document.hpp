#pragma once

#include "node.hpp"
#include "element.hpp"
#include "text.hpp"

namespace stencil::dom {

// ============================================================================
// Document - Root of a parsed markup tree
// ============================================================================

class Document : public Node {
public:
    Document();

    // Node interface
    [[nodiscard]] NodeType node_type() const override { return NodeType::Document; }
    [[nodiscard]] String node_name() const override { return "#document"_s; }

    [[nodiscard]] Element* document_element() const;

    // Name used when reporting positions (usually the file path)
    [[nodiscard]] const String& source_name() const { return m_source_name; }
    void set_source_name(const String& name) { m_source_name = name; }

    // Node creation
    [[nodiscard]] RefPtr<Element> create_element(const String& qualified_name);
    [[nodiscard]] RefPtr<Text> create_text_node(const String& data);
    [[nodiscard]] RefPtr<Comment> create_comment(const String& data);
    [[nodiscard]] RefPtr<CDataSection> create_cdata_section(const String& data);
    [[nodiscard]] RefPtr<ProcessingInstruction> create_processing_instruction(
        const String& target, const String& data);

    // Lookup
    [[nodiscard]] std::vector<Element*> get_elements_by_tag_name(const String& qualified_name) const;

private:
    String m_source_name;
};

} // namespace stencil::dom
