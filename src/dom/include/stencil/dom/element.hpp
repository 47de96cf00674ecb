#pragma once

#include "node.hpp"
#include <optional>

namespace stencil::dom {

// ============================================================================
// Attribute
// ============================================================================

struct Attribute {
    String name;
    String value;
    String prefix;
    String local_name;

    // xmlns="..." or xmlns:prefix="..."
    [[nodiscard]] bool is_namespace_declaration() const {
        return name == "xmlns"_s || prefix == "xmlns"_s;
    }
};

// ============================================================================
// Element - A markup element with a qualified name
// ============================================================================

class Element : public Node {
public:
    explicit Element(const String& qualified_name);

    // Node interface
    [[nodiscard]] NodeType node_type() const override { return NodeType::Element; }
    [[nodiscard]] String node_name() const override { return m_qualified_name; }

    // Names: "prefix:local" splits at the first ':'
    [[nodiscard]] const String& qualified_name() const { return m_qualified_name; }
    [[nodiscard]] const String& prefix() const { return m_prefix; }
    [[nodiscard]] const String& local_name() const { return m_local_name; }
    [[nodiscard]] bool has_prefix() const { return !m_prefix.empty(); }

    // Namespace URI bound to this element's prefix, if any declaration is in scope
    [[nodiscard]] std::optional<String> namespace_uri() const;
    [[nodiscard]] std::optional<String> lookup_namespace_uri(const String& prefix) const;

    // Attributes (names are case-sensitive)
    [[nodiscard]] bool has_attribute(const String& name) const;
    [[nodiscard]] std::optional<String> get_attribute(const String& name) const;
    void set_attribute(const String& name, const String& value);
    void remove_attribute(const String& name);

    [[nodiscard]] const std::vector<Attribute>& attributes() const { return m_attributes; }
    [[nodiscard]] bool has_attributes() const { return !m_attributes.empty(); }

    // Element traversal
    [[nodiscard]] Element* first_element_child() const;
    [[nodiscard]] std::vector<Element*> element_children() const;
    [[nodiscard]] u32 child_element_count() const;

private:
    String m_qualified_name;
    String m_prefix;
    String m_local_name;
    std::vector<Attribute> m_attributes;
};

} // namespace stencil::dom
