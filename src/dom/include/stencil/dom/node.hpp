#pragma once

#include "stencil/core/types.hpp"
#include "stencil/core/string.hpp"
#include <vector>

namespace stencil::dom {

// Forward declarations
class Document;
class Element;
class CharacterData;

// ============================================================================
// Node types (numbering follows the DOM spec)
// ============================================================================

enum class NodeType : u16 {
    Element = 1,
    Text = 3,
    CDataSection = 4,
    ProcessingInstruction = 7,
    Comment = 8,
    Document = 9,
};

// 1-based position of the construct that produced a node
struct SourcePosition {
    usize line{0};
    usize column{0};

    [[nodiscard]] bool is_known() const { return line != 0; }
};

// ============================================================================
// Node - Base class for all markup tree nodes
// ============================================================================

class Node : public RefCounted {
public:
    ~Node() override = default;

    // Type information
    [[nodiscard]] virtual NodeType node_type() const = 0;
    [[nodiscard]] virtual String node_name() const = 0;
    [[nodiscard]] virtual String node_value() const { return String(); }

    // Tree structure
    [[nodiscard]] Node* parent_node() const { return m_parent; }
    [[nodiscard]] Element* parent_element() const;
    [[nodiscard]] Node* first_child() const;
    [[nodiscard]] Node* last_child() const;

    [[nodiscard]] bool has_children() const { return !m_children.empty(); }
    [[nodiscard]] const std::vector<RefPtr<Node>>& child_nodes() const { return m_children; }

    // Document access
    [[nodiscard]] Document* owner_document() const { return m_owner_document; }

    // Tree manipulation (used while the tree is being built)
    RefPtr<Node> append_child(RefPtr<Node> child);
    RefPtr<Node> remove_child(RefPtr<Node> child);

    // Text content
    [[nodiscard]] virtual String text_content() const;

    // Source position
    [[nodiscard]] const SourcePosition& position() const { return m_position; }
    void set_position(SourcePosition position) { m_position = position; }

    [[nodiscard]] bool contains(const Node* other) const;

    // Type checking helpers
    [[nodiscard]] bool is_element() const { return node_type() == NodeType::Element; }
    [[nodiscard]] bool is_text() const { return node_type() == NodeType::Text; }
    [[nodiscard]] bool is_document() const { return node_type() == NodeType::Document; }
    [[nodiscard]] bool is_character_data() const;

    // Cast helpers
    [[nodiscard]] Element* as_element();
    [[nodiscard]] const Element* as_element() const;
    [[nodiscard]] const CharacterData* as_character_data() const;
    [[nodiscard]] Document* as_document();
    [[nodiscard]] const Document* as_document() const;

protected:
    Node() = default;

    void set_owner_document(Document* doc) { m_owner_document = doc; }

private:
    void adopt_subtree(Document* doc);

    Document* m_owner_document{nullptr};
    Node* m_parent{nullptr};
    std::vector<RefPtr<Node>> m_children;
    SourcePosition m_position;

    friend class Document;
};

} // namespace stencil::dom
