/**
 * Markup tree Node implementation
 */

#include "stencil/dom/node.hpp"
#include "stencil/dom/element.hpp"
#include "stencil/dom/document.hpp"
#include "stencil/dom/text.hpp"
#include <algorithm>

namespace stencil::dom {

Element* Node::parent_element() const {
    if (m_parent && m_parent->is_element()) {
        return m_parent->as_element();
    }
    return nullptr;
}

Node* Node::first_child() const {
    return m_children.empty() ? nullptr : m_children.front().get();
}

Node* Node::last_child() const {
    return m_children.empty() ? nullptr : m_children.back().get();
}

RefPtr<Node> Node::append_child(RefPtr<Node> child) {
    if (!child || child.get() == this || child->contains(this)) {
        return nullptr;
    }

    // Remove from previous parent
    if (child->m_parent) {
        child->m_parent->remove_child(child);
    }

    child->m_parent = this;
    child->adopt_subtree(m_owner_document);
    m_children.push_back(child);

    return child;
}

RefPtr<Node> Node::remove_child(RefPtr<Node> child) {
    if (!child || child->m_parent != this) {
        return nullptr;
    }

    auto it = std::find(m_children.begin(), m_children.end(), child);
    if (it != m_children.end()) {
        m_children.erase(it);
    }
    child->m_parent = nullptr;

    return child;
}

void Node::adopt_subtree(Document* doc) {
    m_owner_document = doc;
    for (const auto& child : m_children) {
        child->adopt_subtree(doc);
    }
}

String Node::text_content() const {
    StringBuilder builder;
    for (const auto& child : m_children) {
        builder.append(child->text_content());
    }
    return builder.build();
}

bool Node::contains(const Node* other) const {
    if (!other) return false;

    const Node* current = other;
    while (current) {
        if (current == this) return true;
        current = current->m_parent;
    }

    return false;
}

bool Node::is_character_data() const {
    switch (node_type()) {
        case NodeType::Text:
        case NodeType::CDataSection:
        case NodeType::Comment:
        case NodeType::ProcessingInstruction:
            return true;
        default:
            return false;
    }
}

Element* Node::as_element() {
    return is_element() ? static_cast<Element*>(this) : nullptr;
}

const Element* Node::as_element() const {
    return is_element() ? static_cast<const Element*>(this) : nullptr;
}

const CharacterData* Node::as_character_data() const {
    return is_character_data() ? static_cast<const CharacterData*>(this) : nullptr;
}

Document* Node::as_document() {
    return is_document() ? static_cast<Document*>(this) : nullptr;
}

const Document* Node::as_document() const {
    return is_document() ? static_cast<const Document*>(this) : nullptr;
}

} // namespace stencil::dom
