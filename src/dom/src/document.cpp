/**
 * Markup Document implementation
 */

#include "stencil/dom/document.hpp"

namespace stencil::dom {

namespace {

void collect_by_tag_name(const Node* node, const String& qualified_name, std::vector<Element*>& out) {
    for (const auto& child : node->child_nodes()) {
        if (child->is_element()) {
            auto* element = child->as_element();
            if (element->qualified_name() == qualified_name) {
                out.push_back(element);
            }
        }
        collect_by_tag_name(child.get(), qualified_name, out);
    }
}

} // namespace

Document::Document() {
    set_owner_document(this);
}

Element* Document::document_element() const {
    for (const auto& child : child_nodes()) {
        if (child->is_element()) {
            return child->as_element();
        }
    }
    return nullptr;
}

RefPtr<Element> Document::create_element(const String& qualified_name) {
    auto element = make_ref<Element>(qualified_name);
    element->set_owner_document(this);
    return element;
}

RefPtr<Text> Document::create_text_node(const String& data) {
    auto text = make_ref<Text>(data);
    text->set_owner_document(this);
    return text;
}

RefPtr<Comment> Document::create_comment(const String& data) {
    auto comment = make_ref<Comment>(data);
    comment->set_owner_document(this);
    return comment;
}

RefPtr<CDataSection> Document::create_cdata_section(const String& data) {
    auto section = make_ref<CDataSection>(data);
    section->set_owner_document(this);
    return section;
}

RefPtr<ProcessingInstruction> Document::create_processing_instruction(
    const String& target, const String& data) {
    auto pi = make_ref<ProcessingInstruction>(target, data);
    pi->set_owner_document(this);
    return pi;
}

std::vector<Element*> Document::get_elements_by_tag_name(const String& qualified_name) const {
    std::vector<Element*> result;
    collect_by_tag_name(this, qualified_name, result);
    return result;
}

} // namespace stencil::dom
