/**
 * Markup Element implementation
 */

#include "stencil/dom/element.hpp"
#include <algorithm>

namespace stencil::dom {

namespace {

void split_qualified_name(const String& qualified_name, String& prefix, String& local_name) {
    if (auto parts = qualified_name.split_once(':')) {
        prefix = std::move(parts->first);
        local_name = std::move(parts->second);
    } else {
        prefix = String();
        local_name = qualified_name;
    }
}

} // namespace

// ============================================================================
// Element
// ============================================================================

Element::Element(const String& qualified_name)
    : m_qualified_name(qualified_name)
{
    split_qualified_name(qualified_name, m_prefix, m_local_name);
}

std::optional<String> Element::namespace_uri() const {
    return lookup_namespace_uri(m_prefix);
}

std::optional<String> Element::lookup_namespace_uri(const String& prefix) const {
    String declaration = prefix.empty() ? "xmlns"_s : "xmlns:"_s + prefix;

    const Element* current = this;
    while (current) {
        if (auto uri = current->get_attribute(declaration)) {
            // xmlns="" undeclares the default namespace
            if (uri->empty()) {
                return std::nullopt;
            }
            return uri;
        }
        current = current->parent_element();
    }

    return std::nullopt;
}

bool Element::has_attribute(const String& name) const {
    return std::any_of(m_attributes.begin(), m_attributes.end(),
        [&name](const Attribute& attr) {
            return attr.name == name;
        });
}

std::optional<String> Element::get_attribute(const String& name) const {
    for (const auto& attr : m_attributes) {
        if (attr.name == name) {
            return attr.value;
        }
    }
    return std::nullopt;
}

void Element::set_attribute(const String& name, const String& value) {
    for (auto& attr : m_attributes) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }

    Attribute attr;
    attr.name = name;
    attr.value = value;
    split_qualified_name(name, attr.prefix, attr.local_name);
    m_attributes.push_back(std::move(attr));
}

void Element::remove_attribute(const String& name) {
    m_attributes.erase(
        std::remove_if(m_attributes.begin(), m_attributes.end(),
            [&name](const Attribute& attr) {
                return attr.name == name;
            }),
        m_attributes.end());
}

Element* Element::first_element_child() const {
    for (const auto& child : child_nodes()) {
        if (child->is_element()) {
            return child->as_element();
        }
    }
    return nullptr;
}

std::vector<Element*> Element::element_children() const {
    std::vector<Element*> result;
    for (const auto& child : child_nodes()) {
        if (child->is_element()) {
            result.push_back(child->as_element());
        }
    }
    return result;
}

u32 Element::child_element_count() const {
    u32 count = 0;
    for (const auto& child : child_nodes()) {
        if (child->is_element()) {
            ++count;
        }
    }
    return count;
}

} // namespace stencil::dom
