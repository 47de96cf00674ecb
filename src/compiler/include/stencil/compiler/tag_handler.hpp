#pragma once

#include "arguments.hpp"
#include "attribute_value.hpp"
#include "error.hpp"
#include "stencil/dom/element.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stencil::compiler {

class Compiler;

// Generated code for one element, or the error that aborts the pass
using TagResult = Result<String, CompileError>;

// ============================================================================
// TagHandler - Base contract for tag vocabularies
// ============================================================================

class TagHandler {
public:
    explicit TagHandler(Compiler& compiler);
    virtual ~TagHandler() = default;

    TagHandler(const TagHandler&) = delete;
    TagHandler& operator=(const TagHandler&) = delete;

    /**
     * Handles an element named <prefix:tag />.
     *
     * Looks for a registered tag "tag" first, then "_tag". Fails with
     * UnresolvedHandler when neither exists, and with
     * ReservedMethodInvocation when the resolved name starts with "__" or is
     * part of this base contract. The handler's result is passed through.
     */
    [[nodiscard]] TagResult dispatch(const dom::Element& element);

    // Vocabulary name used in diagnostics
    [[nodiscard]] virtual String library_name() const = 0;

    [[nodiscard]] static bool is_reserved_name(std::string_view name);
    [[nodiscard]] static bool is_base_contract_name(std::string_view name);

    // Everything after the first ':' (the whole name when there is none)
    [[nodiscard]] static String local_name_of(const String& qualified_name);

protected:
    // Resolution hooks, implemented by TagLibrary<Derived>
    [[nodiscard]] virtual bool has_tag(std::string_view name) const = 0;
    [[nodiscard]] virtual TagResult invoke_tag(std::string_view name, const dom::Element& element) = 0;

    [[nodiscard]] Compiler& compiler() const { return m_compiler; }

    // Hands each child of element, in document order, back to the compiler
    [[nodiscard]] Result<void, CompileError> process(const dom::Element& element);

    // Quoting rule
    [[nodiscard]] static std::optional<String> quote(const std::optional<String>& value);
    [[nodiscard]] static bool needs_quote(const String& value);

    // Attribute extraction
    [[nodiscard]] Result<String, CompileError> required_attr(
        const dom::Element& element, const String& name, bool quote_value = true) const;

    [[nodiscard]] std::optional<String> get_attr(
        const dom::Element& element, const String& name,
        const std::optional<String>& default_value = std::nullopt) const;

    [[nodiscard]] std::optional<String> get_unquoted_attr(
        const dom::Element& element, const String& name,
        const std::optional<String>& default_value = std::nullopt) const;

    [[nodiscard]] Result<bool, CompileError> get_boolean_attr(
        const dom::Element& element, const String& name, bool default_value = false) const;

    // Attribute collection
    [[nodiscard]] AttributeMap get_attributes(
        const dom::Element& element, const AttributeSpec& spec) const;

    [[nodiscard]] String get_attribute_string(
        const dom::Element& element, const AttributeSpec& spec) const;

    [[nodiscard]] static String get_attribute_string(const AttributeMap& attributes);

    // Argument lists
    [[nodiscard]] static String arg_list(std::vector<Argument> args, bool prune_tail = true);

private:
    Compiler& m_compiler;
};

// ============================================================================
// TagTable - Tag name -> member function registry, built once per type
// ============================================================================

template<typename Derived>
class TagTable {
public:
    using Method = TagResult (Derived::*)(const dom::Element&);

    TagTable& add(std::string_view name, Method method) {
        m_methods[std::string(name)] = method;
        return *this;
    }

    [[nodiscard]] Method find(std::string_view name) const {
        auto it = m_methods.find(std::string(name));
        return it != m_methods.end() ? it->second : nullptr;
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        return find(name) != nullptr;
    }

    [[nodiscard]] usize size() const { return m_methods.size(); }

    [[nodiscard]] std::vector<String> names() const {
        std::vector<String> result;
        result.reserve(m_methods.size());
        for (const auto& [name, method] : m_methods) {
            result.emplace_back(name);
        }
        return result;
    }

private:
    std::unordered_map<std::string, Method> m_methods;
};

// ============================================================================
// TagLibrary - CRTP base wiring a vocabulary's TagTable into dispatch
//
// Derived provides:
//   static void register_tags(TagTable<Derived>& table);
//   String library_name() const override;
// ============================================================================

template<typename Derived>
class TagLibrary : public TagHandler {
public:
    using TagHandler::TagHandler;

    [[nodiscard]] static const TagTable<Derived>& tag_table() {
        static const TagTable<Derived> table = [] {
            TagTable<Derived> t;
            Derived::register_tags(t);
            return t;
        }();
        return table;
    }

protected:
    [[nodiscard]] bool has_tag(std::string_view name) const override {
        return tag_table().contains(name);
    }

    [[nodiscard]] TagResult invoke_tag(std::string_view name, const dom::Element& element) override {
        auto method = tag_table().find(name);
        if (!method) {
            return make_error(CompileError::unresolved_handler(element, this->library_name()));
        }
        return (static_cast<Derived*>(this)->*method)(element);
    }
};

} // namespace stencil::compiler
