#pragma once

#include "stencil/core/types.hpp"
#include "stencil/core/string.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace stencil::compiler {

// ============================================================================
// Argument lists
// ============================================================================

// An already formatted call argument, or nullopt when omitted
using Argument = std::optional<String>;

// Joins arguments with ", ", rendering omitted ones as NULL_LITERAL.
// With prune_tail, omitted arguments at the end are dropped first.
// Arguments are not quoted here; callers pass values from get_attr() & co.
//
//   arg_list({"'a'", nullopt, "'b'", nullopt})        == "'a', null, 'b'"
//   arg_list({"'a'", nullopt, "'b'", nullopt}, false) == "'a', null, 'b', null"
[[nodiscard]] String arg_list(std::vector<Argument> args, bool prune_tail = true);

// ============================================================================
// Attribute specifications and collected attributes
// ============================================================================

struct AttributeSpecEntry {
    String name;
    std::optional<String> default_value;

    AttributeSpecEntry(const char* attribute_name) : name(attribute_name) {}
    AttributeSpecEntry(String attribute_name) : name(std::move(attribute_name)) {}
    AttributeSpecEntry(String attribute_name, String default_text)
        : name(std::move(attribute_name)), default_value(std::move(default_text)) {}
};

using AttributeSpec = std::vector<AttributeSpecEntry>;

// Insertion-ordered name -> value mapping with unique names
class AttributeMap {
public:
    using Entry = std::pair<String, String>;
    using const_iterator = std::vector<Entry>::const_iterator;

    AttributeMap() = default;
    AttributeMap(std::initializer_list<Entry> entries);

    // Replaces the value in place when the name is already present
    void set(const String& name, const String& value);

    [[nodiscard]] std::optional<String> get(const String& name) const;
    [[nodiscard]] bool contains(const String& name) const;

    [[nodiscard]] usize size() const { return m_entries.size(); }
    [[nodiscard]] bool empty() const { return m_entries.empty(); }
    [[nodiscard]] const std::vector<Entry>& entries() const { return m_entries; }

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

    [[nodiscard]] bool operator==(const AttributeMap& other) const {
        return m_entries == other.m_entries;
    }

private:
    std::vector<Entry> m_entries;
};

// ' name="value" name="value"' - each pair preceded by a space
[[nodiscard]] String attribute_string(const AttributeMap& attributes);

} // namespace stencil::compiler
