/**
 * Argument list builder and attribute collections
 */

#include "stencil/compiler/arguments.hpp"
#include "stencil/compiler/attribute_value.hpp"

namespace stencil::compiler {

String arg_list(std::vector<Argument> args, bool prune_tail) {
    if (prune_tail) {
        while (!args.empty() && !args.back().has_value()) {
            args.pop_back();
        }
    }

    StringBuilder builder;
    for (usize i = 0; i < args.size(); ++i) {
        if (i > 0) {
            builder.append(", ");
        }
        if (args[i]) {
            builder.append(*args[i]);
        } else {
            builder.append(NULL_LITERAL);
        }
    }
    return builder.build();
}

AttributeMap::AttributeMap(std::initializer_list<Entry> entries) {
    for (const auto& [name, value] : entries) {
        set(name, value);
    }
}

void AttributeMap::set(const String& name, const String& value) {
    for (auto& entry : m_entries) {
        if (entry.first == name) {
            entry.second = value;
            return;
        }
    }
    m_entries.emplace_back(name, value);
}

std::optional<String> AttributeMap::get(const String& name) const {
    for (const auto& [entry_name, value] : m_entries) {
        if (entry_name == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool AttributeMap::contains(const String& name) const {
    return get(name).has_value();
}

String attribute_string(const AttributeMap& attributes) {
    StringBuilder builder;
    for (const auto& [name, value] : attributes) {
        builder.append(' ');
        builder.append(name);
        builder.append("=\"");
        builder.append(value);
        builder.append('"');
    }
    return builder.build();
}

} // namespace stencil::compiler
