/**
 * Tag handler base contract: dispatch and attribute helpers
 */

#include "stencil/compiler/tag_handler.hpp"
#include "stencil/compiler/compiler.hpp"
#include <array>

namespace stencil::compiler {

namespace {

constexpr std::string_view RESERVED_PREFIX = "__";

// Every name the base contract declares; markup must never reach these
constexpr std::array<std::string_view, 20> BASE_CONTRACT_NAMES = {
    "dispatch", "library_name", "is_reserved_name", "is_base_contract_name",
    "local_name_of", "has_tag", "invoke_tag", "compiler", "process",
    "quote", "needs_quote", "required_attr", "get_attr",
    "get_unquoted_attr", "get_boolean_attr", "get_attributes",
    "get_attribute_string", "arg_list", "tag_table", "register_tags",
};

} // namespace

TagHandler::TagHandler(Compiler& compiler)
    : m_compiler(compiler)
{
}

TagResult TagHandler::dispatch(const dom::Element& element) {
    auto local_name = local_name_of(element.qualified_name());

    String resolved = local_name;
    if (!has_tag(resolved.view()) && !is_base_contract_name(resolved.view())) {
        resolved = "_"_s + local_name;
        if (!has_tag(resolved.view()) && !is_base_contract_name(resolved.view())) {
            return make_error(CompileError::unresolved_handler(element, library_name()));
        }
    }

    if (is_reserved_name(resolved.view())) {
        return make_error(CompileError::reserved_method_invocation(element, library_name(), resolved));
    }

    return invoke_tag(resolved.view(), element);
}

bool TagHandler::is_reserved_name(std::string_view name) {
    return name.starts_with(RESERVED_PREFIX) || is_base_contract_name(name);
}

bool TagHandler::is_base_contract_name(std::string_view name) {
    for (auto reserved : BASE_CONTRACT_NAMES) {
        if (reserved == name) {
            return true;
        }
    }
    return false;
}

String TagHandler::local_name_of(const String& qualified_name) {
    auto parts = qualified_name.split_once(':');
    return parts ? parts->second : qualified_name;
}

Result<void, CompileError> TagHandler::process(const dom::Element& element) {
    for (const auto& child : element.child_nodes()) {
        auto result = m_compiler.process(*child);
        if (!result) {
            return make_error(std::move(result).error());
        }
    }
    return {};
}

std::optional<String> TagHandler::quote(const std::optional<String>& value) {
    return stencil::compiler::quote(value);
}

bool TagHandler::needs_quote(const String& value) {
    return stencil::compiler::needs_quote(value);
}

Result<String, CompileError> TagHandler::required_attr(
    const dom::Element& element, const String& name, bool quote_value) const {
    auto value = element.get_attribute(name);
    if (!value) {
        return make_error(CompileError::missing_required_attribute(element, name));
    }
    if (quote_value) {
        return AttributeValue::classify(value).render();
    }
    return std::move(*value);
}

std::optional<String> TagHandler::get_attr(
    const dom::Element& element, const String& name,
    const std::optional<String>& default_value) const {
    if (auto value = element.get_attribute(name)) {
        return quote(value);
    }
    return quote(default_value);
}

std::optional<String> TagHandler::get_unquoted_attr(
    const dom::Element& element, const String& name,
    const std::optional<String>& default_value) const {
    if (auto value = element.get_attribute(name)) {
        return value;
    }
    return default_value;
}

Result<bool, CompileError> TagHandler::get_boolean_attr(
    const dom::Element& element, const String& name, bool default_value) const {
    auto value = element.get_attribute(name);
    if (!value) {
        return default_value;
    }

    if (*value == "true"_s || *value == "yes"_s) {
        return true;
    }
    if (*value == "false"_s || *value == "no"_s) {
        return false;
    }

    return make_error(CompileError::invalid_boolean_literal(element, name, *value));
}

AttributeMap TagHandler::get_attributes(
    const dom::Element& element, const AttributeSpec& spec) const {
    AttributeMap attributes;
    for (const auto& entry : spec) {
        auto value = get_unquoted_attr(element, entry.name, entry.default_value);
        if (value) {
            attributes.set(entry.name, *value);
        }
    }
    return attributes;
}

String TagHandler::get_attribute_string(
    const dom::Element& element, const AttributeSpec& spec) const {
    return attribute_string(get_attributes(element, spec));
}

String TagHandler::get_attribute_string(const AttributeMap& attributes) {
    return attribute_string(attributes);
}

String TagHandler::arg_list(std::vector<Argument> args, bool prune_tail) {
    return stencil::compiler::arg_list(std::move(args), prune_tail);
}

} // namespace stencil::compiler
