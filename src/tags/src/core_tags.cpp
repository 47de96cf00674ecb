/**
 * Core tag library
 */

#include "stencil/tags/core_tags.hpp"
#include "stencil/compiler/compiler.hpp"

namespace stencil::tags {

using compiler::CompileError;
using compiler::TagResult;

namespace {

constexpr std::string_view PHP_OPEN = "<?php ";
constexpr std::string_view PHP_CLOSE = " ?>";

String php(const String& code) {
    StringBuilder builder;
    builder.append(PHP_OPEN);
    builder.append(code);
    builder.append(PHP_CLOSE);
    return builder.build();
}

bool is_ignorable(const dom::Node& node) {
    if (node.node_type() == dom::NodeType::Comment) {
        return true;
    }
    return node.is_text() && node.as_character_data()->data().is_whitespace();
}

} // namespace

void CoreTags::register_tags(compiler::TagTable<CoreTags>& table) {
    table.add("out", &CoreTags::out)
         .add("set", &CoreTags::set)
         .add("_if", &CoreTags::_if)
         .add("choose", &CoreTags::choose)
         .add("when", &CoreTags::when)
         .add("otherwise", &CoreTags::otherwise)
         .add("forEach", &CoreTags::for_each)
         .add("call", &CoreTags::call)
         .add("element", &CoreTags::element)
         .add("comment", &CoreTags::comment);
}

Result<String, CompileError> CoreTags::required_variable(
    const dom::Element& element, const String& name) const {
    auto variable = required_attr(element, name, false);
    if (!variable) {
        return variable;
    }
    if (needs_quote(variable.value())) {
        return make_error(CompileError::invalid_tag_usage(element,
            element.qualified_name() + " attribute "_s + name + " must name a variable, got \""_s +
            variable.value() + "\""_s));
    }
    return variable;
}

// <c:out value="..." [default="..."] [escape="yes|no"] />
TagResult CoreTags::out(const dom::Element& element) {
    if (element.has_children()) {
        return make_error(CompileError::invalid_tag_usage(element,
            element.qualified_name() + " must be empty"_s));
    }

    auto value = required_attr(element, "value"_s);
    if (!value) {
        return value;
    }
    auto escape = get_boolean_attr(element, "escape"_s, true);
    if (!escape) {
        return make_error(std::move(escape).error());
    }

    String expression = value.value();
    if (auto fallback = get_attr(element, "default"_s)) {
        expression = "("_s + expression + " ?: "_s + *fallback + ")"_s;
    }
    if (escape.value()) {
        expression = "htmlspecialchars("_s + expression + ")"_s;
    }
    return php("echo "_s + expression + ";"_s);
}

// <c:set var="$name" value="..." />
TagResult CoreTags::set(const dom::Element& element) {
    auto variable = required_variable(element, "var"_s);
    if (!variable) {
        return variable;
    }
    auto value = required_attr(element, "value"_s);
    if (!value) {
        return value;
    }
    return php(variable.value() + " = "_s + value.value() + ";"_s);
}

// <c:if test="...">...</c:if>
TagResult CoreTags::_if(const dom::Element& element) {
    auto test = required_attr(element, "test"_s, false);
    if (!test) {
        return test;
    }

    compiler().write(php("if ("_s + test.value() + "):"_s));
    if (auto result = process(element); !result) {
        return make_error(std::move(result).error());
    }
    return php("endif;"_s);
}

// <c:choose><c:when test="...">...</c:when><c:otherwise>...</c:otherwise></c:choose>
TagResult CoreTags::choose(const dom::Element& element) {
    auto namespace_uri = element.namespace_uri();
    usize branch_count = 0;
    bool seen_otherwise = false;

    for (const auto& child : element.child_nodes()) {
        if (is_ignorable(*child)) {
            continue;
        }

        const auto* branch = child->as_element();
        if (!branch || branch->namespace_uri() != namespace_uri ||
            (branch->local_name() != "when"_s && branch->local_name() != "otherwise"_s)) {
            return make_error(CompileError::invalid_tag_usage(element,
                element.qualified_name() + " may only contain when and otherwise elements"_s));
        }
        if (seen_otherwise) {
            return make_error(CompileError::invalid_tag_usage(*branch,
                branch->qualified_name() + " must not follow otherwise"_s));
        }

        if (branch->local_name() == "when"_s) {
            auto test = required_attr(*branch, "test"_s, false);
            if (!test) {
                return test;
            }
            auto keyword = branch_count == 0 ? "if ("_s : "elseif ("_s;
            compiler().write(php(keyword + test.value() + "):"_s));
        } else {
            if (branch_count == 0) {
                return make_error(CompileError::invalid_tag_usage(*branch,
                    branch->qualified_name() + " must follow at least one when"_s));
            }
            compiler().write(php("else:"_s));
            seen_otherwise = true;
        }

        if (auto result = process(*branch); !result) {
            return make_error(std::move(result).error());
        }
        ++branch_count;
    }

    if (branch_count == 0) {
        return make_error(CompileError::invalid_tag_usage(element,
            element.qualified_name() + " requires at least one when"_s));
    }
    return php("endif;"_s);
}

TagResult CoreTags::when(const dom::Element& element) {
    return make_error(CompileError::invalid_tag_usage(element,
        element.qualified_name() + " is only allowed inside choose"_s));
}

TagResult CoreTags::otherwise(const dom::Element& element) {
    return make_error(CompileError::invalid_tag_usage(element,
        element.qualified_name() + " is only allowed inside choose"_s));
}

// <c:forEach items="$rows" var="$row" [key="$index"]>...</c:forEach>
TagResult CoreTags::for_each(const dom::Element& element) {
    auto items = required_attr(element, "items"_s, false);
    if (!items) {
        return items;
    }
    auto variable = required_variable(element, "var"_s);
    if (!variable) {
        return variable;
    }

    String binding = variable.value();
    if (element.has_attribute("key"_s)) {
        auto key = required_variable(element, "key"_s);
        if (!key) {
            return key;
        }
        binding = key.value() + " => "_s + binding;
    }

    compiler().write(php("foreach ("_s + items.value() + " as "_s + binding + "):"_s));
    if (auto result = process(element); !result) {
        return make_error(std::move(result).error());
    }
    return php("endforeach;"_s);
}

// <c:call function="name" [a1="..." ... a5="..."] />
TagResult CoreTags::call(const dom::Element& element) {
    auto function = required_attr(element, "function"_s, false);
    if (!function) {
        return function;
    }

    auto args = arg_list({
        get_attr(element, "a1"_s),
        get_attr(element, "a2"_s),
        get_attr(element, "a3"_s),
        get_attr(element, "a4"_s),
        get_attr(element, "a5"_s),
    });
    return php("echo "_s + function.value() + "("_s + args + ");"_s);
}

// <c:element name="div" [id class style title]>...</c:element>
TagResult CoreTags::element(const dom::Element& element) {
    auto name = required_attr(element, "name"_s, false);
    if (!name) {
        return name;
    }
    if (!needs_quote(name.value()) || name.value().empty()) {
        return make_error(CompileError::invalid_tag_usage(element,
            element.qualified_name() + " name must be literal text"_s));
    }

    auto attributes = get_attribute_string(element, {"id", "class", "style", "title"});
    if (!element.has_children()) {
        return "<"_s + name.value() + attributes + "/>"_s;
    }

    compiler().write("<"_s + name.value() + attributes + ">"_s);
    if (auto result = process(element); !result) {
        return make_error(std::move(result).error());
    }
    return "</"_s + name.value() + ">"_s;
}

// <c:comment>...</c:comment> drops its content
TagResult CoreTags::comment(const dom::Element&) {
    return String();
}

} // namespace stencil::tags
