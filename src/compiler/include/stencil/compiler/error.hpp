#pragma once

#include "stencil/core/types.hpp"
#include "stencil/core/string.hpp"
#include "stencil/dom/element.hpp"
#include <string_view>

namespace stencil::compiler {

// ============================================================================
// Compile errors - every kind is fatal to the current compilation pass
// ============================================================================

enum class ErrorKind : u8 {
    MissingRequiredAttribute,
    UnresolvedHandler,
    ReservedMethodInvocation,
    InvalidBooleanLiteral,
    MalformedMarkup,
    UnknownNamespace,
    InvalidTagUsage,
};

[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingRequiredAttribute: return "missing-required-attribute";
        case ErrorKind::UnresolvedHandler:        return "unresolved-handler";
        case ErrorKind::ReservedMethodInvocation: return "reserved-method-invocation";
        case ErrorKind::InvalidBooleanLiteral:    return "invalid-boolean-literal";
        case ErrorKind::MalformedMarkup:          return "malformed-markup";
        case ErrorKind::UnknownNamespace:         return "unknown-namespace";
        case ErrorKind::InvalidTagUsage:          return "invalid-tag-usage";
    }
    return "unknown";
}

struct CompileError {
    ErrorKind kind{ErrorKind::MalformedMarkup};
    String message;
    // Qualified name of the offending element
    String element_name;
    // Attribute name, or the resolved handler function name
    String subject;
    // Raw attribute value, when one was rejected
    String raw_value;
    // Tag handler that reported the error
    String handler_name;
    String source_name;
    dom::SourcePosition position;

    // "source:line:column: error[kind]: message"
    [[nodiscard]] String to_string() const;

    [[nodiscard]] static CompileError missing_required_attribute(
        const dom::Element& element, const String& attribute);
    [[nodiscard]] static CompileError unresolved_handler(
        const dom::Element& element, const String& handler_name);
    [[nodiscard]] static CompileError reserved_method_invocation(
        const dom::Element& element, const String& handler_name, const String& resolved_name);
    [[nodiscard]] static CompileError invalid_boolean_literal(
        const dom::Element& element, const String& attribute, const String& raw_value);
    [[nodiscard]] static CompileError malformed_markup(
        const String& message, const String& source_name, dom::SourcePosition position);
    [[nodiscard]] static CompileError unknown_namespace(
        const dom::Element& element, const String& namespace_uri);
    [[nodiscard]] static CompileError invalid_tag_usage(
        const dom::Element& element, const String& message);
};

} // namespace stencil::compiler
