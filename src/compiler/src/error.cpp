/**
 * Compile error construction and formatting
 */

#include "stencil/compiler/error.hpp"
#include "stencil/dom/document.hpp"

namespace stencil::compiler {

namespace {

CompileError error_at(ErrorKind kind, const dom::Element& element, const String& message) {
    CompileError error;
    error.kind = kind;
    error.message = message;
    error.element_name = element.qualified_name();
    error.position = element.position();
    if (auto* document = element.owner_document()) {
        error.source_name = document->source_name();
    }
    return error;
}

} // namespace

String CompileError::to_string() const {
    StringBuilder builder;
    builder.append(source_name.empty() ? "<input>"_s : source_name);
    if (position.is_known()) {
        builder.append(':');
        builder.append(static_cast<u64>(position.line));
        builder.append(':');
        builder.append(static_cast<u64>(position.column));
    }
    builder.append(": error[");
    builder.append(error_kind_name(kind));
    builder.append("]: ");
    builder.append(message);
    return builder.build();
}

CompileError CompileError::missing_required_attribute(
    const dom::Element& element, const String& attribute) {
    auto error = error_at(ErrorKind::MissingRequiredAttribute, element,
        "required attribute "_s + attribute + " missing from element "_s + element.qualified_name());
    error.subject = attribute;
    return error;
}

CompileError CompileError::unresolved_handler(
    const dom::Element& element, const String& handler_name) {
    auto error = error_at(ErrorKind::UnresolvedHandler, element,
        "tag library "_s + handler_name + " unable to handle element "_s + element.qualified_name());
    error.subject = element.local_name();
    error.handler_name = handler_name;
    return error;
}

CompileError CompileError::reserved_method_invocation(
    const dom::Element& element, const String& handler_name, const String& resolved_name) {
    auto error = error_at(ErrorKind::ReservedMethodInvocation, element,
        "won't call internal "_s + handler_name + " method "_s + resolved_name +
        " for element "_s + element.qualified_name());
    error.subject = resolved_name;
    error.handler_name = handler_name;
    return error;
}

CompileError CompileError::invalid_boolean_literal(
    const dom::Element& element, const String& attribute, const String& raw_value) {
    auto error = error_at(ErrorKind::InvalidBooleanLiteral, element,
        "invalid boolean attribute "_s + attribute + "=\""_s + raw_value +
        "\" specified for "_s + element.qualified_name() + " (expected true, yes, false or no)"_s);
    error.subject = attribute;
    error.raw_value = raw_value;
    return error;
}

CompileError CompileError::malformed_markup(
    const String& message, const String& source_name, dom::SourcePosition position) {
    CompileError error;
    error.kind = ErrorKind::MalformedMarkup;
    error.message = message;
    error.source_name = source_name;
    error.position = position;
    return error;
}

CompileError CompileError::unknown_namespace(
    const dom::Element& element, const String& namespace_uri) {
    auto error = error_at(ErrorKind::UnknownNamespace, element,
        "no tag library registered for namespace "_s + namespace_uri +
        " (element "_s + element.qualified_name() + ")"_s);
    error.subject = namespace_uri;
    return error;
}

CompileError CompileError::invalid_tag_usage(
    const dom::Element& element, const String& message) {
    return error_at(ErrorKind::InvalidTagUsage, element, message);
}

} // namespace stencil::compiler
