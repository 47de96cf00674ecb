/**
 * Quoting rule for attribute values
 */

#include "stencil/compiler/attribute_value.hpp"

namespace stencil::compiler {

bool needs_quote(const String& value) {
    if (value.empty()) {
        return true;
    }
    char first = value[0];
    return first != EXPRESSION_SIGIL && first != REFERENCE_SIGIL;
}

AttributeValue AttributeValue::classify(const std::optional<String>& raw) {
    if (!raw) {
        return AttributeValue();
    }
    if (needs_quote(*raw)) {
        return AttributeValue(Kind::Literal, *raw);
    }
    return AttributeValue(Kind::Expression, *raw);
}

std::optional<String> AttributeValue::quoted() const {
    switch (m_kind) {
        case Kind::Absent:
            return std::nullopt;
        case Kind::Literal:
            return "'"_s + m_text + "'"_s;
        case Kind::Expression:
            return m_text;
    }
    return std::nullopt;
}

String AttributeValue::render() const {
    return quoted().value_or(String(NULL_LITERAL));
}

std::optional<String> quote(const std::optional<String>& value) {
    return AttributeValue::classify(value).quoted();
}

} // namespace stencil::compiler
