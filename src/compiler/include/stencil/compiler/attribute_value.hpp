#pragma once

#include "stencil/core/types.hpp"
#include "stencil/core/string.hpp"
#include <optional>
#include <string_view>

namespace stencil::compiler {

// Leading characters marking raw code rather than literal text
inline constexpr char EXPRESSION_SIGIL = '$';
inline constexpr char REFERENCE_SIGIL = '@';

// Generated-code spelling of "no value"
inline constexpr std::string_view NULL_LITERAL = "null";

// ============================================================================
// AttributeValue - Raw attribute text classified as literal or expression
// ============================================================================

class AttributeValue {
public:
    enum class Kind : u8 {
        Absent,
        Literal,
        Expression,
    };

    AttributeValue() = default;

    // The single classification point for raw attribute text
    [[nodiscard]] static AttributeValue classify(const std::optional<String>& raw);
    [[nodiscard]] static AttributeValue absent() { return AttributeValue(); }

    [[nodiscard]] Kind kind() const { return m_kind; }
    [[nodiscard]] bool is_absent() const { return m_kind == Kind::Absent; }
    [[nodiscard]] bool is_literal() const { return m_kind == Kind::Literal; }
    [[nodiscard]] bool is_expression() const { return m_kind == Kind::Expression; }

    // Raw text as written in the markup (empty when absent)
    [[nodiscard]] const String& text() const { return m_text; }

    // Literal -> 'text', Expression -> text, Absent -> nullopt
    [[nodiscard]] std::optional<String> quoted() const;

    // Like quoted(), with Absent spelled as NULL_LITERAL
    [[nodiscard]] String render() const;

    [[nodiscard]] bool operator==(const AttributeValue& other) const {
        return m_kind == other.m_kind && m_text == other.m_text;
    }

private:
    AttributeValue(Kind kind, String text) : m_kind(kind), m_text(std::move(text)) {}

    Kind m_kind{Kind::Absent};
    String m_text;
};

// True unless the value starts with EXPRESSION_SIGIL or REFERENCE_SIGIL
[[nodiscard]] bool needs_quote(const String& value);

// Absent stays absent; literals are wrapped in single quotes
[[nodiscard]] std::optional<String> quote(const std::optional<String>& value);

} // namespace stencil::compiler
