#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stencil {

// ============================================================================
// XML character classes
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

// XML 1.0 Char production; a character reference must name one of these
[[nodiscard]] constexpr bool is_xml_char(CodePoint cp) {
    if (cp < 0x20) {
        return cp == 0x9 || cp == 0xA || cp == 0xD;
    }
    if (cp < 0xD800) {
        return true;
    }
    if (cp < 0xE000) {
        return false;
    }
    return cp <= 0xFFFD || (cp >= 0x10000 && cp <= 0x10FFFF);
}

// XML S production (no form feed, unlike HTML)
[[nodiscard]] constexpr bool is_xml_whitespace(char c) {
    return c == ' ' || c == '\n' || c == '\t' || c == '\r';
}

// Name characters, byte-wise: any non-ASCII byte is accepted as part of a
// multi-byte name character
[[nodiscard]] constexpr bool is_xml_name_start(char c) {
    auto byte = static_cast<unsigned char>(c);
    return (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') ||
           byte == '_' || byte == ':' || byte >= 0x80;
}

[[nodiscard]] constexpr bool is_xml_name_char(char c) {
    return is_xml_name_start(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

// Writes cp to out as UTF-8 (out must hold 4 bytes); returns the byte count
usize encode_utf8(CodePoint cp, char* out);

} // namespace unicode

// ============================================================================
// String - UTF-8 text of markup, DOM nodes and generated code
// ============================================================================

class String {
public:
    using const_iterator = std::string::const_iterator;

    String() = default;
    String(const char* text) : m_data(text ? text : "") {}
    String(const char* text, usize length) : m_data(text, length) {}
    String(std::string text) : m_data(std::move(text)) {}
    String(std::string_view text) : m_data(text) {}

    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] usize length() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }
    [[nodiscard]] std::string_view view() const noexcept { return m_data; }
    [[nodiscard]] const std::string& std_string() const noexcept { return m_data; }

    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }

    // Byte access
    char operator[](usize index) const { return m_data[index]; }

    void append(const String& text) { m_data.append(text.m_data); }
    void append(std::string_view text) { m_data.append(text); }
    void clear() { m_data.clear(); }

    // Out-of-range start yields an empty string
    [[nodiscard]] String substring(usize start, usize count = std::string::npos) const;

    [[nodiscard]] std::optional<usize> find(char c, usize start = 0) const;
    [[nodiscard]] bool starts_with(const String& prefix) const { return m_data.starts_with(prefix.m_data); }

    // "prefix:local" -> {"prefix", "local"}; nullopt when separator is absent
    [[nodiscard]] std::optional<std::pair<String, String>> split_once(char separator) const;

    // Whitespace here is XML whitespace
    [[nodiscard]] String trim() const;
    [[nodiscard]] bool is_whitespace() const;

    [[nodiscard]] bool equals_ignoring_ascii_case(std::string_view other) const;

    [[nodiscard]] bool operator==(const String&) const = default;

    friend String operator+(const String& lhs, const String& rhs) {
        String result;
        result.m_data.reserve(lhs.size() + rhs.size());
        result.m_data.append(lhs.m_data).append(rhs.m_data);
        return result;
    }

private:
    std::string m_data;
};

inline String operator""_s(const char* text, std::size_t length) {
    return String(text, length);
}

// ============================================================================
// StringBuilder - accumulates generated code and token text
// ============================================================================

class StringBuilder {
public:
    // Which characters get entity-escaped when markup is re-emitted
    enum class Escape : u8 {
        Text,       // & < >
        Attribute,  // & < > "
    };

    StringBuilder& append(std::string_view text);
    StringBuilder& append(const String& text) { return append(text.view()); }
    StringBuilder& append(const char* text) { return append(std::string_view(text)); }
    StringBuilder& append(char c);
    StringBuilder& append(unicode::CodePoint cp);
    StringBuilder& append(u64 number);

    StringBuilder& append_escaped(std::string_view text, Escape context);

    void clear() { m_buffer.clear(); }

    [[nodiscard]] bool empty() const { return m_buffer.empty(); }
    [[nodiscard]] usize size() const { return m_buffer.size(); }
    [[nodiscard]] std::string_view view() const { return m_buffer; }
    [[nodiscard]] String build() const { return String(m_buffer); }

private:
    std::string m_buffer;
};

} // namespace stencil
