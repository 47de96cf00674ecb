#include "stencil/core/string.hpp"
#include <algorithm>
#include <charconv>
#include <iterator>
#include <system_error>

namespace stencil {

usize unicode::encode_utf8(CodePoint cp, char* out) {
    auto byte = [](CodePoint bits) { return static_cast<char>(bits); };

    if (cp < 0x80) {
        out[0] = byte(cp);
        return 1;
    }
    if (cp < 0x800) {
        out[0] = byte(0xC0 | (cp >> 6));
        out[1] = byte(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        out[0] = byte(0xE0 | (cp >> 12));
        out[1] = byte(0x80 | ((cp >> 6) & 0x3F));
        out[2] = byte(0x80 | (cp & 0x3F));
        return 3;
    }
    out[0] = byte(0xF0 | (cp >> 18));
    out[1] = byte(0x80 | ((cp >> 12) & 0x3F));
    out[2] = byte(0x80 | ((cp >> 6) & 0x3F));
    out[3] = byte(0x80 | (cp & 0x3F));
    return 4;
}

// ============================================================================
// String
// ============================================================================

String String::substring(usize start, usize count) const {
    if (start >= m_data.size()) {
        return String();
    }
    return String(m_data.substr(start, count));
}

std::optional<usize> String::find(char c, usize start) const {
    auto index = m_data.find(c, start);
    if (index == std::string::npos) {
        return std::nullopt;
    }
    return index;
}

std::optional<std::pair<String, String>> String::split_once(char separator) const {
    auto index = find(separator);
    if (!index) {
        return std::nullopt;
    }
    return std::pair{substring(0, *index), substring(*index + 1)};
}

String String::trim() const {
    auto first = std::find_if_not(m_data.begin(), m_data.end(), unicode::is_xml_whitespace);
    auto last = std::find_if_not(m_data.rbegin(), m_data.rend(), unicode::is_xml_whitespace).base();
    if (first >= last) {
        return String();
    }
    return String(std::string(first, last));
}

bool String::is_whitespace() const {
    return std::all_of(m_data.begin(), m_data.end(), unicode::is_xml_whitespace);
}

bool String::equals_ignoring_ascii_case(std::string_view other) const {
    auto fold = [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    };
    return m_data.size() == other.size() &&
           std::equal(m_data.begin(), m_data.end(), other.begin(),
                      [&](char a, char b) { return fold(a) == fold(b); });
}

// ============================================================================
// StringBuilder
// ============================================================================

StringBuilder& StringBuilder::append(std::string_view text) {
    m_buffer.append(text);
    return *this;
}

StringBuilder& StringBuilder::append(char c) {
    m_buffer.push_back(c);
    return *this;
}

StringBuilder& StringBuilder::append(unicode::CodePoint cp) {
    char encoded[4];
    m_buffer.append(encoded, unicode::encode_utf8(cp, encoded));
    return *this;
}

StringBuilder& StringBuilder::append(u64 number) {
    char digits[24];
    auto [last, ec] = std::to_chars(std::begin(digits), std::end(digits), number);
    if (ec == std::errc{}) {
        m_buffer.append(digits, last);
    }
    return *this;
}

StringBuilder& StringBuilder::append_escaped(std::string_view text, Escape context) {
    for (char c : text) {
        switch (c) {
            case '&': m_buffer.append("&amp;"); break;
            case '<': m_buffer.append("&lt;"); break;
            case '>': m_buffer.append("&gt;"); break;
            case '"':
                m_buffer.append(context == Escape::Attribute ? "&quot;" : "\"");
                break;
            default: m_buffer.push_back(c); break;
        }
    }
    return *this;
}

} // namespace stencil
