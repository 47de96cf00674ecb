#pragma once

#include "node.hpp"

namespace stencil::dom {

// ============================================================================
// CharacterData - Base class for text-based nodes
// ============================================================================

class CharacterData : public Node {
public:
    [[nodiscard]] String node_value() const override { return m_data; }
    [[nodiscard]] String text_content() const override { return m_data; }

    [[nodiscard]] const String& data() const { return m_data; }
    void set_data(const String& data) { m_data = data; }
    void append_data(const String& data) { m_data.append(data); }

    [[nodiscard]] usize length() const { return m_data.length(); }

protected:
    CharacterData() = default;
    explicit CharacterData(const String& data) : m_data(data) {}

private:
    String m_data;
};

// ============================================================================
// Text
// ============================================================================

class Text : public CharacterData {
public:
    Text() = default;
    explicit Text(const String& data) : CharacterData(data) {}

    [[nodiscard]] NodeType node_type() const override { return NodeType::Text; }
    [[nodiscard]] String node_name() const override { return "#text"_s; }
};

// ============================================================================
// CDataSection - <![CDATA[ ... ]]>
// ============================================================================

class CDataSection : public CharacterData {
public:
    explicit CDataSection(const String& data) : CharacterData(data) {}

    [[nodiscard]] NodeType node_type() const override { return NodeType::CDataSection; }
    [[nodiscard]] String node_name() const override { return "#cdata-section"_s; }
};

// ============================================================================
// Comment
// ============================================================================

class Comment : public CharacterData {
public:
    explicit Comment(const String& data) : CharacterData(data) {}

    [[nodiscard]] NodeType node_type() const override { return NodeType::Comment; }
    [[nodiscard]] String node_name() const override { return "#comment"_s; }
    [[nodiscard]] String text_content() const override { return String(); }
};

// ============================================================================
// ProcessingInstruction - <?target data?>
// ============================================================================

class ProcessingInstruction : public CharacterData {
public:
    ProcessingInstruction(const String& target, const String& data)
        : CharacterData(data), m_target(target) {}

    [[nodiscard]] NodeType node_type() const override { return NodeType::ProcessingInstruction; }
    [[nodiscard]] String node_name() const override { return m_target; }
    [[nodiscard]] String text_content() const override { return String(); }

    [[nodiscard]] const String& target() const { return m_target; }

private:
    String m_target;
};

} // namespace stencil::dom
