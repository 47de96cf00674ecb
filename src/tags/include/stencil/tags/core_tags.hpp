#pragma once

#include "stencil/compiler/tag_handler.hpp"

namespace stencil::tags {

// ============================================================================
// CoreTags - Output, variables, conditionals and loops
//
//   <c:out value="$title" default="Untitled" />
//   <c:if test="$user->isAdmin()">...</c:if>
//   <c:forEach items="$rows" var="$row">...</c:forEach>
// ============================================================================

class CoreTags : public compiler::TagLibrary<CoreTags> {
public:
    static constexpr std::string_view NAMESPACE_URI = "stencil:core";

    using TagLibrary::TagLibrary;

    [[nodiscard]] String library_name() const override { return "CoreTags"_s; }

    static void register_tags(compiler::TagTable<CoreTags>& table);

private:
    compiler::TagResult out(const dom::Element& element);
    compiler::TagResult set(const dom::Element& element);
    // "if" is a keyword; registered under "_if"
    compiler::TagResult _if(const dom::Element& element);
    compiler::TagResult choose(const dom::Element& element);
    compiler::TagResult when(const dom::Element& element);
    compiler::TagResult otherwise(const dom::Element& element);
    compiler::TagResult for_each(const dom::Element& element);
    compiler::TagResult call(const dom::Element& element);
    compiler::TagResult element(const dom::Element& element);
    compiler::TagResult comment(const dom::Element& element);

    [[nodiscard]] Result<String, compiler::CompileError> required_variable(
        const dom::Element& element, const String& name) const;
};

} // namespace stencil::tags
