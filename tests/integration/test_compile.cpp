#include <gtest/gtest.h>
#include "stencil/compiler/compiler.hpp"
#include "stencil/markup/parser.hpp"
#include "stencil/tags/core_tags.hpp"

using namespace stencil;
using stencil::compiler::Compiler;
using stencil::compiler::CompilerOptions;
using stencil::compiler::ErrorKind;
using stencil::tags::CoreTags;

namespace {

constexpr std::string_view PAGE =
    "<?xml version=\"1.0\"?>\n"
    "<html xmlns:c=\"stencil:core\">\n"
    "  <body>\n"
    "    <c:set var=\"$title\" value=\"Users\"/>\n"
    "    <h1><c:out value=\"$title\"/></h1>\n"
    "    <c:comment>listing</c:comment>\n"
    "    <c:choose>\n"
    "      <c:when test=\"empty($users)\"><p>Nobody &amp; nothing</p></c:when>\n"
    "      <c:otherwise>\n"
    "        <ul><c:forEach items=\"$users\" var=\"$user\" key=\"$i\">"
    "<c:element name=\"li\" class=\"row\"><c:call function=\"format_user\" a1=\"$user\" a2=\"short\"/></c:element>"
    "</c:forEach></ul>\n"
    "      </c:otherwise>\n"
    "    </c:choose>\n"
    "  </body>\n"
    "</html>\n";

constexpr std::string_view EXPECTED =
    "<html>\n"
    "  <body>\n"
    "    <?php $title = 'Users'; ?>\n"
    "    <h1><?php echo htmlspecialchars($title); ?></h1>\n"
    "    \n"
    "    <?php if (empty($users)): ?><p>Nobody &amp; nothing</p>"
    "<?php else: ?>\n"
    "        <ul><?php foreach ($users as $i => $user): ?>"
    "<li class=\"row\"><?php echo format_user($user, 'short'); ?></li>"
    "<?php endforeach; ?></ul>\n"
    "      <?php endif; ?>\n"
    "  </body>\n"
    "</html>";

std::unique_ptr<Compiler> make_compiler(CompilerOptions options = {}) {
    auto compiler = std::make_unique<Compiler>(std::move(options));
    compiler->register_vocabulary<CoreTags>(String(CoreTags::NAMESPACE_URI));
    return compiler;
}

} // namespace

TEST(CompileIntegrationTest, CompilesTemplate) {
    auto compiler = make_compiler();

    auto result = compiler->compile(PAGE);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string().c_str();
    EXPECT_EQ(result.value().std_string(), std::string(EXPECTED));
}

TEST(CompileIntegrationTest, OutputIsDeterministic) {
    auto compiler = make_compiler();

    auto first = compiler->compile(PAGE);
    auto second = compiler->compile(PAGE);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST(CompileIntegrationTest, IndependentCompilersShareNothing) {
    auto strict = make_compiler();
    CompilerOptions options;
    options.strip_vocabulary_declarations = false;
    auto verbose = make_compiler(options);

    constexpr std::string_view markup = "<p xmlns:c=\"stencil:core\"><c:out value=\"$a\" escape=\"no\"/></p>";
    auto a = strict->compile(markup);
    auto b = verbose->compile(markup);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value(), "<p><?php echo $a; ?></p>"_s);
    EXPECT_EQ(b.value(), "<p xmlns:c=\"stencil:core\"><?php echo $a; ?></p>"_s);
}

TEST(CompileIntegrationTest, ErrorPointsAtOffendingElement) {
    CompilerOptions options;
    options.source_name = "users.xml"_s;
    auto compiler = make_compiler(options);

    auto result = compiler->compile(
        "<html xmlns:c=\"stencil:core\">\n"
        "  <ul>\n"
        "    <c:forEach items=\"$users\">x</c:forEach>\n"
        "  </ul>\n"
        "</html>");
    ASSERT_TRUE(result.is_err());

    const auto& error = result.error();
    EXPECT_EQ(error.kind, ErrorKind::MissingRequiredAttribute);
    EXPECT_EQ(error.source_name, "users.xml"_s);
    EXPECT_EQ(error.position.line, 3u);
    EXPECT_EQ(error.position.column, 5u);
}

TEST(CompileIntegrationTest, ParsedDocumentCanBeCompiledTwice) {
    auto document = markup::parse_markup(PAGE);
    ASSERT_TRUE(document.is_ok());
    auto compiler = make_compiler();

    auto first = compiler->compile(*document.value());
    auto second = compiler->compile(*document.value());
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().std_string(), std::string(EXPECTED));
    EXPECT_EQ(second.value(), first.value());
}
