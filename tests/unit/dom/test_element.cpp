#include <gtest/gtest.h>
#include "stencil/dom/document.hpp"
#include "stencil/dom/element.hpp"

using namespace stencil;

class DOMElementTest : public ::testing::Test {
protected:
    void SetUp() override {
        document = make_ref<dom::Document>();
    }

    RefPtr<dom::Document> document;
};

TEST_F(DOMElementTest, SplitsQualifiedName) {
    auto element = document->create_element("c:forEach"_s);

    EXPECT_EQ(element->qualified_name(), "c:forEach");
    EXPECT_EQ(element->prefix(), "c");
    EXPECT_EQ(element->local_name(), "forEach");
    EXPECT_TRUE(element->has_prefix());
}

TEST_F(DOMElementTest, UnprefixedName) {
    auto element = document->create_element("div"_s);

    EXPECT_EQ(element->local_name(), "div");
    EXPECT_TRUE(element->prefix().empty());
    EXPECT_FALSE(element->has_prefix());
}

TEST_F(DOMElementTest, AttributesAreCaseSensitive) {
    auto element = document->create_element("div"_s);
    element->set_attribute("Value"_s, "1"_s);

    EXPECT_TRUE(element->has_attribute("Value"_s));
    EXPECT_FALSE(element->has_attribute("value"_s));
    EXPECT_EQ(element->get_attribute("value"_s), std::nullopt);
}

TEST_F(DOMElementTest, SetAttributeReplacesInPlace) {
    auto element = document->create_element("div"_s);
    element->set_attribute("a"_s, "1"_s);
    element->set_attribute("b"_s, "2"_s);
    element->set_attribute("a"_s, "3"_s);

    ASSERT_EQ(element->attributes().size(), 2u);
    EXPECT_EQ(element->attributes()[0].name, "a");
    EXPECT_EQ(element->attributes()[0].value, "3");

    element->remove_attribute("a"_s);
    ASSERT_EQ(element->attributes().size(), 1u);
    EXPECT_EQ(element->attributes()[0].name, "b");
}

TEST_F(DOMElementTest, EmptyAttributeIsPresent) {
    auto element = document->create_element("div"_s);
    element->set_attribute("title"_s, ""_s);

    auto value = element->get_attribute("title"_s);
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->empty());
}

TEST_F(DOMElementTest, NamespaceDeclarationAttribute) {
    auto element = document->create_element("root"_s);
    element->set_attribute("xmlns:c"_s, "stencil:core"_s);
    element->set_attribute("xmlns"_s, "urn:default"_s);
    element->set_attribute("class"_s, "x"_s);

    const auto& attributes = element->attributes();
    EXPECT_TRUE(attributes[0].is_namespace_declaration());
    EXPECT_EQ(attributes[0].prefix, "xmlns");
    EXPECT_EQ(attributes[0].local_name, "c");
    EXPECT_TRUE(attributes[1].is_namespace_declaration());
    EXPECT_FALSE(attributes[2].is_namespace_declaration());
}

TEST_F(DOMElementTest, NamespaceLookupWalksAncestors) {
    auto root = document->create_element("root"_s);
    root->set_attribute("xmlns:c"_s, "stencil:core"_s);
    document->append_child(root);

    auto wrapper = document->create_element("div"_s);
    root->append_child(wrapper);

    auto tag = document->create_element("c:out"_s);
    wrapper->append_child(tag);

    EXPECT_EQ(tag->namespace_uri(), "stencil:core"_s);
    EXPECT_EQ(wrapper->namespace_uri(), std::nullopt);
    EXPECT_EQ(wrapper->lookup_namespace_uri("c"_s), "stencil:core"_s);
    EXPECT_EQ(wrapper->lookup_namespace_uri("x"_s), std::nullopt);
}

TEST_F(DOMElementTest, InnerDeclarationShadowsOuter) {
    auto root = document->create_element("root"_s);
    root->set_attribute("xmlns:c"_s, "stencil:core"_s);
    document->append_child(root);

    auto inner = document->create_element("c:out"_s);
    inner->set_attribute("xmlns:c"_s, "urn:other"_s);
    root->append_child(inner);

    EXPECT_EQ(inner->namespace_uri(), "urn:other"_s);
}

TEST_F(DOMElementTest, EmptyDefaultNamespaceUndeclares) {
    auto root = document->create_element("root"_s);
    root->set_attribute("xmlns"_s, "urn:default"_s);
    document->append_child(root);

    auto child = document->create_element("p"_s);
    root->append_child(child);
    EXPECT_EQ(child->namespace_uri(), "urn:default"_s);

    child->set_attribute("xmlns"_s, ""_s);
    EXPECT_EQ(child->namespace_uri(), std::nullopt);
}

TEST_F(DOMElementTest, ElementChildrenSkipText) {
    auto root = document->create_element("root"_s);
    root->append_child(document->create_text_node("  "_s));
    root->append_child(document->create_element("a"_s));
    root->append_child(document->create_comment("note"_s));
    root->append_child(document->create_element("b"_s));

    EXPECT_EQ(root->child_nodes().size(), 4u);
    EXPECT_EQ(root->child_element_count(), 2u);

    auto children = root->element_children();
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0]->local_name(), "a");
    EXPECT_EQ(children[1]->local_name(), "b");
    EXPECT_EQ(root->first_element_child(), children[0]);
}

TEST_F(DOMElementTest, TextContentSkipsComments) {
    auto root = document->create_element("p"_s);
    root->append_child(document->create_text_node("Hello "_s));
    root->append_child(document->create_comment("hidden"_s));
    auto span = document->create_element("span"_s);
    span->append_child(document->create_cdata_section("World"_s));
    root->append_child(span);

    EXPECT_EQ(root->text_content(), "Hello World"_s);
}

TEST_F(DOMElementTest, AppendChildReparents) {
    auto first = document->create_element("first"_s);
    auto second = document->create_element("second"_s);
    auto child = document->create_element("child"_s);

    first->append_child(child);
    second->append_child(child);

    EXPECT_FALSE(first->has_children());
    EXPECT_EQ(child->parent_node(), second.get());
    EXPECT_EQ(child->parent_element(), second.get());
}

TEST_F(DOMElementTest, RejectsCycles) {
    auto parent = document->create_element("parent"_s);
    auto child = document->create_element("child"_s);
    parent->append_child(child);

    EXPECT_EQ(child->append_child(parent).get(), nullptr);
    EXPECT_EQ(parent->append_child(parent).get(), nullptr);
}

TEST_F(DOMElementTest, DocumentElementAndLookup) {
    document->append_child(document->create_comment("header"_s));
    auto root = document->create_element("root"_s);
    document->append_child(root);
    root->append_child(document->create_element("c:out"_s));
    root->append_child(document->create_element("c:out"_s));

    EXPECT_EQ(document->document_element(), root.get());
    EXPECT_EQ(document->get_elements_by_tag_name("c:out"_s).size(), 2u);
    EXPECT_EQ(root->owner_document(), document.get());
}

TEST_F(DOMElementTest, SourcePosition) {
    auto element = document->create_element("div"_s);
    EXPECT_FALSE(element->position().is_known());

    element->set_position({3, 7});
    EXPECT_TRUE(element->position().is_known());
    EXPECT_EQ(element->position().line, 3u);
    EXPECT_EQ(element->position().column, 7u);
}
