#include <gtest/gtest.h>
#include "stencil/core/types.hpp"
#include "stencil/core/string.hpp"
#include <memory>
#include <optional>
#include <vector>

using namespace stencil;

namespace {

struct MissingAttribute {
    String attribute;
};

// Shaped like an attribute extractor: a present value comes back quoted
Result<String, MissingAttribute> quoted_attr(const std::optional<String>& raw, const String& name) {
    if (!raw) {
        return make_error(MissingAttribute{name});
    }
    return "'"_s + *raw + "'"_s;
}

// Stops at the first missing attribute, the way a handler walks its children
Result<void, MissingAttribute> require_all(const std::vector<std::pair<String, std::optional<String>>>& attributes,
                                           int& visited) {
    for (const auto& [name, raw] : attributes) {
        ++visited;
        auto value = quoted_attr(raw, name);
        if (!value) {
            return make_error(std::move(value).error());
        }
    }
    return {};
}

class TrackedNode : public RefCounted {
public:
    explicit TrackedNode(int& destroyed) : m_destroyed(destroyed) {}
    ~TrackedNode() override { ++m_destroyed; }

private:
    int& m_destroyed;
};

class TrackedElement : public TrackedNode {
public:
    using TrackedNode::TrackedNode;
};

} // namespace

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, ValueCarriesGeneratedCode) {
    auto result = quoted_attr("users"_s, "value"_s);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), "'users'"_s);
}

TEST(ResultTest, ErrorNamesTheAttribute) {
    auto result = quoted_attr(std::nullopt, "value"_s);

    ASSERT_TRUE(result.is_err());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error().attribute, "value"_s);
}

TEST(ResultTest, SameValueAndErrorTypeStaysUnambiguous) {
    Result<String, String> code = "echo $x;"_s;
    Result<String, String> failure = make_error("unresolved"_s);

    ASSERT_TRUE(code.is_ok());
    EXPECT_EQ(code.value(), "echo $x;"_s);
    ASSERT_TRUE(failure.is_err());
    EXPECT_EQ(failure.error(), "unresolved"_s);
}

TEST(ResultTest, CopyAndMoveKeepTheAlternative) {
    Result<String, String> original = "fragment"_s;
    Result<String, String> copy = original;
    Result<String, String> moved = std::move(copy);

    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value(), "fragment"_s);
    EXPECT_EQ(original.value(), "fragment"_s);

    Result<String, String> failed = make_error("bad"_s);
    Result<String, String> failed_copy = failed;
    ASSERT_TRUE(failed_copy.is_err());
    EXPECT_EQ(failed_copy.error(), "bad"_s);
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<String>, String> result = std::make_unique<String>("owned");

    ASSERT_TRUE(result.is_ok());
    auto owned = std::move(result).value();
    ASSERT_TRUE(owned);
    EXPECT_EQ(*owned, "owned"_s);
}

TEST(ResultTest, VoidResultStopsAtFirstFailure) {
    int visited = 0;
    auto ok = require_all({{"var"_s, "$x"_s}, {"value"_s, "1"_s}}, visited);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(visited, 2);

    visited = 0;
    auto failed = require_all({{"var"_s, "$x"_s}, {"test"_s, std::nullopt}, {"value"_s, std::nullopt}}, visited);
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().attribute, "test"_s);
    EXPECT_EQ(visited, 2);
}

// ============================================================================
// RefPtr
// ============================================================================

TEST(RefPtrTest, MakeRefHoldsOneReference) {
    int destroyed = 0;
    {
        auto node = make_ref<TrackedNode>(destroyed);
        ASSERT_TRUE(node);
        EXPECT_EQ(node->ref_count(), 1u);
    }
    EXPECT_EQ(destroyed, 1);
}

TEST(RefPtrTest, CopiesShareOneObject) {
    int destroyed = 0;
    auto node = make_ref<TrackedNode>(destroyed);
    auto parent_link = node;

    EXPECT_EQ(node->ref_count(), 2u);
    EXPECT_TRUE(node == parent_link);

    node = nullptr;
    EXPECT_EQ(destroyed, 0);
    EXPECT_EQ(parent_link->ref_count(), 1u);

    parent_link = nullptr;
    EXPECT_EQ(destroyed, 1);
}

TEST(RefPtrTest, MoveTransfersWithoutRetaining) {
    int destroyed = 0;
    auto node = make_ref<TrackedNode>(destroyed);
    auto* raw = node.get();

    RefPtr<TrackedNode> taken = std::move(node);
    EXPECT_EQ(taken.get(), raw);
    EXPECT_EQ(taken->ref_count(), 1u);
    EXPECT_TRUE(node == nullptr);
}

TEST(RefPtrTest, ElementUpcastsToNode) {
    int destroyed = 0;
    auto element = make_ref<TrackedElement>(destroyed);
    RefPtr<TrackedNode> node = element;

    EXPECT_EQ(node.get(), element.get());
    EXPECT_EQ(element->ref_count(), 2u);

    element = nullptr;
    EXPECT_EQ(destroyed, 0);
}

TEST(RefPtrTest, ChildListKeepsNodesAlive) {
    int destroyed = 0;
    std::vector<RefPtr<TrackedNode>> children;
    {
        auto first = make_ref<TrackedNode>(destroyed);
        children.push_back(first);
        children.push_back(make_ref<TrackedElement>(destroyed));
    }
    EXPECT_EQ(destroyed, 0);
    EXPECT_EQ(children[0]->ref_count(), 1u);

    children.erase(children.begin());
    EXPECT_EQ(destroyed, 1);

    children.clear();
    EXPECT_EQ(destroyed, 2);
}

TEST(RefPtrTest, AssigningTheSameObjectKeepsIt) {
    int destroyed = 0;
    auto node = make_ref<TrackedNode>(destroyed);
    const auto& alias = node;

    node = alias;
    EXPECT_EQ(destroyed, 0);
    EXPECT_EQ(node->ref_count(), 1u);
}

TEST(RefPtrTest, DefaultIsNull) {
    RefPtr<TrackedNode> empty;

    EXPECT_FALSE(empty);
    EXPECT_TRUE(empty == nullptr);
    EXPECT_EQ(empty.get(), nullptr);
}
