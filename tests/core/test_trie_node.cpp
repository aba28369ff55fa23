#include <gtest/gtest.h>

#include <string>

#include "core/trie_node.hpp"

using namespace lexitrie::core;

using Node = TrieNode<char, int>;

class TrieNodeTest : public ::testing::Test {
protected:
    Node root;
};

TEST_F(TrieNodeTest, NewNodeIsEmpty) {
    EXPECT_FALSE(root.hasValue());
    EXPECT_TRUE(root.isLeaf());
    EXPECT_TRUE(root.isRoot());
    EXPECT_TRUE(root.isPrunable());
    EXPECT_EQ(root.count(), 0);
}

TEST_F(TrieNodeTest, ChildCreationDoesNotTouchCounts) {
    auto& child = root.childOrCreate('a');
    child.childOrCreate('b');

    EXPECT_EQ(root.count(), 0);
    EXPECT_EQ(child.count(), 0);
    EXPECT_EQ(child.parent(), &root);
    EXPECT_FALSE(child.isRoot());
}

TEST_F(TrieNodeTest, ChildOrCreateReusesExistingChild) {
    auto& first = root.childOrCreate('a');
    auto& second = root.childOrCreate('a');

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(root.children().size(), 1);
    EXPECT_EQ(root.childFor('a'), &first);
    EXPECT_EQ(root.childFor('z'), nullptr);
}

TEST_F(TrieNodeTest, AttachValuePropagatesToAncestors) {
    auto& a = root.childOrCreate('a');
    auto& b = a.childOrCreate('b');

    EXPECT_TRUE(b.attachValue(7));
    EXPECT_EQ(b.count(), 1);
    EXPECT_EQ(a.count(), 1);
    EXPECT_EQ(root.count(), 1);

    EXPECT_TRUE(a.attachValue(3));
    EXPECT_EQ(b.count(), 1);
    EXPECT_EQ(a.count(), 2);
    EXPECT_EQ(root.count(), 2);
}

TEST_F(TrieNodeTest, OverwriteKeepsCounts) {
    auto& a = root.childOrCreate('a');
    EXPECT_TRUE(a.attachValue(1));
    EXPECT_FALSE(a.attachValue(2));

    EXPECT_EQ(*a.value(), 2);
    EXPECT_EQ(a.count(), 1);
    EXPECT_EQ(root.count(), 1);
}

TEST_F(TrieNodeTest, ClearValuePropagatesDecrement) {
    auto& a = root.childOrCreate('a');
    auto& b = a.childOrCreate('b');
    b.attachValue(1);
    a.attachValue(2);

    EXPECT_TRUE(b.clearValue());
    EXPECT_FALSE(b.clearValue());
    EXPECT_EQ(b.count(), 0);
    EXPECT_EQ(a.count(), 1);
    EXPECT_EQ(root.count(), 1);
    EXPECT_TRUE(b.isPrunable());
}

TEST_F(TrieNodeTest, RemoveChildDropsSubtreeCount) {
    auto& a = root.childOrCreate('a');
    a.attachValue(1);
    a.childOrCreate('b').attachValue(2);
    root.childOrCreate('c').attachValue(3);
    ASSERT_EQ(root.count(), 3);

    EXPECT_TRUE(root.removeChild('a'));
    EXPECT_FALSE(root.removeChild('a'));
    EXPECT_EQ(root.count(), 1);
    EXPECT_EQ(root.childFor('a'), nullptr);
}

TEST_F(TrieNodeTest, ChildrenKeepInsertionOrder) {
    root.childOrCreate('m');
    root.childOrCreate('a');
    root.childOrCreate('z');
    root.childOrCreate('b');
    root.removeChild('a');

    std::string order;
    for (const auto& [symbol, child] : root.children()) {
        order.push_back(symbol);
    }
    EXPECT_EQ(order, "mzb");
}

TEST_F(TrieNodeTest, ResetClearsEverything) {
    root.attachValue(0);
    root.childOrCreate('a').attachValue(1);
    root.childOrCreate('b').childOrCreate('c').attachValue(2);
    ASSERT_EQ(root.count(), 3);

    root.reset();
    EXPECT_EQ(root.count(), 0);
    EXPECT_FALSE(root.hasValue());
    EXPECT_TRUE(root.isLeaf());
}

TEST_F(TrieNodeTest, DeepChainsAreReleased) {
    constexpr std::size_t DEPTH = 1'000'000;

    Node* tip = &root.childOrCreate('a');
    for (std::size_t i = 1; i < DEPTH; ++i) {
        tip = &tip->childOrCreate('a');
    }
    tip->attachValue(1);
    root.childOrCreate('b').attachValue(2);
    ASSERT_EQ(root.count(), 2);

    EXPECT_TRUE(root.removeChild('a'));
    EXPECT_EQ(root.count(), 1);

    tip = &root;
    for (std::size_t i = 0; i < DEPTH; ++i) {
        tip = &tip->childOrCreate('c');
    }
    tip->attachValue(3);
    root.clearChildren();
    EXPECT_EQ(root.count(), 0);
    EXPECT_TRUE(root.isLeaf());

    // Left for the destructor
    Node scoped;
    tip = &scoped;
    for (std::size_t i = 0; i < DEPTH; ++i) {
        tip = &tip->childOrCreate('d');
    }
    tip->attachValue(4);
    EXPECT_EQ(scoped.count(), 1);
}
