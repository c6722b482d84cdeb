#include <stdexcept>
#include <vector>

#include "SearchTree.hpp"
#include "gtest/gtest.h"

TEST(SearchTree, ResetKeepsOnlyRoot) {
    SearchTree tree;
    tree.reset(Cell(1, 2));
    tree.add(Cell(3, 4), 0);
    tree.reset(Cell(5, 6));

    ASSERT_EQ(tree.size(), 1);
    EXPECT_EQ(tree.node(0).position, Cell(5, 6));
    EXPECT_EQ(tree.node(0).parent, SearchTree::kNoParent);
    EXPECT_TRUE(tree.node(0).children.empty());
    EXPECT_FALSE(tree.contains(Cell(3, 4)));
}

TEST(SearchTree, AddLinksParentAndChild) {
    SearchTree tree;
    tree.reset(Cell(0, 0));
    int a = tree.add(Cell(10, 0), 0);
    int b = tree.add(Cell(0, 10), 0);
    int c = tree.add(Cell(20, 0), a);

    EXPECT_EQ(tree.size(), 4);
    EXPECT_EQ(tree.node(a).parent, 0);
    EXPECT_EQ(tree.node(c).parent, a);
    EXPECT_EQ(tree.node(0).children, (std::vector<int>{a, b}));
    EXPECT_EQ(tree.node(a).children, (std::vector<int>{c}));
    EXPECT_TRUE(tree.contains(Cell(20, 0)));
    EXPECT_FALSE(tree.contains(Cell(30, 0)));
}

TEST(SearchTree, PositionsAreUnique) {
    SearchTree tree;
    tree.reset(Cell(0, 0));
    tree.add(Cell(10, 0), 0);
    EXPECT_THROW(tree.add(Cell(10, 0), 0), std::invalid_argument);
    EXPECT_THROW(tree.add(Cell(0, 0), 1), std::invalid_argument);
    EXPECT_EQ(tree.size(), 2);
}

TEST(SearchTree, RejectsUnknownParent) {
    SearchTree tree;
    tree.reset(Cell(0, 0));
    EXPECT_THROW(tree.add(Cell(1, 1), 1), std::out_of_range);
    EXPECT_THROW(tree.add(Cell(1, 1), SearchTree::kNoParent), std::out_of_range);
    EXPECT_THROW(tree.node(3), std::out_of_range);
}

TEST(ExtractPath, RootToTerminal) {
    SearchTree tree;
    tree.reset(Cell(0, 0));
    int a = tree.add(Cell(10, 0), 0);
    tree.add(Cell(0, 10), 0);
    int c = tree.add(Cell(20, 0), a);
    int d = tree.add(Cell(20, 10), c);

    std::vector<Cell> expected{Cell(0, 0), Cell(10, 0), Cell(20, 0), Cell(20, 10)};
    EXPECT_EQ(tree.extract_path(d), expected);
}

TEST(ExtractPath, RootOnly) {
    SearchTree tree;
    tree.reset(Cell(7, 7));
    EXPECT_EQ(tree.extract_path(0), std::vector<Cell>{Cell(7, 7)});
}

TEST(ExtractPath, UnknownTerminalFailsLoudly) {
    SearchTree tree;
    tree.reset(Cell(7, 7));
    EXPECT_THROW(tree.extract_path(4), std::logic_error);
}
