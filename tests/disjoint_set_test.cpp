#include "disjoint_set.hpp"
#include <gtest/gtest.h>

using namespace mazegen;

TEST(DisjointSetTest, StartsAsSingletons) {
    DisjointSet sets(5);

    EXPECT_EQ(sets.size(), 5u);
    EXPECT_EQ(sets.set_count(), 5u);
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(sets.find(i), i);
    }
}

TEST(DisjointSetTest, UniteMergesSets) {
    DisjointSet sets(6);

    EXPECT_TRUE(sets.unite(0, 1));
    EXPECT_TRUE(sets.unite(2, 3));
    EXPECT_TRUE(sets.unite(1, 3));

    EXPECT_EQ(sets.find(0), sets.find(2));
    EXPECT_NE(sets.find(0), sets.find(4));
    EXPECT_EQ(sets.set_count(), 3u);
}

TEST(DisjointSetTest, UniteWithinSameSetIsRejected) {
    DisjointSet sets(3);
    sets.unite(0, 1);
    sets.unite(1, 2);

    EXPECT_FALSE(sets.unite(0, 2)) << "Would close a cycle";
    EXPECT_FALSE(sets.unite(2, 2));
    EXPECT_EQ(sets.set_count(), 1u);
}

TEST(DisjointSetTest, LongChainCollapses) {
    const std::size_t n = 1000;
    DisjointSet sets(n);
    for (std::size_t i = 1; i < n; ++i) {
        EXPECT_TRUE(sets.unite(i - 1, i));
    }

    std::size_t root = sets.find(0);
    for (std::size_t i = 0; i < n; ++i) {
        EXPECT_EQ(sets.find(i), root);
    }
    EXPECT_EQ(sets.set_count(), 1u);
}
