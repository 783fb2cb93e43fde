#include "gtest/gtest.h"
#include <blasttab/ranges.hpp>
#include <common/disjoint_sets.hpp>

using namespace blasttab;

TEST(RangeDistanceTest, OuterSpan) {
    RangeDistance d1 = rangeDistance({"1", 30, 45, '+'}, {"1", 45, 55, '+'}, DistMode::OuterSpan);
    ASSERT_EQ(d1.distance, 26);
    ASSERT_EQ(d1.orientation, "++");
    RangeDistance d2 = rangeDistance({"1", 30, 45, '-'}, {"1", 57, 68, '-'}, DistMode::OuterSpan);
    ASSERT_EQ(d2.distance, 39);
    ASSERT_EQ(d2.orientation, "--");
    RangeDistance d3 = rangeDistance({"1", 30, 42, '-'}, {"1", 45, 55, '+'}, DistMode::OuterSpan);
    ASSERT_EQ(d3.distance, 26);
    ASSERT_EQ(d3.orientation, "-+");
}

TEST(RangeDistanceTest, EdgeToEdge) {
    RangeDistance d = rangeDistance({"1", 30, 42, '+'}, {"1", 45, 55, '-'}, DistMode::EdgeToEdge);
    ASSERT_EQ(d.distance, 2);
    ASSERT_EQ(d.orientation, "+-");
    RangeDistance overlap = rangeDistance({"1", 1, 100, '+'}, {"1", 50, 150, '+'}, DistMode::EdgeToEdge);
    ASSERT_EQ(overlap.distance, -51);
}

TEST(RangeDistanceTest, OrderedByStart) {
    RangeDistance d = rangeDistance({"1", 45, 55, '+'}, {"1", 30, 42, '-'}, DistMode::OuterSpan);
    ASSERT_EQ(d.distance, 26);
    ASSERT_EQ(d.orientation, "-+");
    RangeDistance e = rangeDistance({"1", 45, 55, '+'}, {"1", 30, 42, '-'}, DistMode::EdgeToEdge);
    ASSERT_EQ(e.distance, 2);
}

TEST(RangeDistanceTest, DifferentSequences) {
    RangeDistance d = rangeDistance({"1", 30, 45, '+'}, {"2", 45, 55, '-'}, DistMode::OuterSpan);
    ASSERT_EQ(d.distance, -1);
    ASSERT_EQ(d.orientation, "+-");
}

TEST(RangeDistanceTest, ModeNames) {
    ASSERT_EQ(ParseDistMode("ss"), DistMode::OuterSpan);
    ASSERT_EQ(ParseDistMode("ee"), DistMode::EdgeToEdge);
    ASSERT_EQ(DistModeName(DistMode::EdgeToEdge), "ee");
    ASSERT_THROW(ParseDistMode("se"), std::invalid_argument);
}

TEST(DisjointSetTest, Components) {
    DisjointSet sets(5);
    sets.link(0, 3);
    sets.link(4, 3);
    sets.link(3, 0);
    ASSERT_EQ(sets.get(4), sets.get(0));
    ASSERT_NE(sets.get(1), sets.get(0));
    std::vector<std::vector<size_t>> subsets = sets.subsets();
    std::vector<std::vector<size_t>> expected = {{0, 3, 4}, {1}, {2}};
    ASSERT_EQ(subsets, expected);
}

TEST(DisjointSetTest, AddHandles) {
    DisjointSet sets;
    size_t a = sets.add();
    size_t b = sets.add();
    size_t c = sets.add();
    sets.link(a, c);
    ASSERT_EQ(sets.size(), 3u);
    ASSERT_EQ(sets.get(a), sets.get(c));
    ASSERT_NE(sets.get(a), sets.get(b));
    ASSERT_EQ(sets.subsets().size(), 2u);
}
