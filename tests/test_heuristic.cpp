// Google Test for HeuristicTable and the consistency check
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "graph.hpp"
#include "heuristic.hpp"
#include "route_errors.hpp"

TEST(HeuristicTableTest, EstimatesAreOrdered) {
    HeuristicTable h;
    h.set("A", "B", 12);

    EXPECT_EQ(h.estimate("A", "B"), 12u);
    EXPECT_TRUE(h.contains("A", "B"));
    EXPECT_FALSE(h.contains("B", "A"));
    EXPECT_THROW(h.estimate("B", "A"), MissingHeuristic);
}

TEST(HeuristicTableTest, SelfEstimateIsZeroWithoutEntry) {
    HeuristicTable h;
    EXPECT_EQ(h.estimate("G", "G"), 0u);
}

TEST(HeuristicTableTest, NonZeroSelfEstimateIsRejected) {
    HeuristicTable h;
    EXPECT_THROW(h.set("G", "G", 5), InvalidWeight);
    h.set("G", "G", 0);
    EXPECT_EQ(h.size(), 1u);
}

TEST(HeuristicTableTest, SetReplacesExistingEntry) {
    HeuristicTable h;
    h.set("A", "B", 12);
    h.set("A", "B", 8);
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.estimate("A", "B"), 8u);
}

TEST(HeuristicTableTest, EntriesAreSortedByGoalThenLocation) {
    HeuristicTable h;
    h.set("C", "B", 3);
    h.set("A", "B", 1);
    h.set("B", "A", 2);

    auto entries = h.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].from, "B");
    EXPECT_EQ(entries[0].goal, "A");
    EXPECT_EQ(entries[1].from, "A");
    EXPECT_EQ(entries[1].goal, "B");
    EXPECT_EQ(entries[2].from, "C");
    EXPECT_EQ(entries[2].estimate, 3u);
}

TEST(HeuristicConsistency, ConsistentTableHasNoViolations) {
    RoadGraph g;
    g.add_edge("S", "X", 20);
    g.add_edge("X", "G", 20);
    g.add_edge("S", "Y", 10);
    g.add_edge("Y", "G", 50);
    HeuristicTable h;
    h.set("S", "G", 40);
    h.set("X", "G", 20);
    h.set("Y", "G", 20);

    EXPECT_TRUE(find_inconsistent_estimates(g, h, {"G"}).empty());
}

TEST(HeuristicConsistency, ReportsRoadWhereEstimateDropsTooFast) {
    RoadGraph g;
    g.add_edge("A", "C", 10);
    g.add_edge("C", "G", 100);
    HeuristicTable h;
    h.set("A", "G", 50);
    h.set("C", "G", 0);

    auto violations = find_inconsistent_estimates(g, h, {"G"});
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].from, "A");
    EXPECT_EQ(violations[0].to, "C");
    EXPECT_EQ(violations[0].goal, "G");
    EXPECT_EQ(violations[0].from_estimate, 50u);
    EXPECT_EQ(violations[0].to_estimate, 0u);
    EXPECT_EQ(violations[0].road_weight, 10u);
}

TEST(HeuristicConsistency, MissingEstimatesAreSkippedNotFilled) {
    RoadGraph g;
    g.add_edge("A", "B", 10);
    HeuristicTable h;
    h.set("A", "G", 50);

    EXPECT_TRUE(find_inconsistent_estimates(g, h, {"G"}).empty());
    EXPECT_FALSE(h.contains("B", "G"));
}
