// Google Test for the interactive route planner
#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <string>

#include "graph.hpp"
#include "heuristic.hpp"
#include "route_planner.hpp"

class RoutePlannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph.add_edge("A", "B", 10);
        graph.add_edge("B", "C", 15);
        graph.add_edge("D", "E", 10);
        heuristic.set("A", "C", 20);
        heuristic.set("B", "C", 10);
        heuristic.set("A", "B", 10);
    }

    std::string run_with_input(const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        RoutePlanner planner(graph, heuristic, in, out, false);
        planner.run();
        return out.str();
    }

    RoadGraph graph;
    HeuristicTable heuristic;
};

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST_F(RoutePlannerTest, ComparesBothAlgorithms) {
    std::string out = run_with_input("A\nC\n\nquit\n");

    EXPECT_TRUE(contains(out, "Running A* Algorithm..."));
    EXPECT_TRUE(contains(out, "Running Dijkstra Algorithm..."));
    EXPECT_TRUE(contains(out, "Take A to B: 1.0 mi.\nTake B to C: 1.5 mi.\nTotal distance: 2.5 mi."));
    EXPECT_TRUE(contains(out, "3 nodes considered"));
    EXPECT_TRUE(contains(out, "A* time to compute: "));
    EXPECT_TRUE(contains(out, "Dijkstra time to compute: "));
    EXPECT_TRUE(contains(out, "Press ENTER to continue..."));
}

TEST_F(RoutePlannerTest, ListsLocationsFivePerRow) {
    std::istringstream in("");
    std::ostringstream out;
    graph.add_edge("F", "G", 10);
    RoutePlanner planner(graph, heuristic, in, out, false);
    planner.list_locations();

    std::string expected = "Your Locations:\n\n"
                           "A              B              C              D              E              \n"
                           "F              G              \n";
    EXPECT_EQ(out.str(), expected);
}

TEST_F(RoutePlannerTest, QuitIsCaseInsensitive) {
    std::string at_start = run_with_input("QuIt\n");
    EXPECT_FALSE(contains(at_start, "Running"));
    EXPECT_FALSE(contains(at_start, "What city are you going to?"));

    std::string at_destination = run_with_input("A\nQUIT\n");
    EXPECT_TRUE(contains(at_destination, "What city are you going to?"));
    EXPECT_FALSE(contains(at_destination, "Running"));
}

TEST_F(RoutePlannerTest, EndOfInputEndsLoop) {
    std::string out = run_with_input("A\n");
    EXPECT_FALSE(contains(out, "Running"));
}

TEST_F(RoutePlannerTest, UnknownLocationPrintsOneLineAndContinues) {
    std::string out = run_with_input("A\nZ\n\nA\nB\n\nquit\n");

    EXPECT_TRUE(contains(out, "Cannot route: one or more locations do not exist.\n"));
    EXPECT_TRUE(contains(out, "Take A to B: 1.0 mi."));
}

TEST_F(RoutePlannerTest, BothModesReportUnreachableRoutes) {
    std::istringstream in("");
    std::ostringstream out;
    RoutePlanner planner(graph, heuristic, in, out, false);

    heuristic.set("A", "E", 0);
    heuristic.set("B", "E", 0);
    heuristic.set("C", "E", 0);
    EXPECT_FALSE(planner.compare_routes("A", "E"));

    std::string text = out.str();
    size_t first = text.find("Route could not be completed from A to E");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(text.find("Route could not be completed from A to E", first + 1), std::string::npos);
    EXPECT_FALSE(contains(text, "time to compute"));
}

TEST_F(RoutePlannerTest, MissingEstimateOnlyFailsAStar) {
    std::istringstream in("");
    std::ostringstream out;
    RoutePlanner planner(graph, heuristic, in, out, false);

    EXPECT_FALSE(planner.compare_routes("C", "A"));
    std::string text = out.str();
    EXPECT_TRUE(contains(text, "No heuristic estimate from C to A"));
    EXPECT_TRUE(contains(text, "Take C to B: 1.5 mi."));
    EXPECT_FALSE(contains(text, "A* time to compute"));
    EXPECT_TRUE(contains(text, "Dijkstra time to compute"));
}

TEST_F(RoutePlannerTest, OverflowingDistanceIsReportedNotFatal) {
    const Weight half = std::numeric_limits<Weight>::max() / 2;
    graph.add_edge("P", "Q", half);
    graph.add_edge("Q", "R", half);
    graph.add_edge("R", "S", half);

    std::string out = run_with_input("P\nS\n\nA\nC\n\nquit\n");
    EXPECT_TRUE(contains(out, "Distance sum overflows"));
    EXPECT_TRUE(contains(out, "Take A to B: 1.0 mi."));
}

TEST_F(RoutePlannerTest, ClearScreenIsOptional) {
    std::istringstream in("quit\n");
    std::ostringstream out;
    RoutePlanner planner(graph, heuristic, in, out, true);
    planner.run();
    EXPECT_TRUE(contains(out.str(), "\033[2J"));

    EXPECT_FALSE(contains(run_with_input("quit\n"), "\033[2J"));
}
