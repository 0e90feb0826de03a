// Google Test for the sample road network generator
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <string>

#include "generate_sample_network.hpp"
#include "route-dijkstra-solver.hpp"

TEST(SampleNetwork, HasRequestedLocationsAndFullHeuristic) {
    std::mt19937 rng(3);
    SampleNetwork network = random_road_network(25, 3, rng);

    EXPECT_EQ(network.graph.node_count(), 25u);
    EXPECT_GE(network.graph.edge_count(), 24u);
    EXPECT_EQ(network.heuristic.size(), 25u * 25u);
    EXPECT_EQ(network.heuristic.estimate("L4", "L4"), 0u);
}

TEST(SampleNetwork, IsConnected) {
    std::mt19937 rng(11);
    SampleNetwork network = random_road_network(30, 0, rng);

    for (const auto& label : network.graph.nodes()) {
        EXPECT_FALSE(RouteSolveDijkstra(network.graph, "L0", label).empty()) << label;
    }
}

TEST(SampleNetwork, HeuristicIsConsistent) {
    std::mt19937 rng(5);
    SampleNetwork network = random_road_network(40, 4, rng);

    auto violations = find_inconsistent_estimates(network.graph, network.heuristic, network.graph.nodes());
    EXPECT_TRUE(violations.empty());
}

TEST(SampleNetwork, SameSeedGivesSameNetwork) {
    std::mt19937 rng_a(99);
    std::mt19937 rng_b(99);
    SampleNetwork a = random_road_network(20, 3, rng_a);
    SampleNetwork b = random_road_network(20, 3, rng_b);

    EXPECT_EQ(a.graph.nodes(), b.graph.nodes());
    ASSERT_EQ(a.graph.edge_count(), b.graph.edge_count());
    for (const auto& from : a.graph.nodes()) {
        EXPECT_EQ(a.graph.neighbors(from), b.graph.neighbors(from));
    }
}

TEST(SampleNetwork, SingleLocation) {
    std::mt19937 rng(1);
    SampleNetwork network = random_road_network(1, 3, rng);
    EXPECT_EQ(network.graph.node_count(), 1u);
    EXPECT_EQ(RouteSolveDijkstra(network.graph, "L0", "L0").size(), 1u);
}

TEST(SampleNetwork, InvalidArgumentsThrow) {
    std::mt19937 rng(1);
    EXPECT_THROW(random_road_network(0, 3, rng), std::invalid_argument);
    EXPECT_THROW(random_road_network(5, -1, rng), std::invalid_argument);
}
