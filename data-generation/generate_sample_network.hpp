#ifndef __GENERATE_SAMPLE_NETWORK_HPP___
#define __GENERATE_SAMPLE_NETWORK_HPP___

#include <random>

#include "graph.hpp"
#include "heuristic.hpp"

/**
 * @file generate_sample_network.hpp
 * @brief Random road networks with a straight-line heuristic, for benchmarks and tests.
 *
 * Locations `L0 .. L{n-1}` are scattered uniformly over a 100 x 100 plane.
 * Each location is joined to the next one (so the network is connected) and to
 * its `degree` nearest neighbours. A road is at least as long as the straight
 * line between its endpoints (a random detour factor in [1, 1.5) is applied and
 * the result rounded up to tenths), while the heuristic holds a slightly shrunk
 * straight-line distance rounded down to tenths. The estimates are therefore
 * admissible and consistent.
 */

/**
 * @brief A generated road graph together with its heuristic table.
 */
struct SampleNetwork {
    RoadGraph graph;
    HeuristicTable heuristic;
};

/**
 * @brief Generate a random connected road network and its heuristic table.
 *
 * @param node_count Number of locations (at least 1).
 * @param degree Number of nearest neighbours each location is joined to.
 * @param rng Random number generator to use (std::mt19937).
 * @throws std::invalid_argument if node_count < 1 or degree < 0.
 * @return Road graph plus estimates for every ordered pair of locations.
 */
SampleNetwork random_road_network(int node_count, int degree, std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_NETWORK_HPP___
