#ifndef __ROUTE_DIJKSTRA_SOLVER_HPP___
#define __ROUTE_DIJKSTRA_SOLVER_HPP___

#include <string>
#include <vector>

#include "graph.hpp"
#include "weight.hpp"

/**
 * @file route-dijkstra-solver.hpp
 * @brief Uninformed (Dijkstra) solver adapter for the road graph.
 */

/**
 * @brief Find the shortest route expanding locations by distance from the start.
 *
 * @param graph Road graph to search.
 * @param start Start location label.
 * @param goal Goal location label.
 * @param expanded_nodes Optional out-parameter to receive number of expanded locations.
 * @param distance Optional out-parameter to receive the route length in tenths.
 * @return Sequence of locations from start to goal (empty if no route exists).
 * @throws UnknownNode if start or goal is not in the graph.
 */
std::vector<std::string> RouteSolveDijkstra(const RoadGraph &graph, const std::string &start,
                                            const std::string &goal, int* expanded_nodes = nullptr,
                                            Weight* distance = nullptr);

#endif // __ROUTE_DIJKSTRA_SOLVER_HPP___
