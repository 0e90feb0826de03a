#ifndef ROUTE_ASTAR_SOLVER_HPP
#define ROUTE_ASTAR_SOLVER_HPP

#include <string>
#include <vector>

#include "graph.hpp"
#include "heuristic.hpp"
#include "weight.hpp"

/**
 * @file route-a-star-solver.hpp
 * @brief A* solver adapter for the road graph.
 */

/**
 * @brief Find the shortest route using A* guided by a heuristic table.
 *
 * @param graph Road graph to search.
 * @param heuristic Admissible estimates h(location, goal).
 * @param start Start location label.
 * @param goal Goal location label.
 * @param expanded_nodes Optional out-parameter to receive number of expanded locations.
 * @param distance Optional out-parameter to receive the route length in tenths.
 * @return Sequence of locations from start to goal (empty if no route exists).
 * @throws UnknownNode if start or goal is not in the graph.
 * @throws MissingHeuristic if an estimate needed by the search is absent.
 */
std::vector<std::string> RouteSolveAstar(const RoadGraph &graph, const HeuristicTable &heuristic,
                                         const std::string &start, const std::string &goal,
                                         int* expanded_nodes = nullptr, Weight* distance = nullptr);

#endif // ROUTE_ASTAR_SOLVER_HPP
