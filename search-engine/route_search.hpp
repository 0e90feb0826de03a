#ifndef __ROUTE_SEARCH_HPP___
#define __ROUTE_SEARCH_HPP___

/**
 * @file route_search.hpp
 * @brief Best-first route search over a RoadGraph: Dijkstra, or A* with a heuristic table.
 */

#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "frontier.hpp"
#include "graph.hpp"
#include "heuristic.hpp"
#include "weight.hpp"

/**
 * @brief Outcome of a successful search.
 */
struct RouteResult {
    std::vector<std::string> path;  ///< start first, goal last
    Weight distance = 0;            ///< sum of road weights along path
    int expanded = 0;               ///< locations popped and processed
};

/**
 * @brief One best-first search from a start to a goal location.
 *
 * Without a heuristic table locations are expanded by distance from the start
 * (Dijkstra). With one, by distance plus h(location, goal) (A*); the table
 * must be admissible for the route to be optimal and consistent for every
 * location to be expanded once.
 *
 * The search is driven step by step:
 * SEARCH_STATE_IDLE -> SEARCH_STATE_SEARCHING -> SEARCH_STATE_SUCCEEDED or
 * SEARCH_STATE_FAILED. A finished search cannot be restarted.
 */
class RouteSearch {
public:
    enum SearchState {
        SEARCH_STATE_IDLE,
        SEARCH_STATE_SEARCHING,
        SEARCH_STATE_SUCCEEDED,
        SEARCH_STATE_FAILED
    };

    /**
     * @param graph Road graph; must outlive the search.
     * @param heuristic Estimates for A*, or nullptr for Dijkstra; must outlive the search.
     */
    explicit RouteSearch(const RoadGraph& graph, const HeuristicTable* heuristic = nullptr);

    /**
     * @brief Seed the frontier with the start location.
     *
     * @throws UnknownNode if start or goal is not in the graph.
     * @throws MissingHeuristic if A* has no estimate for the start.
     * @throws std::logic_error if the search has already been started.
     */
    void set_start_and_goal(const std::string& start, const std::string& goal);

    /**
     * @brief Pop one location from the frontier and relax its roads.
     *
     * @return The state after the step.
     * @throws MissingHeuristic if A* meets a location without an estimate
     *         (the search is then SEARCH_STATE_FAILED).
     */
    SearchState search_step();

    SearchState state() const { return state_; }
    int expanded_nodes() const { return expanded_; }

    /**
     * @brief Route found by a succeeded search.
     *
     * @throws UnreachableRoute if the frontier ran out before reaching the goal.
     * @throws MissingHeuristic if the search failed on a missing estimate.
     * @throws std::logic_error if the search has not finished.
     */
    RouteResult result() const;

private:
    Weight priority_of(NodeId node, Weight distance) const;
    std::vector<std::string> reconstruct_path() const;

    const RoadGraph& graph_;
    const HeuristicTable* heuristic_;
    NodeId start_ = 0;
    NodeId goal_ = 0;

    std::vector<Weight> dist_;
    std::vector<std::optional<NodeId>> prev_;
    RouteFrontier frontier_;
    int expanded_ = 0;

    SearchState state_ = SEARCH_STATE_IDLE;
    std::exception_ptr failure_;
};

/**
 * @brief Run a complete search and return the route.
 *
 * @param graph Road graph to search.
 * @param heuristic Estimates for A*, or nullptr for Dijkstra.
 * @param start Start location label.
 * @param goal Goal location label.
 * @throws UnknownNode, MissingHeuristic, UnreachableRoute
 */
RouteResult search_route(const RoadGraph& graph, const HeuristicTable* heuristic,
                         const std::string& start, const std::string& goal);

#endif // __ROUTE_SEARCH_HPP___
