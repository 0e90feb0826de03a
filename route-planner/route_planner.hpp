#ifndef __ROUTE_PLANNER_HPP___
#define __ROUTE_PLANNER_HPP___

#include <istream>
#include <ostream>
#include <string>

#include "graph.hpp"
#include "heuristic.hpp"
#include "route_search.hpp"

/**
 * @file route_planner.hpp
 * @brief Interactive console that compares A* and Dijkstra routes between two locations.
 */

/**
 * @brief Console front end over a loaded road graph and heuristic table.
 *
 * Reads start and destination labels from `in` and writes listings, routes
 * and timings to `out`. Typing "quit" (any case) at a prompt, or reaching the
 * end of the input, ends the loop.
 */
class RoutePlanner {
public:
    RoutePlanner(const RoadGraph &graph, const HeuristicTable &heuristic,
                 std::istream &in, std::ostream &out, bool clear_screen = true);

    /**
     * @brief Prompt for routes until the user quits.
     */
    void run();

    /**
     * @brief Run A* and then Dijkstra from `from` to `to` and print both results.
     *
     * Errors of either run are printed as a single line and do not stop the
     * other run.
     *
     * @return true if both runs found a route.
     */
    bool compare_routes(const std::string &from, const std::string &to);

    /**
     * @brief Print every location, five per row.
     */
    void list_locations();

private:
    bool read_answer(std::string &answer);
    void clear_screen();
    void wait_for_enter();
    bool run_search(const HeuristicTable *heuristic, const std::string &from,
                    const std::string &to, long long &micros);
    void print_route(const RouteResult &route);

    const RoadGraph &graph_;
    const HeuristicTable &heuristic_;
    std::istream &in_;
    std::ostream &out_;
    bool clear_screen_;
};

#endif // __ROUTE_PLANNER_HPP___
