#include "route-a-star-solver.hpp"
#include "route_search.hpp"

std::vector<std::string> RouteSolveAstar(const RoadGraph &graph, const HeuristicTable &heuristic,
                                         const std::string &start, const std::string &goal,
                                         int* expanded_nodes, Weight* distance) {
    RouteSearch search(graph, &heuristic);
    search.set_start_and_goal(start, goal);

    RouteSearch::SearchState result;
    do {
        result = search.search_step();
    } while (result == RouteSearch::SEARCH_STATE_SEARCHING);

    if (expanded_nodes) {
        *expanded_nodes = search.expanded_nodes();
    }

    std::vector<std::string> path;
    if (result == RouteSearch::SEARCH_STATE_SUCCEEDED) {
        RouteResult route = search.result();
        path = route.path;
        if (distance) *distance = route.distance;
    }
    return path;
}
