#include "route-dijkstra-solver.hpp"
#include "route_search.hpp"

std::vector<std::string> RouteSolveDijkstra(const RoadGraph &graph, const std::string &start,
                                            const std::string &goal, int* expanded_nodes,
                                            Weight* distance) {
    std::vector<std::string> path;
    RouteSearch search(graph);
    search.set_start_and_goal(start, goal);
    while (search.search_step() == RouteSearch::SEARCH_STATE_SEARCHING) {
    }

    if (expanded_nodes) {
        *expanded_nodes = search.expanded_nodes();
    }
    if (search.state() == RouteSearch::SEARCH_STATE_SUCCEEDED) {
        RouteResult route = search.result();
        path = route.path;
        if (distance) *distance = route.distance;
    }
    return path;
}
