#include <chrono>
#include <exception>
#include <string>
#include <vector>

#include "graph.hpp"
#include "heuristic.hpp"
#include "route-a-star-solver.hpp"
#include "route-dijkstra-solver.hpp"
#include "route_api.hpp"
#include "route_errors.hpp"
#include "route_file_operations.hpp"

extern "C" {
    int route_run_query(
        const char* routes_file,
        const char* heuristic_file,
        const char* from,
        const char* to,
        int use_heuristic,
        double* out_time_ms,
        int* out_steps,
        int* out_expanded,
        long long* out_distance
    ) {
        if (!routes_file || !from || !to || !out_time_ms || !out_steps || !out_expanded || !out_distance) {
            return -1;
        }
        if (use_heuristic && !heuristic_file) {
            return -1;
        }

        RoadGraph graph;
        HeuristicTable heuristic;
        try {
            graph = read_routes_from_file(std::string(routes_file));
            if (use_heuristic) heuristic = read_heuristic_from_file(std::string(heuristic_file));
        } catch (const std::exception&) {
            return -2;
        }

        int expanded = 0;
        Weight distance = 0;
        std::vector<std::string> path;
        auto t0 = std::chrono::steady_clock::now();
        try {
            path = use_heuristic
                ? RouteSolveAstar(graph, heuristic, from, to, &expanded, &distance)
                : RouteSolveDijkstra(graph, from, to, &expanded, &distance);
        } catch (const UnknownNode&) {
            return 0;
        } catch (const MissingHeuristic&) {
            return -2;
        } catch (const std::exception&) {
            return -2;
        }
        auto t1 = std::chrono::steady_clock::now();
        double ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();

        *out_time_ms = ms;
        *out_steps = static_cast<int>(path.size());
        *out_expanded = expanded;
        *out_distance = static_cast<long long>(distance);
        return path.empty() ? 0 : 1;
    }
}
