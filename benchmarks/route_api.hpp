#ifndef __ROUTE_API_HPP___
#define __ROUTE_API_HPP___

/**
 * @file route_api.hpp
 * @brief C-friendly query entry point so the solvers can be called from Python via ctypes.
 */

extern "C" {
    /**
     * @brief Load a routes and a heuristic file and run one search.
     *
     * @param routes_file Path to the routes file.
     * @param heuristic_file Path to the heuristic file (only read when use_heuristic != 0).
     * @param from Start location label.
     * @param to Goal location label.
     * @param use_heuristic Non-zero for A*, zero for Dijkstra.
     * @param out_time_ms Search time in milliseconds (loading excluded).
     * @param out_steps Number of locations on the route.
     * @param out_expanded Number of expanded locations.
     * @param out_distance Route length in tenths.
     * @return 1 if a route was found, 0 if none exists or a label is unknown,
     *         -1 on bad arguments, -2 if the input files could not be loaded
     *         or the heuristic file lacks an estimate the search needs.
     */
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
    );
}

#endif // __ROUTE_API_HPP___
