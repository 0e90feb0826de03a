#include <exception>
#include <iostream>
#include <string>

#include "graph.hpp"
#include "heuristic.hpp"
#include "route_file_operations.hpp"
#include "route_planner.hpp"

using namespace std;

int main(int argc, char** argv) {
    string routes_file = "routes.txt";
    string heuristic_file = "euclidian.txt";
    string from;
    string to;
    bool clear = true;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--routes" && i + 1 < argc) { routes_file = argv[++i]; }
        else if (a == "--heuristic" && i + 1 < argc) { heuristic_file = argv[++i]; }
        else if (a == "--from" && i + 1 < argc) { from = argv[++i]; }
        else if (a == "--to" && i + 1 < argc) { to = argv[++i]; }
        else if (a == "--no-clear") { clear = false; }
        else if (a == "--help") {
            cout << "Usage: route-planner [--routes PATH] [--heuristic PATH] [--from LABEL --to LABEL] [--no-clear]\n";
            return 0;
        }
        else {
            cerr << "Unknown argument: " << a << '\n';
            return 3;
        }
    }
    if (from.empty() != to.empty()) {
        cerr << "--from and --to must be given together\n";
        return 3;
    }

    RoadGraph graph;
    HeuristicTable heuristic;
    try {
        graph = read_routes_from_file(routes_file);
        heuristic = read_heuristic_from_file(heuristic_file);
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }

    RoutePlanner planner(graph, heuristic, cin, cout, clear);
    if (!from.empty()) {
        return planner.compare_routes(from, to) ? 0 : 1;
    }
    planner.run();
    return 0;
}
