#include <chrono>
#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "graph.hpp"
#include "heuristic.hpp"
#include "route-a-star-solver.hpp"
#include "route-dijkstra-solver.hpp"
#include "route_file_operations.hpp"

using namespace std;

static void run_pair(const RoadGraph& graph, const HeuristicTable& heuristic,
                     const string& from, const string& to) {
    for (int use_heuristic = 1; use_heuristic >= 0; --use_heuristic) {
        int expanded = 0;
        Weight distance = 0;
        auto t0 = chrono::steady_clock::now();
        vector<string> path = use_heuristic
            ? RouteSolveAstar(graph, heuristic, from, to, &expanded, &distance)
            : RouteSolveDijkstra(graph, from, to, &expanded, &distance);
        auto t1 = chrono::steady_clock::now();
        double us = chrono::duration_cast<chrono::duration<double, micro>>(t1 - t0).count();

        bool found = !path.empty();
        cout << from << ',' << to << ',' << (use_heuristic ? "astar" : "dijkstra") << ','
             << us << ',' << (found ? 1 : 0) << ',' << path.size() << ','
             << (found ? format_weight(distance) : "") << ',' << expanded << '\n';
    }
}

int main(int argc, char** argv) {
    string routes_file = "routes.txt";
    string heuristic_file = "euclidian.txt";
    string from;
    string to;
    int queries = 10;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--routes" && i + 1 < argc) { routes_file = argv[++i]; }
        else if (a == "--heuristic" && i + 1 < argc) { heuristic_file = argv[++i]; }
        else if (a == "--queries" && i + 1 < argc) { queries = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--from" && i + 1 < argc) { from = argv[++i]; }
        else if (a == "--to" && i + 1 < argc) { to = argv[++i]; }
        else if (a == "--help") {
            cout << "Usage: benchmark-route-search [--routes PATH] [--heuristic PATH] [--queries N] [--seed S] [--from A --to B]\n";
            return 0;
        }
    }

    if (queries < 0) {
        cerr << "queries must be non-negative\n";
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
    cerr << "Loaded " << graph.node_count() << " locations and " << graph.edge_count() << " roads\n";

    // CSV header
    cout << "from,to,mode,time_us,found,path_length,distance,expanded" << '\n';

    try {
        if (!from.empty() || !to.empty()) {
            run_pair(graph, heuristic, from, to);
            return 0;
        }
        if (graph.node_count() == 0) return 0;

        mt19937 rng(seed);
        uniform_int_distribution<size_t> pick(0, graph.node_count() - 1);
        for (int q = 0; q < queries; ++q) {
            string start = graph.label(pick(rng));
            string goal = graph.label(pick(rng));
            run_pair(graph, heuristic, start, goal);
        }
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 4;
    }
    cerr << "seed: " << seed << '\n';
    return 0;
}
