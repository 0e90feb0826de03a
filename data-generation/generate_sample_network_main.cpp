#include <exception>
#include <iostream>
#include <random>
#include <string>

#include "generate_sample_network.hpp"
#include "route_file_operations.hpp"

using namespace std;

int main(int argc, char** argv) {
    int node_count = 50;
    int degree = 3;
    unsigned int seed = 1;
    string routes_file = "routes.txt";
    string heuristic_file = "euclidian.txt";

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--nodes" && i + 1 < argc) { node_count = stoi(argv[++i]); }
        else if (a == "--degree" && i + 1 < argc) { degree = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--routes-file" && i + 1 < argc) { routes_file = argv[++i]; }
        else if (a == "--heuristic-file" && i + 1 < argc) { heuristic_file = argv[++i]; }
        else if (a == "--help") {
            cout << "Usage: generate-sample-network [--nodes N] [--degree K] [--seed S] "
                    "[--routes-file PATH] [--heuristic-file PATH]\n";
            return 0;
        }
    }

    try {
        mt19937 rng(seed);
        SampleNetwork network = random_road_network(node_count, degree, rng);
        write_routes_to_file(network.graph, routes_file);
        write_heuristic_to_file(network.heuristic, heuristic_file);
        cout << "Wrote " << network.graph.node_count() << " locations and "
             << network.graph.edge_count() << " roads to " << routes_file << ", "
             << network.heuristic.size() << " estimates to " << heuristic_file << '\n';
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
