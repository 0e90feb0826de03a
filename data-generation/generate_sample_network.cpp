#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "generate_sample_network.hpp"

using namespace std;

// Estimates use a shrunk straight line so float error cannot break consistency.
static const double HEURISTIC_SHRINK = 0.999;

static string location_label(int index) {
    return "L" + to_string(index);
}

SampleNetwork random_road_network(int node_count, int degree, mt19937 &rng) {
    if (node_count < 1) {
        throw invalid_argument("A road network needs at least one location");
    }
    if (degree < 0) {
        throw invalid_argument("Degree cannot be negative");
    }

    uniform_real_distribution<double> coord(0.0, 100.0);
    uniform_real_distribution<double> detour(1.0, 1.5);
    vector<pair<double, double>> points(node_count);
    for (auto &p : points) {
        p.first = coord(rng);
        p.second = coord(rng);
    }
    auto straight = [&points](int a, int b) {
        return hypot(points[a].first - points[b].first, points[a].second - points[b].second);
    };

    SampleNetwork network;
    auto add_road = [&](int a, int b) {
        Weight w = static_cast<Weight>(ceil(10.0 * straight(a, b) * detour(rng)));
        network.graph.add_edge(location_label(a), location_label(b), w);
    };

    for (int i = 0; i < node_count; ++i) {
        if (i + 1 < node_count) add_road(i, i + 1);

        vector<pair<double, int>> by_distance;
        for (int j = 0; j < node_count; ++j) {
            if (j != i) by_distance.push_back({straight(i, j), j});
        }
        sort(by_distance.begin(), by_distance.end());
        int k = min<int>(degree, static_cast<int>(by_distance.size()));
        for (int n = 0; n < k; ++n) {
            int j = by_distance[n].second;
            // roads already generated keep their first weight
            if (!network.graph.edge_weight(location_label(i), location_label(j))) {
                add_road(i, j);
            }
        }
    }
    // a single location has no roads but is still part of the network
    if (node_count == 1) {
        network.graph.add_edge(location_label(0), location_label(0), 0);
    }

    for (int g = 0; g < node_count; ++g) {
        for (int u = 0; u < node_count; ++u) {
            Weight h = u == g ? 0 : static_cast<Weight>(floor(10.0 * straight(u, g) * HEURISTIC_SHRINK));
            network.heuristic.set(location_label(u), location_label(g), h);
        }
    }
    return network;
}
