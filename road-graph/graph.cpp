#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "graph.hpp"
#include "route_errors.hpp"

using namespace std;

NodeId RoadGraph::add_node(const string& label) {
    auto it = ids_.find(label);
    if (it != ids_.end()) return it->second;
    NodeId id = labels_.size();
    labels_.push_back(label);
    adjacency_.emplace_back();
    ids_.emplace(label, id);
    return id;
}

uint64_t RoadGraph::road_key(NodeId a, NodeId b) {
    if (a > b) swap(a, b);
    return (static_cast<uint64_t>(a) << 32) | static_cast<uint64_t>(b);
}

void RoadGraph::add_edge(const string& from, const string& to, Weight weight) {
    if (from.empty() || to.empty()) {
        throw invalid_argument("Location labels cannot be empty");
    }
    NodeId u = add_node(from);
    NodeId v = add_node(to);

    auto inserted = roads_.emplace(road_key(u, v), weight);
    if (inserted.second) {
        adjacency_[u].push_back({v, weight});
        // a loop is listed once
        if (u != v) adjacency_[v].push_back({u, weight});
        return;
    }

    // Existing road: last writer wins, in place so the listing order is kept
    inserted.first->second = weight;
    for (auto& link : adjacency_[u]) {
        if (link.to == v) link.weight = weight;
    }
    for (auto& link : adjacency_[v]) {
        if (link.to == u) link.weight = weight;
    }
}

bool RoadGraph::contains_node(const string& label) const {
    return ids_.count(label) != 0;
}

const vector<string>& RoadGraph::nodes() const {
    return labels_;
}

vector<pair<string, Weight>> RoadGraph::neighbors(const string& label) const {
    auto id = node_id(label);
    if (!id) throw UnknownNode(label);
    vector<pair<string, Weight>> result;
    result.reserve(adjacency_[*id].size());
    for (const auto& link : adjacency_[*id]) {
        result.emplace_back(labels_[link.to], link.weight);
    }
    return result;
}

optional<Weight> RoadGraph::edge_weight(const string& from, const string& to) const {
    auto u = node_id(from);
    auto v = node_id(to);
    if (!u || !v) return nullopt;
    return edge_weight(*u, *v);
}

optional<NodeId> RoadGraph::node_id(const string& label) const {
    auto it = ids_.find(label);
    if (it == ids_.end()) return nullopt;
    return it->second;
}

const string& RoadGraph::label(NodeId id) const {
    return labels_.at(id);
}

const vector<RoadLink>& RoadGraph::links(NodeId id) const {
    return adjacency_.at(id);
}

optional<Weight> RoadGraph::edge_weight(NodeId from, NodeId to) const {
    auto it = roads_.find(road_key(from, to));
    if (it == roads_.end()) return nullopt;
    return it->second;
}
