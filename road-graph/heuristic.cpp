#include <algorithm>
#include <string>
#include <vector>

#include "heuristic.hpp"
#include "route_errors.hpp"

using namespace std;

void HeuristicTable::set(const string& from, const string& goal, Weight estimate) {
    if (from == goal && estimate != 0) {
        throw InvalidWeight("Estimate from " + goal + " to itself must be 0, got " + format_weight(estimate));
    }
    auto& estimates = by_goal_[goal];
    if (estimates.find(from) == estimates.end()) ++size_;
    estimates[from] = estimate;
}

Weight HeuristicTable::estimate(const string& from, const string& goal) const {
    if (from == goal) return 0;
    auto goal_it = by_goal_.find(goal);
    if (goal_it != by_goal_.end()) {
        auto it = goal_it->second.find(from);
        if (it != goal_it->second.end()) return it->second;
    }
    throw MissingHeuristic(from, goal);
}

bool HeuristicTable::contains(const string& from, const string& goal) const {
    auto goal_it = by_goal_.find(goal);
    return goal_it != by_goal_.end() && goal_it->second.count(from) != 0;
}

vector<HeuristicEntry> HeuristicTable::entries() const {
    vector<HeuristicEntry> result;
    result.reserve(size_);
    for (const auto& goal_estimates : by_goal_) {
        for (const auto& entry : goal_estimates.second) {
            result.push_back({entry.first, goal_estimates.first, entry.second});
        }
    }
    sort(result.begin(), result.end(), [](const HeuristicEntry& a, const HeuristicEntry& b) {
        if (a.goal != b.goal) return a.goal < b.goal;
        return a.from < b.from;
    });
    return result;
}

vector<HeuristicViolation> find_inconsistent_estimates(const RoadGraph& graph,
                                                       const HeuristicTable& table,
                                                       const vector<string>& goals) {
    vector<HeuristicViolation> violations;
    for (const auto& goal : goals) {
        for (NodeId u = 0; u < graph.node_count(); ++u) {
            const string& from = graph.label(u);
            if (from != goal && !table.contains(from, goal)) continue;
            Weight h_from = table.estimate(from, goal);
            for (const auto& link : graph.links(u)) {
                const string& to = graph.label(link.to);
                if (to != goal && !table.contains(to, goal)) continue;
                Weight h_to = table.estimate(to, goal);
                if (h_from > link.weight + h_to) {
                    violations.push_back({from, to, goal, h_from, h_to, link.weight});
                }
            }
        }
    }
    return violations;
}
