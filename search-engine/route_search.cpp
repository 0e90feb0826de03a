#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "route_errors.hpp"
#include "route_search.hpp"

using namespace std;

static const Weight UNREACHED = numeric_limits<Weight>::max();

RouteSearch::RouteSearch(const RoadGraph& graph, const HeuristicTable* heuristic)
    : graph_(graph), heuristic_(heuristic) {}

Weight RouteSearch::priority_of(NodeId node, Weight distance) const {
    if (!heuristic_) return distance;
    return add_weights(distance, heuristic_->estimate(graph_.label(node), graph_.label(goal_)));
}

void RouteSearch::set_start_and_goal(const string& start, const string& goal) {
    if (state_ != SEARCH_STATE_IDLE) {
        throw logic_error("Search has already been started");
    }
    auto start_id = graph_.node_id(start);
    if (!start_id) throw UnknownNode(start);
    auto goal_id = graph_.node_id(goal);
    if (!goal_id) throw UnknownNode(goal);

    start_ = *start_id;
    goal_ = *goal_id;
    dist_.assign(graph_.node_count(), UNREACHED);
    prev_.assign(graph_.node_count(), nullopt);
    dist_[start_] = 0;

    try {
        frontier_.push_or_improve(start_, priority_of(start_, 0));
    } catch (const MissingHeuristic&) {
        failure_ = current_exception();
        state_ = SEARCH_STATE_FAILED;
        throw;
    } catch (const InvalidWeight&) {
        failure_ = current_exception();
        state_ = SEARCH_STATE_FAILED;
        throw;
    }
    state_ = SEARCH_STATE_SEARCHING;
}

RouteSearch::SearchState RouteSearch::search_step() {
    if (state_ != SEARCH_STATE_SEARCHING) return state_;

    auto entry = frontier_.pop_min();
    if (!entry) {
        state_ = SEARCH_STATE_FAILED;
        return state_;
    }

    try {
        NodeId u = entry->node;
        // stale entry: u has been reached more cheaply since it was queued
        if (entry->priority != priority_of(u, dist_[u])) return state_;

        ++expanded_;
        if (u == goal_) {
            state_ = SEARCH_STATE_SUCCEEDED;
            return state_;
        }

        for (const auto& link : graph_.links(u)) {
            Weight alt = add_weights(dist_[u], link.weight);
            if (dist_[link.to] == UNREACHED || alt < dist_[link.to]) {
                dist_[link.to] = alt;
                prev_[link.to] = u;
                frontier_.push_or_improve(link.to, priority_of(link.to, alt));
            }
        }
    } catch (const MissingHeuristic&) {
        failure_ = current_exception();
        state_ = SEARCH_STATE_FAILED;
        throw;
    } catch (const InvalidWeight&) {
        failure_ = current_exception();
        state_ = SEARCH_STATE_FAILED;
        throw;
    }
    return state_;
}

vector<string> RouteSearch::reconstruct_path() const {
    vector<string> path;
    NodeId current = goal_;
    path.push_back(graph_.label(current));
    // a well-formed predecessor chain has fewer links than there are locations
    for (size_t steps = 0; prev_[current]; ++steps) {
        if (steps >= graph_.node_count()) {
            throw logic_error("Predecessor chain from " + graph_.label(goal_) + " does not terminate");
        }
        current = *prev_[current];
        path.push_back(graph_.label(current));
    }
    if (current != start_) {
        throw logic_error("Predecessor chain ends at " + graph_.label(current) + ", not at the start");
    }
    reverse(path.begin(), path.end());
    return path;
}

RouteResult RouteSearch::result() const {
    if (state_ == SEARCH_STATE_FAILED) {
        if (failure_) rethrow_exception(failure_);
        throw UnreachableRoute(graph_.label(start_), graph_.label(goal_));
    }
    if (state_ != SEARCH_STATE_SUCCEEDED) {
        throw logic_error("Search has not finished");
    }
    RouteResult result;
    result.path = reconstruct_path();
    result.distance = dist_[goal_];
    result.expanded = expanded_;
    return result;
}

RouteResult search_route(const RoadGraph& graph, const HeuristicTable* heuristic,
                         const string& start, const string& goal) {
    RouteSearch search(graph, heuristic);
    search.set_start_and_goal(start, goal);

    RouteSearch::SearchState state;
    do {
        state = search.search_step();
    } while (state == RouteSearch::SEARCH_STATE_SEARCHING);

    return search.result();
}
