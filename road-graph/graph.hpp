#ifndef __GRAPH_HPP___
#define __GRAPH_HPP___

/**
 * @file graph.hpp
 * @brief Undirected weighted road graph keyed by location labels.
 *
 * This header declares the RoadGraph class shared by the solvers, the file
 * loaders and the planner.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "weight.hpp"

/// Dense index of a location, assigned in first-insertion order.
using NodeId = std::size_t;

/**
 * @brief One side of an undirected road as seen from a location.
 */
struct RoadLink {
    NodeId to;
    Weight weight;
};

/**
 * @brief Undirected road graph without parallel edges.
 *
 * Locations are case-sensitive labels. Adding a road implicitly adds both of
 * its endpoints. Labels, adjacency and road lookups are enumerated in
 * first-insertion order, so every listing is stable for a given input.
 */
class RoadGraph {
public:
    RoadGraph() = default;

    /**
     * @brief Insert the road {from, to}, or replace its weight if it exists.
     *
     * @param from One endpoint label.
     * @param to Other endpoint label.
     * @param weight Road length in tenths.
     * @throws std::invalid_argument if a label is empty.
     */
    void add_edge(const std::string& from, const std::string& to, Weight weight);

    bool contains_node(const std::string& label) const;

    /**
     * @brief All location labels in first-insertion order.
     */
    const std::vector<std::string>& nodes() const;

    /**
     * @brief Every road incident to a location, with the other endpoint and weight.
     *
     * @throws UnknownNode if the label is not in the graph.
     */
    std::vector<std::pair<std::string, Weight>> neighbors(const std::string& label) const;

    /**
     * @brief Weight of the road {from, to}, or nullopt when there is none.
     */
    std::optional<Weight> edge_weight(const std::string& from, const std::string& to) const;

    std::size_t node_count() const { return labels_.size(); }
    std::size_t edge_count() const { return roads_.size(); }

    // Index-based view used by the search engine.
    std::optional<NodeId> node_id(const std::string& label) const;
    const std::string& label(NodeId id) const;
    const std::vector<RoadLink>& links(NodeId id) const;
    std::optional<Weight> edge_weight(NodeId from, NodeId to) const;

private:
    NodeId add_node(const std::string& label);
    static std::uint64_t road_key(NodeId a, NodeId b);

    std::vector<std::string> labels_;
    std::unordered_map<std::string, NodeId> ids_;
    std::vector<std::vector<RoadLink>> adjacency_;
    std::unordered_map<std::uint64_t, Weight> roads_;
};

#endif // __GRAPH_HPP___
