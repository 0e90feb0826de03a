#ifndef __HEURISTIC_HPP___
#define __HEURISTIC_HPP___

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "graph.hpp"
#include "weight.hpp"

/**
 * @file heuristic.hpp
 * @brief Lower-bound distance estimates used by A* and a consistency check for them.
 */

/**
 * @brief One stored estimate h(from, goal).
 */
struct HeuristicEntry {
    std::string from;
    std::string goal;
    Weight estimate;
};

/**
 * @brief Ordered table of estimates h(from, goal).
 *
 * (a, b) and (b, a) are distinct entries. The table is treated as ground
 * truth: it is never clamped or completed, and a lookup miss is an error.
 */
class HeuristicTable {
public:
    /**
     * @brief Record h(from, goal), replacing any previous value.
     *
     * @throws InvalidWeight if from == goal and the estimate is not 0.
     */
    void set(const std::string& from, const std::string& goal, Weight estimate);

    /**
     * @brief Look up h(from, goal).
     *
     * @return 0 when from == goal, the stored estimate otherwise.
     * @throws MissingHeuristic if the pair is not in the table.
     */
    Weight estimate(const std::string& from, const std::string& goal) const;

    bool contains(const std::string& from, const std::string& goal) const;

    std::size_t size() const { return size_; }

    /**
     * @brief All stored entries, sorted by (goal, from).
     */
    std::vector<HeuristicEntry> entries() const;

private:
    // goal -> from -> estimate
    std::unordered_map<std::string, std::unordered_map<std::string, Weight>> by_goal_;
    std::size_t size_ = 0;
};

/**
 * @brief A road (from, to) along which the estimate towards goal drops too fast.
 */
struct HeuristicViolation {
    std::string from;
    std::string to;
    std::string goal;
    Weight from_estimate;  ///< h(from, goal)
    Weight to_estimate;    ///< h(to, goal)
    Weight road_weight;    ///< w(from, to)
};

/**
 * @brief Check h(u, g) <= w(u, v) + h(v, g) for every road, in both directions.
 *
 * Pairs missing from the table are skipped; the check reports, never repairs.
 *
 * @param graph Road graph whose roads are checked.
 * @param table Estimates under test.
 * @param goals Goals to check against.
 * @return Every violating (road, goal) combination, empty for a consistent table.
 */
std::vector<HeuristicViolation> find_inconsistent_estimates(const RoadGraph& graph,
                                                            const HeuristicTable& table,
                                                            const std::vector<std::string>& goals);

#endif // __HEURISTIC_HPP___
