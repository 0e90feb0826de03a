#ifndef __FRONTIER_HPP___
#define __FRONTIER_HPP___

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "graph.hpp"
#include "weight.hpp"

/**
 * @file frontier.hpp
 * @brief Indexed binary min-heap of locations with decrease-key.
 */

/**
 * @brief A location popped from the frontier together with its priority.
 */
struct FrontierEntry {
    NodeId node;
    Weight priority;
};

/**
 * @brief Min-priority queue holding each location at most once.
 *
 * Equal priorities are served in the order the locations entered the
 * frontier, which makes every search over the same input expand the same
 * locations in the same order.
 */
class RouteFrontier {
public:
    /**
     * @brief Insert a location, or lower its priority if it is already queued.
     *
     * A priority that is not strictly lower than the queued one is ignored.
     *
     * @return true if the frontier changed.
     */
    bool push_or_improve(NodeId node, Weight priority);

    /**
     * @brief Remove and return the location with the lowest priority.
     *
     * @return nullopt when the frontier is empty.
     */
    std::optional<FrontierEntry> pop_min();

    bool contains(NodeId node) const { return position_.count(node) != 0; }
    bool empty() const { return heap_.empty(); }
    std::size_t size() const { return heap_.size(); }

private:
    struct HeapItem {
        NodeId node;
        Weight priority;
        std::uint64_t sequence;
    };

    static bool before(const HeapItem& a, const HeapItem& b);
    void place(std::size_t pos, const HeapItem& item);
    void sift_up(std::size_t pos);
    void sift_down(std::size_t pos);

    std::vector<HeapItem> heap_;
    std::unordered_map<NodeId, std::size_t> position_;
    std::uint64_t next_sequence_ = 0;
};

#endif // __FRONTIER_HPP___
