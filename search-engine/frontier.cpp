#include <optional>
#include <utility>

#include "frontier.hpp"

using namespace std;

bool RouteFrontier::before(const HeapItem& a, const HeapItem& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.sequence < b.sequence;
}

void RouteFrontier::place(size_t pos, const HeapItem& item) {
    heap_[pos] = item;
    position_[item.node] = pos;
}

void RouteFrontier::sift_up(size_t pos) {
    HeapItem item = heap_[pos];
    while (pos > 0) {
        size_t parent = (pos - 1) / 2;
        if (!before(item, heap_[parent])) break;
        place(pos, heap_[parent]);
        pos = parent;
    }
    place(pos, item);
}

void RouteFrontier::sift_down(size_t pos) {
    HeapItem item = heap_[pos];
    size_t n = heap_.size();
    while (true) {
        size_t child = 2 * pos + 1;
        if (child >= n) break;
        if (child + 1 < n && before(heap_[child + 1], heap_[child])) ++child;
        if (!before(heap_[child], item)) break;
        place(pos, heap_[child]);
        pos = child;
    }
    place(pos, item);
}

bool RouteFrontier::push_or_improve(NodeId node, Weight priority) {
    auto it = position_.find(node);
    if (it == position_.end()) {
        heap_.push_back({node, priority, next_sequence_++});
        position_[node] = heap_.size() - 1;
        sift_up(heap_.size() - 1);
        return true;
    }
    size_t pos = it->second;
    if (priority >= heap_[pos].priority) return false;
    // keeps the sequence number it entered with
    heap_[pos].priority = priority;
    sift_up(pos);
    return true;
}

optional<FrontierEntry> RouteFrontier::pop_min() {
    if (heap_.empty()) return nullopt;
    FrontierEntry top{heap_.front().node, heap_.front().priority};
    position_.erase(top.node);
    HeapItem last = heap_.back();
    heap_.pop_back();
    if (!heap_.empty()) {
        heap_[0] = last;
        position_[last.node] = 0;
        sift_down(0);
    }
    return top;
}
