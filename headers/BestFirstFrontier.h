#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <queue>
#include <utility>
#include <vector>
#include "GridGraph.h"

/**
 * min priority frontier shared by A* and greedy best first.
 * entries live in an arena and are addressed by their index (the handle).
 * relaxing a node pushes a fresh entry and tags the old one stale instead of
 * removing it; stale entries are skipped when they surface at the top.
 * equal keys pop in insertion order (handles grow monotonically)
 */
class BestFirstFrontier {
public:
    struct Entry {
        GridCell cell;
        double key = 0.0;
        bool stale = false;
    };

    struct Popped {
        GridCell cell;
        double key = 0.0;
        size_t handle = 0;
    };

    size_t push(const GridCell& cell, double key);
    void invalidate(size_t handle);

    // next live entry, nullopt once only stale entries (or nothing) remain
    std::optional<Popped> pop();

    bool empty() const { return liveCount_ == 0; }
    size_t liveSize() const { return liveCount_; }
    size_t arenaSize() const { return arena_.size(); }
    size_t staleSkipped() const { return staleSkipped_; }
    const Entry& entry(size_t handle) const { return arena_[handle]; }

private:
    // (key, handle) - smallest key first, then lowest handle (FIFO among ties)
    using PQElement = std::pair<double, size_t>;

    std::vector<Entry> arena_;
    std::priority_queue<PQElement, std::vector<PQElement>, std::greater<PQElement>> heap_;
    size_t liveCount_ = 0;
    size_t staleSkipped_ = 0;
};
