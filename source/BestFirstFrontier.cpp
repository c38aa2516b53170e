#include "BestFirstFrontier.h"

size_t BestFirstFrontier::push(const GridCell& cell, double key) {
    size_t handle = arena_.size();
    arena_.push_back({cell, key, false});
    heap_.push({key, handle});
    liveCount_++;
    return handle;
}

void BestFirstFrontier::invalidate(size_t handle) {
    if (handle >= arena_.size()) return;
    Entry& e = arena_[handle];
    if (e.stale) return;  // already popped or already superseded
    e.stale = true;
    liveCount_--;
}

std::optional<BestFirstFrontier::Popped> BestFirstFrontier::pop() {
    while (!heap_.empty()) {
        size_t handle = heap_.top().second;
        heap_.pop();

        Entry& e = arena_[handle];
        if (e.stale) {
            // superseded by a cheaper re-insertion, drop it
            staleSkipped_++;
            continue;
        }

        // a popped entry is spent, tagging it keeps invalidate() idempotent
        e.stale = true;
        liveCount_--;
        return Popped{e.cell, e.key, handle};
    }
    return std::nullopt;
}
