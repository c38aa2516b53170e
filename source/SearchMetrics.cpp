#include "SearchMetrics.h"
#include <algorithm>

void MetricsRecorder::startTimer() {
    startTime_ = std::chrono::high_resolution_clock::now();
}

void MetricsRecorder::stopTimer() {
    auto endTime = std::chrono::high_resolution_clock::now();
    elapsedMs_ = std::chrono::duration<double, std::milli>(endTime - startTime_).count();
}

void MetricsRecorder::observe(size_t frontierSize, size_t exploredSize) {
    peakFrontier_ = std::max(peakFrontier_, frontierSize);
    peakExplored_ = std::max(peakExplored_, exploredSize);
}

SearchMetrics MetricsRecorder::finish(const GridGraph& graph, const std::vector<GridCell>& path) const {
    SearchMetrics metrics;
    metrics.timeMs = elapsedMs_;
    metrics.expanded = expanded_;
    metrics.generated = generated_;
    metrics.peakFrontier = static_cast<int>(peakFrontier_);
    metrics.peakExplored = static_cast<int>(peakExplored_);
    // sum of two independent maxima, not the peak of the sum
    metrics.peakStructures = metrics.peakFrontier + metrics.peakExplored;
    metrics.found = !path.empty();
    metrics.pathLength = static_cast<int>(path.size());
    metrics.pathCost = pathCostOf(graph, path);
    return metrics;
}

int pathCostOf(const GridGraph& graph, const std::vector<GridCell>& path) {
    int cost = 0;
    for (size_t i = 1; i < path.size(); i++) {
        cost += graph.stepCost(path[i - 1], path[i]);
    }
    return cost;
}
