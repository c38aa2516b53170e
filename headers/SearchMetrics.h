#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>
#include "GridGraph.h"

// performance + quality numbers for one search invocation
struct SearchMetrics {
    double timeMs = 0.0;            // wall time of the search itself (oracle excluded)
    int expanded = 0;               // nodes popped from the frontier and inspected
    int generated = 0;              // frontier insertions (seed included)
    int peakFrontier = 0;           // max live frontier entries at any point
    int peakExplored = 0;           // max size of the discovered set
    int peakStructures = 0;         // peakFrontier + peakExplored, each tracked on its own
    bool found = false;
    std::optional<bool> complete;   // unset unless the oracle was consulted
    std::optional<bool> optimal;    // unset unless both oracle and search found a path (or only the oracle did)
    int pathCost = 0;               // sum of step costs along the path
    int pathLength = 0;             // positions in the path, start and goal inclusive
};

/**
 * passive counter structure owned by a single search call. the algorithms
 * report at the same instrumentation points so the numbers stay comparable:
 *   generated  -> every frontier insertion
 *   expanded   -> every pop that goes on to inspect neighbors
 *   observe    -> after each insertion/removal to refresh the peaks
 */
class MetricsRecorder {
public:
    void startTimer();
    void stopTimer();

    void recordGenerated() { generated_++; }
    void recordExpanded() { expanded_++; }
    void observe(size_t frontierSize, size_t exploredSize);

    int getGenerated() const { return generated_; }
    int getExpanded() const { return expanded_; }

    // fills path dependent fields; path cost is summed through graph.stepCost
    SearchMetrics finish(const GridGraph& graph, const std::vector<GridCell>& path) const;

private:
    std::chrono::high_resolution_clock::time_point startTime_;
    double elapsedMs_ = 0.0;
    int generated_ = 0;
    int expanded_ = 0;
    size_t peakFrontier_ = 0;
    size_t peakExplored_ = 0;
};

int pathCostOf(const GridGraph& graph, const std::vector<GridCell>& path);
