#pragma once
#include "GridGraph.h"
#include "SearchMetrics.h"

// what BFS says about the maze: is the goal reachable and at what cost
struct GroundTruth {
    bool reachable = false;
    int cost = 0;
    SearchMetrics bfsMetrics;  // the oracle run's own counters, never merged into the judged run
};

// independent BFS over the graph (fresh metrics, no recursion into the oracle)
GroundTruth computeGroundTruth(const GridGraph& graph);

// completeness: oracle and search agree on whether a path exists.
// optimality: costs match when both found one, false when only the oracle did,
// left unset when neither did
void applyGroundTruth(const GroundTruth& truth, SearchMetrics& metrics);
