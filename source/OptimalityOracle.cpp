#include "OptimalityOracle.h"
#include "Pathfinder.h"

GroundTruth computeGroundTruth(const GridGraph& graph) {
    Pathfinder pathfinder(graph);

    SearchOptions options;
    options.withMetrics = true;
    options.computeOptimality = false;
    PathResult bfs = pathfinder.findPathBFS(options);

    GroundTruth truth;
    truth.reachable = bfs.found();
    truth.bfsMetrics = *bfs.metrics;
    truth.cost = truth.bfsMetrics.pathCost;
    return truth;
}

void applyGroundTruth(const GroundTruth& truth, SearchMetrics& metrics) {
    metrics.complete = (truth.reachable == metrics.found);

    if (truth.reachable && metrics.found) {
        metrics.optimal = (metrics.pathCost == truth.cost);
    } else if (truth.reachable) {
        metrics.optimal = false;
    } else {
        metrics.optimal.reset();
    }
}
