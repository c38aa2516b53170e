#pragma once
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>
#include "GridGraph.h"
#include "Heuristics.h"
#include "SearchMetrics.h"

enum class SearchAlgorithm {
    // uninformed
    BFS,      // breadth first: fewest moves, doubles as the ground truth oracle
    DFS,      // depth first: first path the N,S,E,W order stumbles into

    // informed (heuristic driven)
    AStar,    // f = g + h
    Greedy    // f = h, ignores cost so far
};

const char* algorithmName(SearchAlgorithm algo);
bool usesHeuristic(SearchAlgorithm algo);

struct SearchOptions {
    bool withMetrics = false;
    bool computeOptimality = false;  // implies withMetrics, pays for one extra BFS
};

// result of a pathfinding operation
struct PathResult {
    std::vector<GridCell> path;              // start..goal inclusive, empty when unreachable
    std::optional<SearchMetrics> metrics;    // only when requested

    bool found() const { return !path.empty(); }
};

/**
 * runs the four searches over a read only GridGraph. holds no per search
 * state so one instance (or the graph it points at) can serve any number of
 * independent calls
 */
class Pathfinder {
public:
    Pathfinder(const GridGraph& graph);
    Pathfinder(GridGraph&&) = delete;  // the graph is borrowed, it must outlive the pathfinder

    const GridGraph& getGraph() const { return graph_; }

    PathResult findPathBFS(const SearchOptions& options = {}) const;
    PathResult findPathDFS(const SearchOptions& options = {}) const;

    // an empty heuristic falls back to manhattan distance
    PathResult findPathAStar(const Heuristic& heuristic, const SearchOptions& options = {}) const;
    PathResult findPathGreedy(const Heuristic& heuristic, const SearchOptions& options = {}) const;

    // generic dispatcher, heuristic ignored for BFS/DFS
    PathResult findPath(SearchAlgorithm algo, const Heuristic& heuristic = {}, const SearchOptions& options = {}) const;

private:
    const GridGraph& graph_;

    using ParentMap = std::unordered_map<GridCell, GridCell, GridCellHash>;

    // priority of a frontier entry from its cost so far (g) and estimate (h)
    using PriorityKey = std::function<double(double g, double h)>;

    PathResult bestFirstSearch(const Heuristic& heuristic, const PriorityKey& key, const SearchOptions& options) const;

    PathResult finishResult(const MetricsRecorder& recorder, std::vector<GridCell> path, const SearchOptions& options) const;

    // reconstruct path from came_from map
    static std::vector<GridCell> reconstructPath(const ParentMap& cameFrom, const GridCell& start, const GridCell& goal);
};
