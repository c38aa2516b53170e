#include "Pathfinder.h"
#include "BestFirstFrontier.h"
#include "OptimalityOracle.h"
#include <algorithm>
#include <queue>
#include <stack>
#include <unordered_set>

const char* algorithmName(SearchAlgorithm algo) {
    switch (algo) {
        case SearchAlgorithm::BFS:    return "BFS";
        case SearchAlgorithm::DFS:    return "DFS";
        case SearchAlgorithm::AStar:  return "A*";
        case SearchAlgorithm::Greedy: return "Greedy";
        default:                      return "Unknown";
    }
}

bool usesHeuristic(SearchAlgorithm algo) {
    return algo == SearchAlgorithm::AStar || algo == SearchAlgorithm::Greedy;
}

Pathfinder::Pathfinder(const GridGraph& graph)
    : graph_(graph) {
}

std::vector<GridCell> Pathfinder::reconstructPath(const ParentMap& cameFrom, const GridCell& start, const GridCell& goal) {
    std::vector<GridCell> path;
    GridCell current = goal;

    // walking backwards through the parent map from goal toward start
    while (current != start) {
        path.push_back(current);
        auto it = cameFrom.find(current);
        if (it == cameFrom.end()) return {};  // goal never linked back to start
        current = it->second;
    }
    path.push_back(start);

    // building goal->start so flip it to start->goal
    std::reverse(path.begin(), path.end());
    return path;
}

PathResult Pathfinder::finishResult(const MetricsRecorder& recorder, std::vector<GridCell> path, const SearchOptions& options) const {
    PathResult result;
    result.path = std::move(path);

    if (options.withMetrics || options.computeOptimality) {
        SearchMetrics metrics = recorder.finish(graph_, result.path);
        if (options.computeOptimality) {
            // separate BFS run with its own metrics, outside the timed region
            applyGroundTruth(computeGroundTruth(graph_), metrics);
        }
        result.metrics = metrics;
    }
    return result;
}


// BFS - FIFO queue, cells marked visited when pushed so each is queued once
PathResult Pathfinder::findPathBFS(const SearchOptions& options) const {
    MetricsRecorder recorder;
    recorder.startTimer();

    const GridCell start = graph_.start();
    const GridCell goal = graph_.goal();

    std::queue<GridCell> frontier;
    std::unordered_set<GridCell, GridCellHash> visited;
    ParentMap cameFrom;

    frontier.push(start);
    visited.insert(start);
    recorder.recordGenerated();
    recorder.observe(frontier.size(), visited.size());

    bool reached = false;
    while (!frontier.empty()) {
        GridCell current = frontier.front();
        frontier.pop();
        recorder.recordExpanded();
        recorder.observe(frontier.size(), visited.size());

        if (current == goal) {
            reached = true;
            break;
        }

        for (const GridCell& neighbor : graph_.neighbors(current)) {
            if (visited.count(neighbor)) continue;
            visited.insert(neighbor);
            cameFrom[neighbor] = current;
            frontier.push(neighbor);
            recorder.recordGenerated();
            recorder.observe(frontier.size(), visited.size());
        }
    }

    std::vector<GridCell> path;
    if (reached) {
        path = reconstructPath(cameFrom, start, goal);
    }
    recorder.stopTimer();

    return finishResult(recorder, std::move(path), options);
}


// DFS - LIFO stack, visited at generation time
PathResult Pathfinder::findPathDFS(const SearchOptions& options) const {
    MetricsRecorder recorder;
    recorder.startTimer();

    const GridCell start = graph_.start();
    const GridCell goal = graph_.goal();

    std::stack<GridCell> frontier;
    std::unordered_set<GridCell, GridCellHash> visited;
    ParentMap cameFrom;

    frontier.push(start);
    visited.insert(start);
    recorder.recordGenerated();
    recorder.observe(frontier.size(), visited.size());

    bool reached = false;
    while (!frontier.empty()) {
        GridCell current = frontier.top();
        frontier.pop();
        recorder.recordExpanded();
        recorder.observe(frontier.size(), visited.size());

        if (current == goal) {
            reached = true;
            break;
        }

        // pushed in reverse so the first direction (north) ends up on top
        std::vector<GridCell> neighbors = graph_.neighbors(current);
        for (auto it = neighbors.rbegin(); it != neighbors.rend(); ++it) {
            if (visited.count(*it)) continue;
            visited.insert(*it);
            cameFrom[*it] = current;
            frontier.push(*it);
            recorder.recordGenerated();
            recorder.observe(frontier.size(), visited.size());
        }
    }

    std::vector<GridCell> path;
    if (reached) {
        path = reconstructPath(cameFrom, start, goal);
    }
    recorder.stopTimer();

    return finishResult(recorder, std::move(path), options);
}


// shared engine for A* and greedy. the only difference is the priority key
PathResult Pathfinder::bestFirstSearch(const Heuristic& heuristic, const PriorityKey& key, const SearchOptions& options) const {
    MetricsRecorder recorder;
    recorder.startTimer();

    static const Heuristic manhattan(manhattanDistance);
    const Heuristic& h = heuristic ? heuristic : manhattan;
    const GridCell start = graph_.start();
    const GridCell goal = graph_.goal();

    BestFirstFrontier frontier;
    std::unordered_map<GridCell, double, GridCellHash> costSoFar;   // g score, doubles as the discovered set
    std::unordered_map<GridCell, double, GridCellHash> estimate;    // cached h per discovered cell
    std::unordered_map<GridCell, size_t, GridCellHash> openHandle;  // live frontier entry per open cell
    std::unordered_set<GridCell, GridCellHash> closed;              // finalized, never expanded again
    ParentMap cameFrom;

    costSoFar[start] = 0.0;
    estimate[start] = h(start, goal);
    openHandle[start] = frontier.push(start, key(0.0, estimate[start]));
    recorder.recordGenerated();
    recorder.observe(frontier.liveSize(), costSoFar.size());

    bool reached = false;
    while (auto popped = frontier.pop()) {
        GridCell current = popped->cell;
        openHandle.erase(current);
        closed.insert(current);
        recorder.recordExpanded();
        recorder.observe(frontier.liveSize(), costSoFar.size());

        if (current == goal) {
            reached = true;
            break;
        }

        const double currentCost = costSoFar[current];
        for (const GridCell& neighbor : graph_.neighbors(current)) {
            if (closed.count(neighbor)) continue;

            double newCost = currentCost + graph_.stepCost(current, neighbor);
            auto known = costSoFar.find(neighbor);

            if (known == costSoFar.end()) {
                // first discovery
                double hn = h(neighbor, goal);
                costSoFar[neighbor] = newCost;
                estimate[neighbor] = hn;
                cameFrom[neighbor] = current;
                openHandle[neighbor] = frontier.push(neighbor, key(newCost, hn));
                recorder.recordGenerated();
                recorder.observe(frontier.liveSize(), costSoFar.size());
            } else if (newCost < known->second) {
                // still open with a worse g: relax, re-prioritize only if the key moved
                double hn = estimate[neighbor];
                double oldKey = key(known->second, hn);
                double newKey = key(newCost, hn);
                known->second = newCost;
                cameFrom[neighbor] = current;

                if (newKey != oldKey) {
                    frontier.invalidate(openHandle[neighbor]);
                    openHandle[neighbor] = frontier.push(neighbor, newKey);
                    recorder.recordGenerated();
                    recorder.observe(frontier.liveSize(), costSoFar.size());
                }
            }
        }
    }

    std::vector<GridCell> path;
    if (reached) {
        path = reconstructPath(cameFrom, start, goal);
    }
    recorder.stopTimer();

    return finishResult(recorder, std::move(path), options);
}


// A* algorithm
PathResult Pathfinder::findPathAStar(const Heuristic& heuristic, const SearchOptions& options) const {
    return bestFirstSearch(heuristic, [](double g, double h) { return g + h; }, options);
}


// Greedy best first search - only h as priority, path cost is ignored
PathResult Pathfinder::findPathGreedy(const Heuristic& heuristic, const SearchOptions& options) const {
    return bestFirstSearch(heuristic, [](double, double h) { return h; }, options);
}


// generic dispatcher
PathResult Pathfinder::findPath(SearchAlgorithm algo, const Heuristic& heuristic, const SearchOptions& options) const {
    switch (algo) {
        case SearchAlgorithm::BFS:
            return findPathBFS(options);
        case SearchAlgorithm::DFS:
            return findPathDFS(options);
        case SearchAlgorithm::AStar:
            return findPathAStar(heuristic, options);
        case SearchAlgorithm::Greedy:
            return findPathGreedy(heuristic, options);
    }
    return findPathBFS(options);
}
