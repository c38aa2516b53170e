#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "BenchmarkSettings.h"
#include "GridGraph.h"
#include "Heuristics.h"
#include "Pathfinder.h"
#include "SearchMetrics.h"

// one line of the comparison table
struct ComparisonRow {
    SearchAlgorithm algorithm;
    std::string heuristicName;          // "-" for the uninformed searches
    std::vector<GridCell> path;
    SearchMetrics metrics;

    // "BFS", "A* (Manhattan)", ...
    std::string label() const;
};

// all the results of empirical doubling test per algorithm
struct DoublingResult {
    SearchAlgorithm algorithm;
    std::string heuristicName; // "-" for the uninformed searches
    std::string algoName;      // label incl. heuristic
    int level;
    int problemSize;           // N (maze cells)
    double timeMs;             // average search time over the trials
    double ratio;              // T(2N) / T(N) normalised to an exact doubling, 0 on the first level
    std::string estimatedBigO; // estimated complexity
};

/**
 * drives the comparative runs: every algorithm (and every configured
 * heuristic for the informed ones) against the same read only maze, with
 * metrics and the BFS oracle, plus the doubling experiment over generated
 * mazes. formatting helpers turn the records into the text tables the CLI
 * prints and saves
 */
class BenchmarkManager {
public:
    BenchmarkManager(const BenchmarkSettings& settings);

    const BenchmarkSettings& getSettings() const { return settings_; }
    const std::vector<NamedHeuristic>& getHeuristics() const { return heuristics_; }

    // BFS, DFS, then A* per heuristic, then greedy per heuristic
    std::vector<ComparisonRow> runComparison(const GridGraph& graph) const;
    static std::vector<ComparisonRow> runComparison(const GridGraph& graph,
                                                    const std::vector<NamedHeuristic>& heuristics,
                                                    bool computeOptimality);

    // same comparison over several mazes, spread across settings.threads workers
    std::vector<std::vector<ComparisonRow>> runBatch(const std::vector<const GridGraph*>& graphs) const;

    // doubling ladder over generated mazes (levels/trials/seed from settings)
    const std::vector<DoublingResult>& runDoublingExperiment();
    const std::vector<DoublingResult>& runDoublingExperiment(int levels, int trials, uint32_t seed);
    const std::vector<DoublingResult>& getDoublingResults() const { return doublingResults_; }

    static std::string formatTable(const GridGraph& graph, const std::vector<ComparisonRow>& rows);
    static std::string formatDoublingTable(const std::vector<DoublingResult>& results);
    static bool saveTable(const std::string& path, const std::string& table);

    static std::string estimateBigO(double ratio);

private:
    BenchmarkSettings settings_;
    std::vector<NamedHeuristic> heuristics_;
    std::vector<DoublingResult> doublingResults_;

    struct RunSpec {
        SearchAlgorithm algorithm;
        std::string heuristicName;
        Heuristic heuristic;
    };

    static std::vector<RunSpec> buildRunList(const std::vector<NamedHeuristic>& heuristics);
};

// "yes" / "no" / "-" for the tri-state quality columns
std::string formatFlag(const std::optional<bool>& flag);
