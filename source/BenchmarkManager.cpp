#include "BenchmarkManager.h"
#include "MazeFile.h"
#include "MazeGenerator.h"
#include "ParallelProcessor.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string ComparisonRow::label() const
{
    if (!usesHeuristic(algorithm))
        return algorithmName(algorithm);
    return std::string(algorithmName(algorithm)) + " (" + heuristicName + ")";
}

std::string formatFlag(const std::optional<bool> &flag)
{
    if (!flag.has_value())
        return "-";
    return *flag ? "yes" : "no";
}

BenchmarkManager::BenchmarkManager(const BenchmarkSettings &settings)
    : settings_(settings)
{
    settings_.validateAndClamp();

    // resolve the configured names once, table order follows the settings
    for (const auto &name : settings_.heuristics)
    {
        if (auto named = heuristicByName(name))
            heuristics_.push_back(*named);
    }
}

std::vector<BenchmarkManager::RunSpec> BenchmarkManager::buildRunList(const std::vector<NamedHeuristic> &heuristics)
{
    // uninformed first, then the informed searches grouped by algorithm
    std::vector<RunSpec> runs;
    runs.push_back({SearchAlgorithm::BFS, "-", Heuristic{}});
    runs.push_back({SearchAlgorithm::DFS, "-", Heuristic{}});
    for (const auto &h : heuristics)
        runs.push_back({SearchAlgorithm::AStar, h.name, h.fn});
    for (const auto &h : heuristics)
        runs.push_back({SearchAlgorithm::Greedy, h.name, h.fn});
    return runs;
}

std::vector<ComparisonRow> BenchmarkManager::runComparison(const GridGraph &graph) const
{
    return runComparison(graph, heuristics_, settings_.computeOptimality);
}

std::vector<ComparisonRow> BenchmarkManager::runComparison(const GridGraph &graph,
                                                           const std::vector<NamedHeuristic> &heuristics,
                                                           bool computeOptimality)
{
    Pathfinder pathfinder(graph);
    SearchOptions options;
    options.withMetrics = true;
    options.computeOptimality = computeOptimality;

    std::vector<ComparisonRow> rows;
    for (const auto &run : buildRunList(heuristics))
    {
        PathResult result = pathfinder.findPath(run.algorithm, run.heuristic, options);

        ComparisonRow row{run.algorithm, run.heuristicName, result.path, SearchMetrics{}};
        if (result.metrics)
            row.metrics = *result.metrics;
        rows.push_back(row);
    }
    return rows;
}

std::vector<std::vector<ComparisonRow>> BenchmarkManager::runBatch(const std::vector<const GridGraph *> &graphs) const
{
    // one slot per maze so workers never touch the same output
    struct BatchJob
    {
        const GridGraph *graph = nullptr;
        std::vector<ComparisonRow> rows;
    };

    std::vector<BatchJob> jobs;
    jobs.reserve(graphs.size());
    for (const GridGraph *graph : graphs)
        jobs.push_back({graph, {}});

    ParallelProcessor processor(static_cast<size_t>(settings_.threads));
    const auto &heuristics = heuristics_;
    bool computeOptimality = settings_.computeOptimality;
    processor.parallelFor(jobs, [&heuristics, computeOptimality](BatchJob &job)
                          { job.rows = runComparison(*job.graph, heuristics, computeOptimality); });

    auto perf = processor.getMetrics();
    std::cout << "[BENCHMARK] batch of " << jobs.size() << " mazes on " << processor.getThreadCount()
              << " threads took " << std::fixed << std::setprecision(3) << perf.maxExecutionTime << " ms" << std::endl;

    std::vector<std::vector<ComparisonRow>> results;
    results.reserve(jobs.size());
    for (auto &job : jobs)
        results.push_back(std::move(job.rows));
    return results;
}

const std::vector<DoublingResult> &BenchmarkManager::runDoublingExperiment()
{
    return runDoublingExperiment(settings_.doublingLevels, settings_.doublingTrials, settings_.seed);
}

const std::vector<DoublingResult> &BenchmarkManager::runDoublingExperiment(int levels, int trials, uint32_t seed)
{
    // every algorithm walks the same ladder of mazes, each roughly doubling the cell count
    doublingResults_.clear();
    levels = std::clamp(levels, 1, MazeGenerator::MAX_LEVEL);
    trials = std::max(1, trials);

    MazeGenerator::Options genOptions;
    genOptions.extraPassages = settings_.extraPassages;

    // build the ladder once so all algorithms see identical mazes
    std::vector<GridGraph> ladder;
    ladder.reserve(levels);
    for (int level = 1; level <= levels; ++level)
    {
        auto [rows, cols] = MazeGenerator::dimensionsForLevel(level);
        ladder.emplace_back(MazeGenerator::generate(rows, cols, seed + static_cast<uint32_t>(level), genOptions));
    }

    std::cout << "[BENCHMARK] doubling experiment: " << levels << " levels x " << trials << " trials" << std::endl;

    SearchOptions options;
    options.withMetrics = true;

    for (const auto &run : buildRunList(heuristics_))
    {
        double prevTime = 0.0;
        int prevSize = 0;
        for (int level = 1; level <= levels; ++level)
        {
            const GridGraph &graph = ladder[level - 1];
            Pathfinder pathfinder(graph);

            double totalMs = 0.0;
            for (int t = 0; t < trials; ++t)
            {
                PathResult res = pathfinder.findPath(run.algorithm, run.heuristic, options);
                if (res.metrics)
                    totalMs += res.metrics->timeMs;
            }
            double avgMs = totalMs / trials;
            int problemSize = graph.cellCount();

            // ladder steps alternate around 2x (2.25, 1.78, ...), rescale to an exact doubling
            double ratio = 0.0;
            if (level > 1 && prevTime > 0.0 && avgMs > 0.0)
            {
                double exponent = std::log(avgMs / prevTime) / std::log(static_cast<double>(problemSize) / prevSize);
                ratio = std::pow(2.0, exponent);
            }
            std::string est = (level == 1 || ratio <= 0.0) ? "--" : estimateBigO(ratio);

            ComparisonRow labelRow{run.algorithm, run.heuristicName, {}, SearchMetrics{}};
            doublingResults_.push_back({run.algorithm, run.heuristicName, labelRow.label(), level, problemSize, avgMs, ratio, est});

            prevTime = avgMs;
            prevSize = problemSize;
        }
    }

    return doublingResults_;
}

std::string BenchmarkManager::estimateBigO(double ratio)
{
    // doubling N: O(1)->1, O(log N)->~1.1-1.3, O(N)->2, O(N log N)->~2.2-2.4, O(N^2)->4, O(N^3)->8
    if (ratio < 1.2)
        return "O(1)";
    if (ratio < 1.5)
        return "O(log N)";
    if (ratio < 2.15)
        return "O(N)";
    if (ratio < 3.0)
        return "O(N log N)";
    if (ratio < 5.7)
        return "O(N^2)";
    return "O(N^3)";
}

namespace
{
    // pads every column to its widest cell, '|' separated
    std::string alignColumns(const std::vector<std::vector<std::string>> &table)
    {
        if (table.empty())
            return "";

        std::vector<size_t> widths(table[0].size(), 0);
        for (const auto &row : table)
        {
            for (size_t c = 0; c < row.size() && c < widths.size(); ++c)
                widths[c] = std::max(widths[c], row[c].size());
        }

        std::ostringstream out;
        for (size_t r = 0; r < table.size(); ++r)
        {
            const auto &row = table[r];
            for (size_t c = 0; c < row.size(); ++c)
            {
                if (c > 0)
                    out << " | ";
                // last column is left ragged
                if (c + 1 == row.size())
                    out << row[c];
                else
                    out << std::setw(static_cast<int>(widths[c])) << std::left << row[c];
            }
            out << "\n";

            if (r == 0)
            {
                size_t total = 0;
                for (size_t c = 0; c < widths.size(); ++c)
                    total += widths[c] + (c > 0 ? 3 : 0);
                out << std::string(total, '-') << "\n";
            }
        }
        return out.str();
    }

    std::string fixed3(double value)
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(3) << value;
        return ss.str();
    }
}

std::string BenchmarkManager::formatTable(const GridGraph &graph, const std::vector<ComparisonRow> &rows)
{
    std::vector<std::vector<std::string>> table;
    table.push_back({"Algorithm", "Heuristic", "Time(ms)", "Expanded", "Generated", "Explored", "Frontier",
                     "Peak Memory", "Complete", "Optimal", "Cost", "Length", "Path"});

    for (const auto &row : rows)
    {
        const SearchMetrics &m = row.metrics;
        table.push_back({algorithmName(row.algorithm),
                         row.heuristicName,
                         fixed3(m.timeMs),
                         std::to_string(m.expanded),
                         std::to_string(m.generated),
                         std::to_string(m.peakExplored),
                         std::to_string(m.peakFrontier),
                         std::to_string(m.peakStructures),
                         formatFlag(m.complete),
                         formatFlag(m.optimal),
                         m.found ? std::to_string(m.pathCost) : "-",
                         m.found ? std::to_string(m.pathLength) : "-",
                         labelSequence(graph, row.path)});
    }

    return alignColumns(table);
}

std::string BenchmarkManager::formatDoublingTable(const std::vector<DoublingResult> &results)
{
    std::vector<std::vector<std::string>> table;
    table.push_back({"Algorithm", "Heuristic", "Level", "N", "Time(ms)", "Ratio", "Big-O"});

    for (const auto &dr : results)
    {
        std::ostringstream ratio;
        if (dr.ratio > 0.0)
            ratio << std::fixed << std::setprecision(2) << dr.ratio;
        else
            ratio << "--";

        table.push_back({algorithmName(dr.algorithm),
                         dr.heuristicName,
                         std::to_string(dr.level),
                         std::to_string(dr.problemSize),
                         fixed3(dr.timeMs),
                         ratio.str(),
                         dr.estimatedBigO});
    }

    return alignColumns(table);
}

bool BenchmarkManager::saveTable(const std::string &path, const std::string &table)
{
    std::filesystem::path target(path);
    if (target.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
        {
            std::cerr << "[BENCHMARK] Error: could not create directory " << target.parent_path().string()
                      << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open())
    {
        std::cerr << "[BENCHMARK] Error: could not open file for writing: " << path << std::endl;
        return false;
    }

    file << table;
    if (!file)
    {
        std::cerr << "[BENCHMARK] Error: write failed: " << path << std::endl;
        return false;
    }

    std::cout << "[BENCHMARK] table saved to " << path << std::endl;
    return true;
}
