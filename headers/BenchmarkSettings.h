#pragma once
#include <cstdint>
#include <string>
#include <vector>

class BenchmarkSettings
{
public:
    // inputs / outputs
    std::string mazePath = "data/labirinto.txt";
    std::string outputPath = "metrics/metrics.txt";

    // heuristics handed to A* and greedy, in table order
    std::vector<std::string> heuristics = {"manhattan", "euclidean"};

    // run the BFS oracle for every row (completeness / optimality columns)
    bool computeOptimality = true;

    // empirical doubling experiment over generated mazes
    bool doublingEnabled = false;
    int doublingLevels = 6;      // 1..6, each level ~2x the cells
    int doublingTrials = 3;      // runs averaged per level
    int extraPassages = 4;       // loops added to each generated maze
    uint32_t seed = 42;          // generator seed, no global random state

    // worker threads for batch comparisons (1 = sequential, keeps timings clean)
    int threads = 1;

    // viewer
    int windowWidth = 1200;
    int windowHeight = 900;
    int cellPixels = 96;
    std::string fontPath = "DejaVuSans.ttf";

    bool saveToFile(const std::string &filename) const;
    bool loadFromFile(const std::string &filename);

    void validateAndClamp();

    static std::vector<std::string> splitList(const std::string &value);
    static std::string joinList(const std::vector<std::string> &values);
};
