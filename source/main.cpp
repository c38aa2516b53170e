#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "BenchmarkManager.h"
#include "BenchmarkSettings.h"
#include "MazeFile.h"

// exit codes
const int EXIT_OK = 0;
const int EXIT_MAZE_ERROR = 1;
const int EXIT_BAD_ARGS = 2;

static void printUsage()
{
    std::cout << "usage: mazesearch [options]\n"
              << "  --maze <file>     maze to solve (default data/labirinto.txt)\n"
              << "  --out <file>      where the comparison table is written (default metrics/metrics.txt)\n"
              << "  --config <file>   key=value settings file\n"
              << "  --doubling        also run the empirical doubling experiment\n"
              << "  --seed <n>        seed for the generated doubling mazes\n"
              << "  --help            show this text" << std::endl;
}

struct CommandLine
{
    std::string configPath;
    std::string mazePath;
    std::string outputPath;
    bool doubling = false;
    bool seedGiven = false;
    uint32_t seed = 0;
    bool help = false;
};

// false on a malformed command line
static bool parseArguments(int argc, char *argv[], CommandLine &cmd)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            cmd.help = true;
            continue;
        }
        if (arg == "--doubling")
        {
            cmd.doubling = true;
            continue;
        }

        if (arg != "--maze" && arg != "--out" && arg != "--config" && arg != "--seed")
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return false;
        }
        if (i + 1 >= argc)
        {
            std::cerr << "Error: missing value for " << arg << std::endl;
            return false;
        }

        std::string value = argv[++i];
        if (arg == "--maze")
            cmd.mazePath = value;
        else if (arg == "--out")
            cmd.outputPath = value;
        else if (arg == "--config")
            cmd.configPath = value;
        else
        {
            try
            {
                size_t used = 0;
                unsigned long parsed = std::stoul(value, &used);
                if (used != value.size())
                    throw std::invalid_argument(value);
                cmd.seed = static_cast<uint32_t>(parsed);
                cmd.seedGiven = true;
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: bad seed: " << value << std::endl;
                return false;
            }
        }
    }
    return true;
}

int main(int argc, char *argv[])
{
    CommandLine cmd;
    if (!parseArguments(argc, argv, cmd))
    {
        printUsage();
        return EXIT_BAD_ARGS;
    }
    if (cmd.help)
    {
        printUsage();
        return EXIT_OK;
    }

    // settings file first, command line flags override it
    BenchmarkSettings settings;
    if (!cmd.configPath.empty() && !settings.loadFromFile(cmd.configPath))
        return EXIT_MAZE_ERROR;
    if (!cmd.mazePath.empty())
        settings.mazePath = cmd.mazePath;
    if (!cmd.outputPath.empty())
        settings.outputPath = cmd.outputPath;
    if (cmd.doubling)
        settings.doublingEnabled = true;
    if (cmd.seedGiven)
        settings.seed = cmd.seed;
    settings.validateAndClamp();

    try
    {
        GridGraph graph = loadMaze(settings.mazePath);
        std::cout << "[MAZE] loaded " << settings.mazePath << " (" << graph.rows() << "x" << graph.cols()
                  << ", start " << cellToString(graph.start()) << ", goal " << cellToString(graph.goal()) << ")" << std::endl;
        std::cout << formatMaze(graph) << std::endl;

        BenchmarkManager benchmark(settings);
        std::vector<ComparisonRow> rows = benchmark.runComparison(graph);

        for (const auto &row : rows)
        {
            std::cout << "[BENCHMARK] " << row.label() << ": "
                      << (row.metrics.found ? labelSequence(graph, row.path) : std::string("no path")) << std::endl;
            if (row.metrics.found)
                std::cout << renderPath(graph, row.path) << std::endl;
        }

        std::string table = BenchmarkManager::formatTable(graph, rows);
        std::cout << "\n" << table << std::endl;

        if (settings.doublingEnabled)
        {
            const auto &results = benchmark.runDoublingExperiment();
            std::string doublingTable = BenchmarkManager::formatDoublingTable(results);
            std::cout << "\n[BENCHMARK] empirical doubling (seed " << settings.seed << ")\n"
                      << doublingTable << std::endl;
            table += "\nEmpirical doubling (seed " + std::to_string(settings.seed) + ")\n" + doublingTable;
        }

        // a failed save is reported but the run itself succeeded
        if (!BenchmarkManager::saveTable(settings.outputPath, table))
            std::cerr << "[BENCHMARK] Warning: results were not saved" << std::endl;
    }
    catch (const MazeError &e)
    {
        std::cerr << "[MAZE] Error: " << e.what() << std::endl;
        return EXIT_MAZE_ERROR;
    }

    return EXIT_OK;
}
