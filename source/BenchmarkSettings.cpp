#include "BenchmarkSettings.h"
#include "Heuristics.h"
#include "MazeGenerator.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

static std::string trimmed(const std::string &s)
{
    size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return "";
    size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> BenchmarkSettings::splitList(const std::string &value)
{
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item = trimmed(item);
        if (!item.empty())
            items.push_back(item);
    }
    return items;
}

std::string BenchmarkSettings::joinList(const std::vector<std::string> &values)
{
    std::string out;
    for (size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
            out += ",";
        out += values[i];
    }
    return out;
}

bool BenchmarkSettings::saveToFile(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    file << "# Maze Search Benchmark Settings\n";
    file << "mazePath=" << mazePath << "\n";
    file << "outputPath=" << outputPath << "\n";
    file << "heuristics=" << joinList(heuristics) << "\n";
    file << "computeOptimality=" << (computeOptimality ? 1 : 0) << "\n";
    file << "doublingEnabled=" << (doublingEnabled ? 1 : 0) << "\n";
    file << "doublingLevels=" << doublingLevels << "\n";
    file << "doublingTrials=" << doublingTrials << "\n";
    file << "extraPassages=" << extraPassages << "\n";
    file << "seed=" << seed << "\n";
    file << "threads=" << threads << "\n";
    file << "windowWidth=" << windowWidth << "\n";
    file << "windowHeight=" << windowHeight << "\n";
    file << "cellPixels=" << cellPixels << "\n";
    file << "fontPath=" << fontPath << "\n";

    return true;
}

bool BenchmarkSettings::loadFromFile(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error: Could not open file for reading: " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line))
    {
        lineNumber++;
        line = trimmed(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = trimmed(line.substr(0, equalPos));
        std::string value = trimmed(line.substr(equalPos + 1));

        try
        {
            if (key == "mazePath")
                mazePath = value;
            else if (key == "outputPath")
                outputPath = value;
            else if (key == "heuristics")
                heuristics = splitList(value);
            else if (key == "computeOptimality")
                computeOptimality = (std::stoi(value) != 0);
            else if (key == "doublingEnabled")
                doublingEnabled = (std::stoi(value) != 0);
            else if (key == "doublingLevels")
                doublingLevels = std::stoi(value);
            else if (key == "doublingTrials")
                doublingTrials = std::stoi(value);
            else if (key == "extraPassages")
                extraPassages = std::stoi(value);
            else if (key == "seed")
                seed = static_cast<uint32_t>(std::stoul(value));
            else if (key == "threads")
                threads = std::stoi(value);
            else if (key == "windowWidth")
                windowWidth = std::stoi(value);
            else if (key == "windowHeight")
                windowHeight = std::stoi(value);
            else if (key == "cellPixels")
                cellPixels = std::stoi(value);
            else if (key == "fontPath")
                fontPath = value;
            // unknown keys are ignored so older files keep loading
        }
        catch (const std::exception &)
        {
            std::cerr << "Error: bad value for '" << key << "' on line " << lineNumber
                      << " of " << filename << ": " << value << std::endl;
            return false;
        }
    }

    validateAndClamp();
    return true;
}

void BenchmarkSettings::validateAndClamp()
{
    doublingLevels = std::clamp(doublingLevels, 1, MazeGenerator::MAX_LEVEL);
    doublingTrials = std::clamp(doublingTrials, 1, 100);
    extraPassages = std::max(0, extraPassages);
    threads = std::clamp(threads, 1, 64);
    windowWidth = std::clamp(windowWidth, 320, 3840);
    windowHeight = std::clamp(windowHeight, 240, 2160);
    cellPixels = std::clamp(cellPixels, 8, 256);

    // drop names nobody understands, keep at least one heuristic
    std::vector<std::string> known;
    for (const auto &name : heuristics)
    {
        if (heuristicByName(name))
            known.push_back(name);
        else
            std::cerr << "Warning: unknown heuristic '" << name << "' ignored" << std::endl;
    }
    if (known.empty())
        known.push_back("manhattan");
    heuristics = known;
}
