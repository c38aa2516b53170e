#pragma once
#include <functional>
#include <optional>
#include <string>
#include "GridGraph.h"

// any callable estimating the remaining cost between two cells can be plugged in
using Heuristic = std::function<double(const GridCell&, const GridCell&)>;

// |dr| + |dc|, always a whole number (returned as double to fit Heuristic).
// admissible and consistent on symmetric 4 connected unit grids only;
// one way walls can make it overestimate, it is still used as is
double manhattanDistance(const GridCell& a, const GridCell& b);

// straight line distance
double euclideanDistance(const GridCell& a, const GridCell& b);

// h = 0 turns A* into uniform cost search
double zeroHeuristic(const GridCell& a, const GridCell& b);

struct NamedHeuristic {
    std::string name;  // display name used in tables ("Manhattan", "Euclidean", "Zero")
    Heuristic fn;
};

// accepts manhattan|manh|m, euclidean|eucl|e, zero|none (case insensitive)
std::optional<NamedHeuristic> heuristicByName(const std::string& name);
