#include "Heuristics.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

double manhattanDistance(const GridCell& a, const GridCell& b) {
    return static_cast<double>(std::abs(a.row - b.row) + std::abs(a.col - b.col));
}

double euclideanDistance(const GridCell& a, const GridCell& b) {
    double dr = static_cast<double>(a.row - b.row);
    double dc = static_cast<double>(a.col - b.col);
    return std::sqrt(dr * dr + dc * dc);
}

double zeroHeuristic(const GridCell&, const GridCell&) {
    return 0.0;
}

std::optional<NamedHeuristic> heuristicByName(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "manhattan" || key == "manh" || key == "m") {
        return NamedHeuristic{"Manhattan", manhattanDistance};
    }
    if (key == "euclidean" || key == "eucl" || key == "e") {
        return NamedHeuristic{"Euclidean", euclideanDistance};
    }
    if (key == "zero" || key == "none") {
        return NamedHeuristic{"Zero", zeroHeuristic};
    }
    return std::nullopt;
}
