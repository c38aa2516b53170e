#pragma once
#include <cstdint>
#include <utility>
#include "GridGraph.h"

/**
 * seeded maze generator (recursive backtracking) producing GridDescriptions
 * that fit the fixed start/goal corners. randomness comes only from the seed
 * passed in, never from global state, so the same seed + options always give
 * the same maze
 */
class MazeGenerator {
public:
    struct Options {
        int extraPassages = 0;      // walls knocked out after carving (adds cycles / suboptimal routes)
        int oneWayPassages = 0;     // carved passages turned one directional afterwards
        bool labelled = true;       // A..Z then a..z cyclic labels
    };

    static GridDescription generate(int rows, int cols, uint32_t seed, const Options& options);
    static GridDescription generate(int rows, int cols, uint32_t seed);

    // doubling ladder: each level roughly doubles the cell count (48 -> 108 -> 192 -> 432 -> 768 -> 1728)
    static constexpr int MAX_LEVEL = 6;
    static std::pair<int, int> dimensionsForLevel(int level);  // {rows, cols}

    static char labelForIndex(int index);
};
