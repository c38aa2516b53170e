#pragma once
#include <string>
#include <vector>
#include "GridGraph.h"

// small grid builders shared by the test files

// every flag open, no labels
inline GridDescription openGrid(int rows, int cols)
{
    GridDescription desc;
    desc.rows = rows;
    desc.cols = cols;
    for (int r = 0; r < rows; ++r)
        for (int c = 0; c < cols; ++c)
            desc.setCell(r, c, CellWalls{});
    return desc;
}

// wall between two neighbors, blocked from both sides
inline void wallBoth(GridDescription &desc, const GridCell &cell, Direction dir)
{
    desc.cells[cell].walls.setBlocked(dir, true);
    GridCell other = stepToward(cell, dir);
    auto it = desc.cells.find(other);
    if (it == desc.cells.end())
        return;
    switch (dir)
    {
    case Direction::North: it->second.walls.south = true; break;
    case Direction::South: it->second.walls.north = true; break;
    case Direction::East: it->second.walls.west = true; break;
    case Direction::West: it->second.walls.east = true; break;
    }
}

// 3x3, open except east blocked at (1,1) and north blocked at (0,1)
inline GridDescription threeByThreeScenario()
{
    GridDescription desc = openGrid(3, 3);
    desc.cells[GridCell{1, 1}].walls.east = true;
    desc.cells[GridCell{0, 1}].walls.north = true;
    return desc;
}

// consecutive cells must be permitted moves, first = start, last = goal
inline bool isValidPath(const GridGraph &graph, const std::vector<GridCell> &path)
{
    if (path.empty())
        return false;
    if (path.front() != graph.start() || path.back() != graph.goal())
        return false;
    for (size_t i = 1; i < path.size(); ++i)
    {
        bool permitted = false;
        for (const GridCell &next : graph.neighbors(path[i - 1]))
            if (next == path[i])
                permitted = true;
        if (!permitted)
            return false;
    }
    return true;
}

inline std::string dataFile(const std::string &name)
{
#ifdef MAZESEARCH_DATA_DIR
    return std::string(MAZESEARCH_DATA_DIR) + "/" + name;
#else
    return "data/" + name;
#endif
}
