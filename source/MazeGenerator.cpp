#include "MazeGenerator.h"
#include <algorithm>
#include <iostream>
#include <random>
#include <set>
#include <vector>

GridDescription MazeGenerator::generate(int rows, int cols, uint32_t seed) {
    return generate(rows, cols, seed, Options{});
}

std::pair<int, int> MazeGenerator::dimensionsForLevel(int level) {
    level = std::clamp(level, 1, MAX_LEVEL);

    // ratios alternate 2.25x / 1.78x which averages out to ~2x per level
    switch (level) {
        case 1: return {6, 8};     // 48 cells
        case 2: return {9, 12};    // 108 cells
        case 3: return {12, 16};   // 192 cells
        case 4: return {18, 24};   // 432 cells
        case 5: return {24, 32};   // 768 cells
        case 6: return {36, 48};   // 1728 cells
        default: return {6, 8};
    }
}

char MazeGenerator::labelForIndex(int index) {
    static const char LABELS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    const int count = static_cast<int>(sizeof(LABELS) - 1);
    return LABELS[index % count];
}

GridDescription MazeGenerator::generate(int rows, int cols, uint32_t seed, const Options& options) {
    GridDescription desc;
    desc.rows = rows;
    desc.cols = cols;
    if (rows <= 0 || cols <= 0) {
        // GridGraph reports the bad dimensions when it is built from this
        return desc;
    }

    std::mt19937 gen(seed);

    // every cell starts fully walled, carving opens both sides of a passage
    std::vector<CellWalls> walls(static_cast<size_t>(rows) * cols, CellWalls{true, true, true, true});
    auto index = [cols](const GridCell& cell) { return static_cast<size_t>(cell.row) * cols + cell.col; };

    // canonical edge: smaller cell first so (a,b) and (b,a) collide in the set
    using Edge = std::pair<GridCell, GridCell>;
    auto normEdge = [](const GridCell& a, const GridCell& b) -> Edge {
        Edge e{a, b};
        if (e.second < e.first) std::swap(e.first, e.second);
        return e;
    };

    auto directionBetween = [](const GridCell& from, const GridCell& to) {
        for (Direction dir : ALL_DIRECTIONS) {
            if (stepToward(from, dir) == to) return dir;
        }
        return Direction::North;
    };

    auto openBothWays = [&](const GridCell& a, const GridCell& b) {
        walls[index(a)].setBlocked(directionBetween(a, b), false);
        walls[index(b)].setBlocked(directionBetween(b, a), false);
    };

    auto inside = [rows, cols](const GridCell& cell) {
        return cell.row >= 0 && cell.row < rows && cell.col >= 0 && cell.col < cols;
    };

    std::set<Edge> passages;
    std::vector<bool> visited(static_cast<size_t>(rows) * cols, false);

    // depth first carve that visits each cell exactly once (classic recursive backtracker)
    const GridCell start = GridGraph::defaultStart(rows, cols);
    std::vector<GridCell> stack;
    visited[index(start)] = true;
    stack.push_back(start);

    while (!stack.empty()) {
        GridCell current = stack.back();

        std::vector<GridCell> candidates;
        for (Direction dir : ALL_DIRECTIONS) {
            GridCell next = stepToward(current, dir);
            if (inside(next) && !visited[index(next)]) {
                candidates.push_back(next);
            }
        }

        if (!candidates.empty()) {
            std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
            GridCell next = candidates[dist(gen)];
            visited[index(next)] = true;
            stack.push_back(next);
            openBothWays(current, next);
            passages.insert(normEdge(current, next));
        } else {
            // dead end: backtrack to previous cell
            stack.pop_back();
        }
    }

    // knock out intact walls to create loops (suboptimal alternatives)
    if (options.extraPassages > 0) {
        std::vector<Edge> intact;
        for (int r = 0; r < rows; r++) {
            for (int c = 0; c < cols; c++) {
                GridCell cell{r, c};
                GridCell east{r, c + 1};
                GridCell south{r + 1, c};
                if (inside(east) && !passages.count(normEdge(cell, east))) intact.push_back(normEdge(cell, east));
                if (inside(south) && !passages.count(normEdge(cell, south))) intact.push_back(normEdge(cell, south));
            }
        }
        std::shuffle(intact.begin(), intact.end(), gen);

        int added = 0;
        for (const Edge& wall : intact) {
            if (added >= options.extraPassages) break;
            openBothWays(wall.first, wall.second);
            passages.insert(wall);
            added++;
        }
        std::cout << "[MAZE] knocked out " << added << " of " << intact.size() << " intact walls" << std::endl;
    }

    // turn some passages into one way doors by re-walling one side
    if (options.oneWayPassages > 0) {
        std::vector<Edge> open(passages.begin(), passages.end());
        std::shuffle(open.begin(), open.end(), gen);
        std::bernoulli_distribution coin(0.5);

        int made = 0;
        for (const Edge& passage : open) {
            if (made >= options.oneWayPassages) break;
            const GridCell& from = coin(gen) ? passage.first : passage.second;
            const GridCell& to = (from == passage.first) ? passage.second : passage.first;
            walls[index(from)].setBlocked(directionBetween(from, to), true);
            made++;
        }
        std::cout << "[MAZE] made " << made << " one way passages" << std::endl;
    }

    for (int r = 0; r < rows; r++) {
        for (int c = 0; c < cols; c++) {
            GridCell cell{r, c};
            std::optional<char> label;
            if (options.labelled) label = labelForIndex(r * cols + c);
            desc.cells[cell] = CellDescription{walls[index(cell)], label};
        }
    }

    // documentary markers agree with the fixed corners by construction
    desc.claimedStart = GridGraph::defaultStart(rows, cols);
    desc.claimedGoal = GridGraph::defaultGoal(rows, cols);
    return desc;
}
