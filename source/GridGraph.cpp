#include "GridGraph.h"
#include <sstream>

const char* directionName(Direction dir) {
    switch (dir) {
        case Direction::North: return "north";
        case Direction::South: return "south";
        case Direction::East:  return "east";
        case Direction::West:  return "west";
        default:               return "unknown";
    }
}

GridCell stepToward(const GridCell& cell, Direction dir) {
    // row grows downward (south), column grows to the right (east)
    switch (dir) {
        case Direction::North: return {cell.row - 1, cell.col};
        case Direction::South: return {cell.row + 1, cell.col};
        case Direction::East:  return {cell.row, cell.col + 1};
        case Direction::West:  return {cell.row, cell.col - 1};
    }
    return cell;
}

std::string cellToString(const GridCell& cell) {
    std::ostringstream ss;
    ss << "(" << cell.row << "," << cell.col << ")";
    return ss.str();
}

bool CellWalls::isBlocked(Direction dir) const {
    switch (dir) {
        case Direction::North: return north;
        case Direction::South: return south;
        case Direction::East:  return east;
        case Direction::West:  return west;
    }
    return true;
}

void CellWalls::setBlocked(Direction dir, bool blocked) {
    switch (dir) {
        case Direction::North: north = blocked; break;
        case Direction::South: south = blocked; break;
        case Direction::East:  east = blocked; break;
        case Direction::West:  west = blocked; break;
    }
}

GridGraph::GridGraph(const GridDescription& description) {
    build(description,
          defaultStart(description.rows, description.cols),
          defaultGoal(description.rows, description.cols));
}

GridGraph::GridGraph(const GridDescription& description, const GridCell& fixedStart, const GridCell& fixedGoal) {
    build(description, fixedStart, fixedGoal);
}

void GridGraph::build(const GridDescription& description, const GridCell& fixedStart, const GridCell& fixedGoal) {
    if (description.rows <= 0 || description.cols <= 0) {
        throw MalformedGraph("grid dimensions must be positive, got " +
                             std::to_string(description.rows) + "x" + std::to_string(description.cols));
    }

    rows_ = description.rows;
    cols_ = description.cols;

    // anything outside the rectangle means the producer and the declared size disagree
    for (const auto& [cell, desc] : description.cells) {
        if (!inBounds(cell)) {
            throw MalformedGraph("cell " + cellToString(cell) + " lies outside the " +
                                 std::to_string(rows_) + "x" + std::to_string(cols_) + " grid");
        }
    }

    walls_.assign(static_cast<size_t>(rows_) * cols_, CellWalls{});
    labels_.assign(static_cast<size_t>(rows_) * cols_, LABEL_PLACEHOLDER);

    // every position must be defined, no holes allowed
    for (int r = 0; r < rows_; r++) {
        for (int c = 0; c < cols_; c++) {
            GridCell cell{r, c};
            auto it = description.cells.find(cell);
            if (it == description.cells.end()) {
                throw MalformedGraph("missing cell " + cellToString(cell) + " (incomplete rectangle)");
            }
            walls_[getIndex(cell)] = it->second.walls;
            if (it->second.label) {
                labels_[getIndex(cell)] = *it->second.label;
                hasLabels_ = true;
            }
        }
    }

    if (!inBounds(fixedStart) || !inBounds(fixedGoal)) {
        throw MalformedGraph("start " + cellToString(fixedStart) + " or goal " +
                             cellToString(fixedGoal) + " is outside the grid");
    }

    // documentary markers are optional, but when present they must agree
    if (description.claimedStart && *description.claimedStart != fixedStart) {
        throw StartGoalMismatch("start marker at " + cellToString(*description.claimedStart) +
                                " but the maze start is fixed at " + cellToString(fixedStart));
    }
    if (description.claimedGoal && *description.claimedGoal != fixedGoal) {
        throw StartGoalMismatch("goal marker at " + cellToString(*description.claimedGoal) +
                                " but the maze goal is fixed at " + cellToString(fixedGoal));
    }

    start_ = fixedStart;
    goal_ = fixedGoal;
}

bool GridGraph::inBounds(const GridCell& cell) const {
    return cell.row >= 0 && cell.row < rows_ && cell.col >= 0 && cell.col < cols_;
}

bool GridGraph::canMove(const GridCell& from, Direction dir) const {
    if (!inBounds(from)) return false;
    if (walls_[getIndex(from)].isBlocked(dir)) return false;
    return inBounds(stepToward(from, dir));
}

bool GridGraph::passable(const GridCell& cell) const {
    return inBounds(cell) && !walls_[getIndex(cell)].allBlocked();
}

const CellWalls& GridGraph::walls(const GridCell& cell) const {
    if (!inBounds(cell)) {
        throw MalformedGraph("walls requested for " + cellToString(cell) + " outside the grid");
    }
    return walls_[getIndex(cell)];
}

std::vector<GridCell> GridGraph::neighbors(const GridCell& cell) const {
    std::vector<GridCell> result;
    result.reserve(4);

    // only the source cell's flags matter, the target's reverse flag is never consulted
    for (Direction dir : ALL_DIRECTIONS) {
        if (canMove(cell, dir)) {
            result.push_back(stepToward(cell, dir));
        }
    }
    return result;
}

int GridGraph::stepCost(const GridCell& from, const GridCell& to) const {
    for (Direction dir : ALL_DIRECTIONS) {
        if (stepToward(from, dir) == to && canMove(from, dir)) {
            return 1;
        }
    }
    throw InvalidStep("no permitted move from " + cellToString(from) + " to " + cellToString(to));
}

char GridGraph::labelAt(const GridCell& cell) const {
    if (!inBounds(cell)) return LABEL_PLACEHOLDER;
    return labels_[getIndex(cell)];
}
