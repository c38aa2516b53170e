#pragma once
#include <array>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// grid cell coordinates (zero based row/column)
struct GridCell {
    int row = 0;
    int col = 0;

    bool operator==(const GridCell& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const GridCell& other) const {
        return !(*this == other);
    }

    // row major ordering so cells can live in std::set / std::map
    bool operator<(const GridCell& other) const {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }
};

// hash function for GridCell (for use in unordered_map/set)
struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        return std::hash<int>()(cell.row) ^ (std::hash<int>()(cell.col) << 16);
    }
};

// fixed neighbor order: N, S, E, W. this order drives every tie break downstream
enum class Direction {
    North = 0,
    South = 1,
    East = 2,
    West = 3
};

static constexpr std::array<Direction, 4> ALL_DIRECTIONS = {
    Direction::North, Direction::South, Direction::East, Direction::West};

const char* directionName(Direction dir);
GridCell stepToward(const GridCell& cell, Direction dir);

// per cell wall flags. true = blocked when leaving THIS cell in that direction.
// the neighbor's flags are independent (walls are not shared between cells)
struct CellWalls {
    bool north = false;
    bool south = false;
    bool east = false;
    bool west = false;

    bool isBlocked(Direction dir) const;
    void setBlocked(Direction dir, bool blocked);
    bool allBlocked() const { return north && south && east && west; }

    bool operator==(const CellWalls& other) const {
        return north == other.north && south == other.south &&
               east == other.east && west == other.west;
    }
};

struct CellDescription {
    CellWalls walls;
    std::optional<char> label;
};

// everything a producer (parser, generator, test) hands over to build a graph
struct GridDescription {
    int rows = 0;
    int cols = 0;
    std::unordered_map<GridCell, CellDescription, GridCellHash> cells;

    // documentary markers found in the source encoding, if any
    std::optional<GridCell> claimedStart;
    std::optional<GridCell> claimedGoal;

    void setCell(int row, int col, const CellWalls& walls, std::optional<char> label = std::nullopt) {
        cells[GridCell{row, col}] = CellDescription{walls, label};
    }
};

// error hierarchy for maze construction and queries
class MazeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// incomplete rectangle, bad encoding, cell outside the grid
class MalformedGraph : public MazeError {
public:
    using MazeError::MazeError;
};

// documentary S/G markers disagree with the fixed start/goal coordinates
class StartGoalMismatch : public MazeError {
public:
    using MazeError::MazeError;
};

// step cost asked for a pair that is not a permitted move (internal bug)
class InvalidStep : public MazeError {
public:
    using MazeError::MazeError;
};

/**
 * directed grid maze. each cell carries its own four wall flags so a move
 * A->B can be open while B->A is walled off. immutable once constructed
 */
class GridGraph {
public:
    static constexpr char LABEL_PLACEHOLDER = '?';

    // start/goal default to the bottom left and top right corners
    GridGraph(const GridDescription& description);
    GridGraph(const GridDescription& description, const GridCell& fixedStart, const GridCell& fixedGoal);

    static GridCell defaultStart(int rows, int cols) { return {rows - 1, 0}; }
    static GridCell defaultGoal(int rows, int cols) { return {0, cols - 1}; }

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int cellCount() const { return rows_ * cols_; }
    const GridCell& start() const { return start_; }
    const GridCell& goal() const { return goal_; }

    bool inBounds(const GridCell& cell) const;
    bool canMove(const GridCell& from, Direction dir) const;
    bool passable(const GridCell& cell) const;  // at least one open direction
    const CellWalls& walls(const GridCell& cell) const;

    // permitted moves out of cell in N, S, E, W order
    std::vector<GridCell> neighbors(const GridCell& cell) const;

    // uniform cost model: 1 per permitted move, InvalidStep otherwise
    int stepCost(const GridCell& from, const GridCell& to) const;

    char labelAt(const GridCell& cell) const;
    bool hasLabels() const { return hasLabels_; }

private:
    int rows_ = 0;
    int cols_ = 0;
    GridCell start_;
    GridCell goal_;
    bool hasLabels_ = false;

    std::vector<CellWalls> walls_;  // row major
    std::vector<char> labels_;      // row major, placeholder when absent

    int getIndex(const GridCell& cell) const { return cell.row * cols_ + cell.col; }

    void build(const GridDescription& description, const GridCell& fixedStart, const GridCell& fixedGoal);
};

std::string cellToString(const GridCell& cell);
