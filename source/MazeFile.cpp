#include "MazeFile.h"
#include <fstream>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string where(int row, int col) {
    return " at row " + std::to_string(row) + ", column " + std::to_string(col);
}

// one token -> walls/label/markers. throws MazeParseError with grid position
CellDescription parseToken(const std::string& token, int row, int col, bool& isStart, bool& isGoal) {
    CellDescription desc;
    std::string body = token;

    if (body.size() >= 2 && body[1] == ':') {
        desc.label = body[0];
        body = body.substr(2);
    }

    if (body.size() < 4) {
        throw MazeParseError("token '" + token + "' needs four N,S,E,W flags" + where(row, col));
    }

    const std::string bits = body.substr(0, 4);
    for (char ch : bits) {
        if (ch != '0' && ch != '1') {
            throw MazeParseError("token '" + token + "' has a flag other than 0/1" + where(row, col));
        }
    }
    desc.walls.north = bits[0] == '1';
    desc.walls.south = bits[1] == '1';
    desc.walls.east = bits[2] == '1';
    desc.walls.west = bits[3] == '1';

    const std::string suffix = body.substr(4);
    isStart = false;
    isGoal = false;
    for (char ch : suffix) {
        if (ch == 'S') {
            if (isStart) throw MazeParseError("token '" + token + "' repeats the S marker" + where(row, col));
            isStart = true;
        } else if (ch == 'G') {
            if (isGoal) throw MazeParseError("token '" + token + "' repeats the G marker" + where(row, col));
            isGoal = true;
        } else {
            throw MazeParseError("token '" + token + "' has unknown suffix '" + suffix + "'" + where(row, col));
        }
    }
    return desc;
}

}  // namespace

GridDescription parseMazeDescription(const std::string& text) {
    std::vector<std::vector<std::string>> tokenRows;

    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') continue;

        std::istringstream tokens(content);
        std::vector<std::string> row;
        std::string token;
        while (tokens >> token) {
            row.push_back(token);
        }
        tokenRows.push_back(row);
    }

    if (tokenRows.empty()) {
        throw MazeParseError("maze text is empty or only blank lines/comments");
    }

    GridDescription desc;
    desc.rows = static_cast<int>(tokenRows.size());
    desc.cols = static_cast<int>(tokenRows[0].size());

    for (int r = 0; r < desc.rows; r++) {
        if (static_cast<int>(tokenRows[r].size()) != desc.cols) {
            throw MazeParseError("row " + std::to_string(r) + " has " + std::to_string(tokenRows[r].size()) +
                                 " tokens, expected " + std::to_string(desc.cols) + " (grid is not rectangular)");
        }

        for (int c = 0; c < desc.cols; c++) {
            bool isStart = false;
            bool isGoal = false;
            CellDescription cell = parseToken(tokenRows[r][c], r, c, isStart, isGoal);

            if (isStart) {
                if (desc.claimedStart) throw MazeParseError("more than one S marker" + where(r, c));
                desc.claimedStart = GridCell{r, c};
            }
            if (isGoal) {
                if (desc.claimedGoal) throw MazeParseError("more than one G marker" + where(r, c));
                desc.claimedGoal = GridCell{r, c};
            }
            desc.cells[GridCell{r, c}] = cell;
        }
    }

    return desc;
}

GridGraph parseMaze(const std::string& text) {
    return GridGraph(parseMazeDescription(text));
}

GridGraph loadMaze(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw MazeParseError("could not open maze file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseMaze(buffer.str());
}

std::string formatMaze(const GridGraph& graph) {
    std::ostringstream out;
    for (int r = 0; r < graph.rows(); r++) {
        for (int c = 0; c < graph.cols(); c++) {
            GridCell cell{r, c};
            const CellWalls& w = graph.walls(cell);

            if (c > 0) out << ' ';
            if (graph.hasLabels()) out << graph.labelAt(cell) << ':';
            out << (w.north ? '1' : '0') << (w.south ? '1' : '0')
                << (w.east ? '1' : '0') << (w.west ? '1' : '0');
            if (cell == graph.start()) out << 'S';
            if (cell == graph.goal()) out << 'G';
        }
        out << '\n';
    }
    return out.str();
}

std::string renderPath(const GridGraph& graph, const std::vector<GridCell>& path) {
    std::vector<std::string> canvas(graph.rows(), std::string(graph.cols(), '.'));

    for (const GridCell& cell : path) {
        if (!graph.inBounds(cell)) {
            throw InvalidStep("path position " + cellToString(cell) + " is outside the grid");
        }
        canvas[cell.row][cell.col] = 'o';
    }
    canvas[graph.start().row][graph.start().col] = 'S';
    canvas[graph.goal().row][graph.goal().col] = 'G';

    std::string out;
    for (int r = 0; r < graph.rows(); r++) {
        if (r > 0) out += '\n';
        out += canvas[r];
    }
    return out;
}

std::string labelSequence(const GridGraph& graph, const std::vector<GridCell>& path) {
    if (path.empty()) return "-";

    std::string out;
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) out += " -> ";
        out += graph.labelAt(path[i]);
        if (path[i] == graph.start()) out += "(S)";
        else if (path[i] == graph.goal()) out += "(G)";
    }
    return out;
}
