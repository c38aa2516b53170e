#pragma once
#include <string>
#include <vector>
#include "GridGraph.h"

/**
 * maze text format, one grid row per line:
 *
 *   # comment
 *   A:0110 B:1000 C:0001G
 *   D:0100S E:0011 F:1101
 *
 * token = [label:]NSEW[S][G]
 *   NSEW  four 0/1 flags, 1 = wall when leaving this cell in that direction
 *   S / G documentary start / goal markers (optional, at most one each per file)
 */
class MazeParseError : public MalformedGraph {
public:
    using MalformedGraph::MalformedGraph;
};

// tokens -> description, no graph level validation yet
GridDescription parseMazeDescription(const std::string& text);

// description -> graph with the default fixed start/goal corners
GridGraph parseMaze(const std::string& text);
GridGraph loadMaze(const std::string& path);

// inverse of parseMaze: markers at start/goal, labels only if the graph has any
std::string formatMaze(const GridGraph& graph);

// 'S' start, 'G' goal, 'o' path cells, '.' everything else
std::string renderPath(const GridGraph& graph, const std::vector<GridCell>& path);

// "A(S) -> B -> C(G)" style label trail, "-" for an empty path
std::string labelSequence(const GridGraph& graph, const std::vector<GridCell>& path);
