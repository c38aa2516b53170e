#include <doctest/doctest.h>

#include "MazeFile.h"
#include "Pathfinder.h"
#include "TestGrids.h"

namespace
{
    const char *SMALL_MAZE =
        "# 3x3 with labels\n"
        "A:1001 B:1010 C:0010G\n"
        "\n"
        "D:0001 E:0010 F:0100\n"
        "G:0101S H:0100 I:1110\n";
}

TEST_CASE("MazeFile: parses labels, flags and markers")
{
    GridDescription desc = parseMazeDescription(SMALL_MAZE);
    CHECK(desc.rows == 3);
    CHECK(desc.cols == 3);
    REQUIRE(desc.claimedStart);
    REQUIRE(desc.claimedGoal);
    CHECK(*desc.claimedStart == GridCell{2, 0});
    CHECK(*desc.claimedGoal == GridCell{0, 2});

    const CellDescription &b = desc.cells.at(GridCell{0, 1});
    REQUIRE(b.label);
    CHECK(*b.label == 'B');
    CHECK(b.walls.north);
    CHECK_FALSE(b.walls.south);
    CHECK(b.walls.east);
    CHECK_FALSE(b.walls.west);

    GridGraph graph = parseMaze(SMALL_MAZE);
    CHECK(graph.hasLabels());
    CHECK(graph.labelAt({1, 1}) == 'E');
    CHECK(graph.start() == GridCell{2, 0});
}

TEST_CASE("MazeFile: labels and markers are optional")
{
    GridGraph graph = parseMaze("0000 0000\n0000 0000\n");
    CHECK(graph.rows() == 2);
    CHECK(graph.cols() == 2);
    CHECK_FALSE(graph.hasLabels());

    Pathfinder pathfinder(graph);
    CHECK(pathfinder.findPathBFS().path.size() == 3);
}

TEST_CASE("MazeFile: malformed documents")
{
    CHECK_THROWS_AS(parseMaze(""), MazeParseError);
    CHECK_THROWS_AS(parseMaze("# only a comment\n\n"), MazeParseError);
    CHECK_THROWS_AS(parseMaze("0000 0000\n0000\n"), MazeParseError);        // ragged rows
    CHECK_THROWS_AS(parseMaze("0020 0000\n"), MazeParseError);              // bad flag
    CHECK_THROWS_AS(parseMaze("000 0000\n"), MazeParseError);               // too few flags
    CHECK_THROWS_AS(parseMaze("0000X 0000\n"), MazeParseError);             // unknown suffix
    CHECK_THROWS_AS(parseMaze("0000SS 0000\n"), MazeParseError);            // repeated suffix
    CHECK_THROWS_AS(parseMaze("0000S 0000G\n0000S 0000\n"), MazeParseError); // two starts

    // parse errors are malformed graphs too
    CHECK_THROWS_AS(parseMaze("0020\n"), MalformedGraph);
}

TEST_CASE("MazeFile: error messages point at the offending cell")
{
    try
    {
        parseMaze("0000 0000\n0000 01x1\n");
        FAIL("expected a parse error");
    }
    catch (const MazeParseError &e)
    {
        std::string message = e.what();
        CHECK(message.find("row 1") != std::string::npos);
        CHECK(message.find("column 1") != std::string::npos);
    }
}

TEST_CASE("MazeFile: markers away from the fixed corners are rejected")
{
    CHECK_THROWS_AS(parseMaze("0000S 0000\n0000 0000G\n"), StartGoalMismatch);
    CHECK_THROWS_AS(parseMaze("0000 0000\n0000S 0000G\n"), StartGoalMismatch);
}

TEST_CASE("MazeFile: formatMaze is parsed back to the same graph")
{
    GridGraph graph = parseMaze(SMALL_MAZE);
    std::string text = formatMaze(graph);
    GridGraph again = parseMaze(text);

    REQUIRE(again.rows() == graph.rows());
    REQUIRE(again.cols() == graph.cols());
    for (int r = 0; r < graph.rows(); ++r)
    {
        for (int c = 0; c < graph.cols(); ++c)
        {
            CHECK(again.walls({r, c}) == graph.walls({r, c}));
            CHECK(again.labelAt({r, c}) == graph.labelAt({r, c}));
        }
    }
    CHECK(text.find("G:0101S") != std::string::npos);
    CHECK(text.find("C:0010G") != std::string::npos);
}

TEST_CASE("MazeFile: renderPath marks start, goal and path cells")
{
    GridGraph graph(threeByThreeScenario());
    Pathfinder pathfinder(graph);
    PathResult bfs = pathfinder.findPathBFS();

    CHECK(renderPath(graph, bfs.path) == "ooG\no..\nS..");
    CHECK(renderPath(graph, {}) == "..G\n...\nS..");

    CHECK_THROWS_AS(renderPath(graph, {{3, 0}}), InvalidStep);
}

TEST_CASE("MazeFile: labelSequence")
{
    GridGraph graph = parseMaze(SMALL_MAZE);
    std::vector<GridCell> path = {{2, 0}, {1, 0}, {0, 0}};
    CHECK(labelSequence(graph, path) == "G(S) -> D -> A");
    CHECK(labelSequence(graph, {}) == "-");
}

TEST_CASE("MazeFile: loading from disk")
{
    CHECK_THROWS_AS(loadMaze(dataFile("does_not_exist.txt")), MazeParseError);

    GridGraph graph = loadMaze(dataFile("labirinto.txt"));
    CHECK(graph.rows() == 5);
    CHECK(graph.cols() == 5);
    CHECK(graph.start() == GridCell{4, 0});
    CHECK(graph.goal() == GridCell{0, 4});
    CHECK(graph.labelAt({0, 4}) == 'E');

    // O (2,4) -> T (3,4) is the one way door
    CHECK_FALSE(graph.canMove({2, 4}, Direction::South));
    CHECK(graph.canMove({3, 4}, Direction::North));
}
