#include <doctest/doctest.h>

#include "GridGraph.h"
#include "TestGrids.h"

TEST_CASE("GridGraph: default start and goal are the bottom left and top right corners")
{
    GridGraph graph(openGrid(5, 5));
    CHECK(graph.start() == GridCell{4, 0});
    CHECK(graph.goal() == GridCell{0, 4});

    GridGraph small(openGrid(3, 3));
    CHECK(small.start() == GridCell{2, 0});
    CHECK(small.goal() == GridCell{0, 2});
    CHECK(small.cellCount() == 9);
}

TEST_CASE("GridGraph: explicit fixed coordinates override the corners")
{
    GridGraph graph(openGrid(4, 4), GridCell{1, 1}, GridCell{3, 2});
    CHECK(graph.start() == GridCell{1, 1});
    CHECK(graph.goal() == GridCell{3, 2});
}

TEST_CASE("GridGraph: neighbors come in N, S, E, W order")
{
    GridGraph graph(openGrid(3, 3));
    std::vector<GridCell> expected = {{0, 1}, {2, 1}, {1, 2}, {1, 0}};
    CHECK(graph.neighbors({1, 1}) == expected);
}

TEST_CASE("GridGraph: neighbors never leave the grid even with open border flags")
{
    GridGraph graph(openGrid(3, 4));
    for (int r = 0; r < graph.rows(); ++r)
    {
        for (int c = 0; c < graph.cols(); ++c)
        {
            for (const GridCell &n : graph.neighbors({r, c}))
            {
                CHECK(graph.inBounds(n));
                CHECK(graph.stepCost({r, c}, n) == 1);
            }
        }
    }

    CHECK(graph.neighbors({0, 0}).size() == 2);
    CHECK_FALSE(graph.canMove({0, 0}, Direction::North));
    CHECK_FALSE(graph.canMove({0, 0}, Direction::West));
}

TEST_CASE("GridGraph: walls are directed per cell")
{
    GridDescription desc = openGrid(1, 2);
    desc.cells[GridCell{0, 0}].walls.east = true;  // A -> B blocked
    GridGraph graph(desc, GridCell{0, 0}, GridCell{0, 1});

    CHECK_FALSE(graph.canMove({0, 0}, Direction::East));
    CHECK(graph.canMove({0, 1}, Direction::West));
    CHECK(graph.neighbors({0, 0}).empty());
    CHECK(graph.neighbors({0, 1}) == std::vector<GridCell>{{0, 0}});

    CHECK_THROWS_AS(graph.stepCost({0, 0}, {0, 1}), InvalidStep);
    CHECK(graph.stepCost({0, 1}, {0, 0}) == 1);
}

TEST_CASE("GridGraph: stepCost rejects pairs that are not adjacent")
{
    GridGraph graph(openGrid(3, 3));
    CHECK_THROWS_AS(graph.stepCost({0, 0}, {2, 2}), InvalidStep);
    CHECK_THROWS_AS(graph.stepCost({0, 0}, {0, 0}), InvalidStep);
    CHECK_THROWS_AS(graph.stepCost({0, 0}, {-1, 0}), InvalidStep);
}

TEST_CASE("GridGraph: passable means at least one open flag")
{
    GridDescription desc = openGrid(2, 2);
    desc.cells[GridCell{1, 0}].walls = CellWalls{true, true, true, true};
    GridGraph graph(desc);

    CHECK_FALSE(graph.passable({1, 0}));
    CHECK(graph.passable({0, 0}));
    CHECK_FALSE(graph.passable({5, 5}));
}

TEST_CASE("GridGraph: malformed descriptions are rejected")
{
    SUBCASE("non positive dimensions")
    {
        CHECK_THROWS_AS(GridGraph{openGrid(0, 3)}, MalformedGraph);
        CHECK_THROWS_AS(GridGraph{openGrid(3, -1)}, MalformedGraph);
    }
    SUBCASE("missing cell")
    {
        GridDescription desc = openGrid(2, 2);
        desc.cells.erase(GridCell{1, 1});
        CHECK_THROWS_AS(GridGraph{desc}, MalformedGraph);
    }
    SUBCASE("cell outside the declared size")
    {
        GridDescription desc = openGrid(2, 2);
        desc.setCell(2, 0, CellWalls{});
        CHECK_THROWS_AS(GridGraph{desc}, MalformedGraph);
    }
    SUBCASE("fixed coordinates outside the grid")
    {
        CHECK_THROWS_AS(GridGraph(openGrid(2, 2), GridCell{0, 0}, GridCell{2, 2}), MalformedGraph);
    }
}

TEST_CASE("GridGraph: documentary markers must match the fixed coordinates")
{
    GridDescription desc = openGrid(3, 3);
    desc.claimedStart = GridCell{2, 0};
    desc.claimedGoal = GridCell{0, 2};
    CHECK_NOTHROW(GridGraph{desc});

    desc.claimedStart = GridCell{0, 0};
    CHECK_THROWS_AS(GridGraph{desc}, StartGoalMismatch);

    desc.claimedStart = GridCell{2, 0};
    desc.claimedGoal = GridCell{1, 1};
    CHECK_THROWS_AS(GridGraph{desc}, StartGoalMismatch);

    // errors share one base so callers can catch them together
    CHECK_THROWS_AS(GridGraph{desc}, MazeError);
}

TEST_CASE("GridGraph: labels and out of range queries")
{
    GridDescription desc = openGrid(2, 2);
    GridGraph unlabelled(desc);
    CHECK_FALSE(unlabelled.hasLabels());
    CHECK(unlabelled.labelAt({0, 0}) == GridGraph::LABEL_PLACEHOLDER);

    desc.cells[GridCell{0, 1}].label = 'B';
    GridGraph labelled(desc);
    CHECK(labelled.hasLabels());
    CHECK(labelled.labelAt({0, 1}) == 'B');
    CHECK(labelled.labelAt({1, 1}) == GridGraph::LABEL_PLACEHOLDER);
    CHECK(labelled.labelAt({9, 9}) == GridGraph::LABEL_PLACEHOLDER);

    CHECK_THROWS_AS(labelled.walls({2, 0}), MalformedGraph);
}

TEST_CASE("Direction helpers")
{
    CHECK(stepToward({1, 1}, Direction::North) == GridCell{0, 1});
    CHECK(stepToward({1, 1}, Direction::South) == GridCell{2, 1});
    CHECK(stepToward({1, 1}, Direction::East) == GridCell{1, 2});
    CHECK(stepToward({1, 1}, Direction::West) == GridCell{1, 0});
    CHECK(std::string(directionName(Direction::East)) == "east");
    CHECK(cellToString({3, 4}) == "(3,4)");
}
