#include <doctest/doctest.h>

#include "Heuristics.h"

#include <cmath>
#include <cstdlib>

TEST_CASE("Heuristics: distances between cells")
{
    GridCell a{4, 0};
    GridCell b{0, 3};

    CHECK(manhattanDistance(a, b) == doctest::Approx(7.0));
    CHECK(euclideanDistance(a, b) == doctest::Approx(5.0));
    CHECK(zeroHeuristic(a, b) == doctest::Approx(0.0));

    CHECK(manhattanDistance(a, a) == doctest::Approx(0.0));
    CHECK(euclideanDistance(a, b) <= manhattanDistance(a, b));
}

TEST_CASE("Heuristics: manhattan is always a whole number")
{
    for (int r = -3; r <= 3; ++r)
    {
        for (int c = -3; c <= 3; ++c)
        {
            double d = manhattanDistance(GridCell{0, 0}, GridCell{r, c});
            CAPTURE(r);
            CAPTURE(c);
            CHECK(d == std::floor(d));
            CHECK(static_cast<int>(d) == std::abs(r) + std::abs(c));
        }
    }
}

TEST_CASE("Heuristics: lookup by name is case insensitive")
{
    auto m = heuristicByName("Manhattan");
    REQUIRE(m);
    CHECK(m->name == "Manhattan");
    CHECK(m->fn(GridCell{0, 0}, GridCell{2, 2}) == doctest::Approx(4.0));

    auto e = heuristicByName("EUCLIDEAN");
    REQUIRE(e);
    CHECK(e->name == "Euclidean");
    CHECK(e->fn(GridCell{0, 0}, GridCell{3, 4}) == doctest::Approx(5.0));

    CHECK(heuristicByName("m"));
    CHECK(heuristicByName("zero"));
    CHECK(heuristicByName("None")->name == "Zero");
    CHECK_FALSE(heuristicByName("chebyshev"));
    CHECK_FALSE(heuristicByName(""));
}
